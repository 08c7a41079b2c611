#include "RequestJson.hpp"
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <cmath>
#include <limits>

using namespace openfleet;

static bool readInteger(const QJsonValue &v, const char *field, qint64 &out,
                        QString &err) {
    if (!v.isDouble()) {
        err = QStringLiteral("%1 must be a number").arg(QLatin1String(field));
        return false;
    }
    const double d = v.toDouble();
    if (std::floor(d) != d || std::fabs(d) > 9007199254740992.0) {
        err = QStringLiteral("%1 must be an integer").arg(QLatin1String(field));
        return false;
    }
    out = static_cast<qint64>(d);
    return true;
}

static bool readOptionalInt(const QJsonObject &obj, const char *field,
                            int &out, QString &err) {
    const QJsonValue v = obj.value(QLatin1String(field));
    if (v.isUndefined() || v.isNull())
        return true;
    qint64 n = 0;
    if (!readInteger(v, field, n, err))
        return false;
    if (n < std::numeric_limits<int>::min() ||
        n > std::numeric_limits<int>::max()) {
        err = QStringLiteral("%1 is out of range").arg(QLatin1String(field));
        return false;
    }
    out = static_cast<int>(n);
    return true;
}

static bool readRequiredString(const QJsonObject &obj, const char *field,
                               std::string &out, QString &err) {
    const QJsonValue v = obj.value(QLatin1String(field));
    if (!v.isString()) {
        err = QStringLiteral("%1 must be a string").arg(QLatin1String(field));
        return false;
    }
    out = v.toString().toStdString();
    return true;
}

static bool readIdList(const QJsonObject &obj, const char *field,
                       bool required, std::vector<std::int64_t> &out,
                       QString &err) {
    const QJsonValue v = obj.value(QLatin1String(field));
    if (v.isUndefined() || v.isNull()) {
        if (!required)
            return true;
        err = QStringLiteral("%1 is required").arg(QLatin1String(field));
        return false;
    }
    if (!v.isArray()) {
        err = QStringLiteral("%1 must be an array").arg(QLatin1String(field));
        return false;
    }
    out.clear();
    for (const QJsonValue &e : v.toArray()) {
        qint64 id = 0;
        if (!readInteger(e, field, id, err))
            return false;
        out.push_back(id);
    }
    return true;
}

// Scope ids and user ids arrive as numbers or strings.
static bool readIdText(const QJsonValue &v, const char *field,
                       std::string &out, QString &err) {
    if (v.isString()) {
        out = v.toString().toStdString();
        return true;
    }
    qint64 n = 0;
    if (!readInteger(v, field, n, err)) {
        err = QStringLiteral("%1 must be a string or an integer")
                  .arg(QLatin1String(field));
        return false;
    }
    out = std::to_string(n);
    return true;
}

static bool readSize(const QJsonValue &v, const char *field,
                     std::optional<std::uint64_t> &out, QString &err) {
    if (v.isNull()) {
        out.reset();
        return true;
    }
    qint64 n = 0;
    if (!readInteger(v, field, n, err))
        return false;
    if (n < 0) {
        err = QStringLiteral("%1 must not be negative").arg(QLatin1String(field));
        return false;
    }
    out = static_cast<std::uint64_t>(n);
    return true;
}

static bool readStringList(const QJsonValue &v, const char *field,
                           std::optional<std::vector<std::string>> &out,
                           QString &err) {
    if (v.isNull()) {
        out.reset();
        return true;
    }
    if (!v.isArray()) {
        err = QStringLiteral("%1 must be an array of strings or null")
                  .arg(QLatin1String(field));
        return false;
    }
    std::vector<std::string> list;
    for (const QJsonValue &e : v.toArray()) {
        if (!e.isString()) {
            err = QStringLiteral("%1 must contain only strings")
                      .arg(QLatin1String(field));
            return false;
        }
        list.push_back(e.toString().toStdString());
    }
    out = std::move(list);
    return true;
}

static bool readBoolish(const QJsonValue &v, const char *field, bool &out,
                        QString &err) {
    if (v.isBool()) {
        out = v.toBool();
        return true;
    }
    qint64 n = 0;
    if (v.isDouble() && readInteger(v, field, n, err) && (n == 0 || n == 1)) {
        out = n == 1;
        return true;
    }
    err = QStringLiteral("%1 must be a boolean").arg(QLatin1String(field));
    return false;
}

static QJsonArray idsToJson(const std::vector<std::int64_t> &ids) {
    QJsonArray a;
    for (std::int64_t id : ids)
        a.append(static_cast<double>(id));
    return a;
}

static QJsonValue timeToJson(std::int64_t ms) {
    return ms > 0 ? QJsonValue(static_cast<double>(ms)) : QJsonValue();
}

bool parseBatchRequest(const QJsonObject &obj, BatchRequest &out, QString &err) {
    if (!readRequiredString(obj, "command", out.command, err))
        return false;
    if (!readIdList(obj, "connectionIds", true, out.connectionIds, err))
        return false;
    if (!readOptionalInt(obj, "concurrencyLimit", out.concurrencyLimit, err))
        return false;
    if (!readOptionalInt(obj, "timeoutSeconds", out.timeoutSeconds, err))
        return false;

    const QJsonValue env = obj.value("env");
    if (!env.isUndefined() && !env.isNull()) {
        if (!env.isObject()) {
            err = QStringLiteral("env must be an object");
            return false;
        }
        // QJsonObject keeps keys sorted, so the rendered order is by name.
        out.env.clear();
        const QJsonObject e = env.toObject();
        for (auto it = e.begin(); it != e.end(); ++it) {
            QString value;
            if (it.value().isString())
                value = it.value().toString();
            else if (it.value().isDouble() || it.value().isBool())
                value = it.value().toVariant().toString();
            else {
                err = QStringLiteral("env.%1 must be a string").arg(it.key());
                return false;
            }
            out.env.emplace_back(it.key().toStdString(), value.toStdString());
        }
    }

    const QJsonValue workdir = obj.value("workdir");
    if (workdir.isString())
        out.workdir = workdir.toString().toStdString();
    else if (!workdir.isUndefined() && !workdir.isNull()) {
        err = QStringLiteral("workdir must be a string");
        return false;
    }

    const QJsonValue sudo = obj.value("sudo");
    if (!sudo.isUndefined() && !sudo.isNull() &&
        !readBoolish(sudo, "sudo", out.sudo, err))
        return false;
    return true;
}

static bool parseSourceItem(const QJsonValue &v, SourceItem &out,
                            QString &err) {
    if (!v.isObject()) {
        err = QStringLiteral("sourceItems entries must be objects");
        return false;
    }
    const QJsonObject o = v.toObject();
    if (!readRequiredString(o, "name", out.name, err) ||
        !readRequiredString(o, "path", out.path, err))
        return false;
    const QJsonValue type = o.value("type");
    if (!type.isUndefined()) {
        auto t = parseSourceItemType(type.toString().toStdString());
        if (!type.isString() || !t) {
            err = QStringLiteral("sourceItems.type must be \"file\" or \"directory\"");
            return false;
        }
        out.type = *t;
    }
    const QJsonValue size = o.value("size");
    if (!size.isUndefined() && !readSize(size, "sourceItems.size", out.size, err))
        return false;
    return true;
}

bool parseTransferRequest(const QJsonObject &obj, TransferRequest &out,
                          QString &err) {
    qint64 source = 0;
    if (!readInteger(obj.value("sourceConnectionId"), "sourceConnectionId",
                     source, err))
        return false;
    out.sourceConnectionId = source;
    if (!readIdList(obj, "connectionIds", true, out.connectionIds, err))
        return false;

    const QJsonValue items = obj.value("sourceItems");
    if (!items.isArray()) {
        err = QStringLiteral("sourceItems must be an array");
        return false;
    }
    out.sourceItems.clear();
    for (const QJsonValue &v : items.toArray()) {
        SourceItem item;
        if (!parseSourceItem(v, item, err))
            return false;
        out.sourceItems.push_back(std::move(item));
    }

    if (!readRequiredString(obj, "remoteTargetPath", out.remoteTargetPath, err))
        return false;

    const QJsonValue method = obj.value("transferMethod");
    if (!method.isUndefined() && !method.isNull()) {
        auto m = parseTransferMethod(method.toString().toStdString());
        if (!method.isString() || !m) {
            err = QStringLiteral("transferMethod must be auto, rsync or scp");
            return false;
        }
        out.transferMethod = *m;
    }
    if (!readOptionalInt(obj, "concurrencyLimit", out.concurrencyLimit, err))
        return false;
    return readIdList(obj, "groupIds", false, out.userGroupIds, err);
}

bool parseTransferContext(const QJsonObject &obj, TransferContext &out,
                          QString &err) {
    const QJsonValue user = obj.value("userId");
    if (!user.isUndefined() && !readIdText(user, "userId", out.userId, err))
        return false;

    const QJsonValue conn = obj.value("connectionId");
    if (!conn.isUndefined() && !conn.isNull()) {
        qint64 id = 0;
        if (!readInteger(conn, "connectionId", id, err))
            return false;
        out.connectionId = id;
    }
    if (!readIdList(obj, "groupIds", false, out.groupIds, err))
        return false;

    const QJsonValue direction = obj.value("direction");
    auto d = parseTransferDirection(direction.toString().toStdString());
    if (!direction.isString() || !d) {
        err = QStringLiteral("direction must be upload or download");
        return false;
    }
    out.direction = *d;

    if (!readRequiredString(obj, "fileName", out.fileName, err))
        return false;
    std::optional<std::uint64_t> size;
    if (!readSize(obj.value("fileSize"), "fileSize", size, err))
        return false;
    out.fileSize = size.value_or(0);
    return true;
}

bool parsePolicy(const QJsonObject &obj, TransferPolicy &out, QString &err) {
    PolicyUpdate u;
    if (!parsePolicyUpdate(obj, u, err))
        return false;
    if (!u.name) {
        err = QStringLiteral("name is required");
        return false;
    }
    if (!u.scope) {
        err = QStringLiteral("scope is required");
        return false;
    }
    out.name = *u.name;
    out.scope = *u.scope;
    out.scopeId = u.scopeId;
    if (u.direction)
        out.direction = *u.direction;
    if (u.maxFileSize)
        out.maxFileSize = *u.maxFileSize;
    if (u.maxTotalSize)
        out.maxTotalSize = *u.maxTotalSize;
    if (u.allowedExtensions)
        out.allowedExtensions = *u.allowedExtensions;
    if (u.blockedExtensions)
        out.blockedExtensions = *u.blockedExtensions;
    if (u.enabled)
        out.enabled = *u.enabled;
    if (u.priority)
        out.priority = *u.priority;
    return true;
}

bool parsePolicyUpdate(const QJsonObject &obj, PolicyUpdate &out, QString &err) {
    const QJsonValue name = obj.value("name");
    if (!name.isUndefined()) {
        if (!name.isString()) {
            err = QStringLiteral("name must be a string");
            return false;
        }
        out.name = name.toString().trimmed().toStdString();
    }

    const QJsonValue scope = obj.value("scope");
    if (!scope.isUndefined()) {
        auto s = parsePolicyScope(scope.toString().toStdString());
        if (!scope.isString() || !s) {
            err = QStringLiteral("Unknown scope: %1").arg(scope.toString());
            return false;
        }
        out.scope = *s;
    }

    const QJsonValue scopeId = obj.value("scope_id");
    if (!scopeId.isUndefined() && !scopeId.isNull()) {
        std::string id;
        if (!readIdText(scopeId, "scope_id", id, err))
            return false;
        out.scopeId = id;
    }

    const QJsonValue direction = obj.value("direction");
    if (!direction.isUndefined()) {
        auto d = parseTransferDirection(direction.toString().toStdString());
        if (!direction.isString() || !d) {
            err = QStringLiteral("Unknown direction: %1").arg(direction.toString());
            return false;
        }
        out.direction = *d;
    }

    std::optional<std::uint64_t> size;
    if (obj.contains("max_file_size")) {
        if (!readSize(obj.value("max_file_size"), "max_file_size", size, err))
            return false;
        out.maxFileSize = size;
    }
    if (obj.contains("max_total_size")) {
        if (!readSize(obj.value("max_total_size"), "max_total_size", size, err))
            return false;
        out.maxTotalSize = size;
    }

    std::optional<std::vector<std::string>> list;
    if (obj.contains("allowed_extensions")) {
        if (!readStringList(obj.value("allowed_extensions"), "allowed_extensions",
                            list, err))
            return false;
        out.allowedExtensions = list;
    }
    if (obj.contains("blocked_extensions")) {
        if (!readStringList(obj.value("blocked_extensions"), "blocked_extensions",
                            list, err))
            return false;
        out.blockedExtensions = list;
    }

    const QJsonValue enabled = obj.value("enabled");
    if (!enabled.isUndefined()) {
        bool e = true;
        if (!readBoolish(enabled, "enabled", e, err))
            return false;
        out.enabled = e;
    }
    int priority = 0;
    if (obj.contains("priority")) {
        if (!readOptionalInt(obj, "priority", priority, err))
            return false;
        out.priority = priority;
    }
    return true;
}

bool parsePayload(const QJsonObject &obj, TaskPayload &out, QString &err) {
    auto kind = parseTaskKind(obj.value("kind").toString().toStdString());
    if (!kind) {
        err = QStringLiteral("payload kind must be batch or transfer");
        return false;
    }
    out.kind = *kind;
    if (out.kind == TaskKind::Batch)
        return parseBatchRequest(obj, out.batch, err);
    return parseTransferRequest(obj, out.transfer, err);
}

QJsonObject payloadToJson(const TaskPayload &payload) {
    QJsonObject o;
    o["kind"] = QString::fromLatin1(taskKindName(payload.kind));
    if (payload.kind == TaskKind::Batch) {
        const BatchRequest &b = payload.batch;
        o["command"] = QString::fromStdString(b.command);
        o["connectionIds"] = idsToJson(b.connectionIds);
        o["concurrencyLimit"] = b.concurrencyLimit;
        o["timeoutSeconds"] = b.timeoutSeconds;
        if (!b.env.empty()) {
            QJsonObject env;
            for (const auto &kv : b.env)
                env[QString::fromStdString(kv.first)] =
                    QString::fromStdString(kv.second);
            o["env"] = env;
        }
        if (b.workdir)
            o["workdir"] = QString::fromStdString(*b.workdir);
        o["sudo"] = b.sudo;
        return o;
    }

    const TransferRequest &t = payload.transfer;
    o["sourceConnectionId"] = static_cast<double>(t.sourceConnectionId);
    o["connectionIds"] = idsToJson(t.connectionIds);
    QJsonArray items;
    for (const auto &item : t.sourceItems) {
        QJsonObject i;
        i["name"] = QString::fromStdString(item.name);
        i["path"] = QString::fromStdString(item.path);
        i["type"] = QString::fromLatin1(sourceItemTypeName(item.type));
        if (item.size)
            i["size"] = static_cast<double>(*item.size);
        items.append(i);
    }
    o["sourceItems"] = items;
    o["remoteTargetPath"] = QString::fromStdString(t.remoteTargetPath);
    o["transferMethod"] = QString::fromLatin1(transferMethodName(t.transferMethod));
    o["concurrencyLimit"] = t.concurrencyLimit;
    if (!t.userGroupIds.empty())
        o["groupIds"] = idsToJson(t.userGroupIds);
    return o;
}

QJsonObject subTaskToJson(const SubTask &st) {
    QJsonObject o;
    o["subTaskId"] = QString::fromStdString(st.id);
    o["taskId"] = QString::fromStdString(st.taskId);
    o["connectionId"] = static_cast<double>(st.connectionId);
    o["label"] = QString::fromStdString(st.label);
    if (st.sourceItemIndex >= 0)
        o["sourceItemIndex"] = st.sourceItemIndex;
    o["status"] = QString::fromLatin1(subTaskStatusName(st.status));
    o["progress"] = st.progress;
    o["exitCode"] = st.exitCode ? QJsonValue(*st.exitCode) : QJsonValue();
    if (!st.output.empty())
        o["output"] = QString::fromStdString(st.output);
    if (!st.message.empty())
        o["message"] = QString::fromStdString(st.message);
    if (st.transferMethodUsed)
        o["transferMethodUsed"] =
            QString::fromLatin1(transferMethodName(*st.transferMethodUsed));
    o["startedAt"] = timeToJson(st.startedAtMs);
    o["endedAt"] = timeToJson(st.endedAtMs);
    return o;
}

QJsonObject taskToJson(const Task &task) {
    QJsonObject o;
    o["taskId"] = QString::fromStdString(task.id);
    o["userId"] = QString::fromStdString(task.userId);
    o["kind"] = QString::fromLatin1(taskKindName(task.kind));
    o["status"] = QString::fromLatin1(taskStatusName(task.status));
    o["concurrencyLimit"] = task.concurrencyLimit;
    o["overallProgress"] = task.overallProgress;
    o["totalSubTasks"] = task.totalSubTasks;
    o["completedSubTasks"] = task.completedSubTasks;
    o["failedSubTasks"] = task.failedSubTasks;
    o["cancelledSubTasks"] = task.cancelledSubTasks;
    if (!task.message.empty())
        o["message"] = QString::fromStdString(task.message);
    o["payload"] = payloadToJson(task.payload);
    QJsonArray subs;
    for (const auto &st : task.subTasks)
        subs.append(subTaskToJson(st));
    o["subTasks"] = subs;
    o["createdAt"] = timeToJson(task.createdAtMs);
    o["updatedAt"] = timeToJson(task.updatedAtMs);
    o["startedAt"] = timeToJson(task.startedAtMs);
    o["endedAt"] = timeToJson(task.endedAtMs);
    return o;
}

static QJsonValue listToJson(const std::optional<std::vector<std::string>> &list) {
    if (!list)
        return QJsonValue();
    QJsonArray a;
    for (const auto &s : *list)
        a.append(QString::fromStdString(s));
    return a;
}

static QJsonValue sizeToJson(const std::optional<std::uint64_t> &size) {
    return size ? QJsonValue(static_cast<double>(*size)) : QJsonValue();
}

QJsonObject policyToJson(const TransferPolicy &p) {
    QJsonObject o;
    o["id"] = QString::fromStdString(p.id);
    o["name"] = QString::fromStdString(p.name);
    o["scope"] = QString::fromLatin1(policyScopeName(p.scope));
    o["scope_id"] = p.scopeId ? QJsonValue(QString::fromStdString(*p.scopeId))
                              : QJsonValue();
    o["direction"] = QString::fromLatin1(transferDirectionName(p.direction));
    o["max_file_size"] = sizeToJson(p.maxFileSize);
    o["max_total_size"] = sizeToJson(p.maxTotalSize);
    o["allowed_extensions"] = listToJson(p.allowedExtensions);
    o["blocked_extensions"] = listToJson(p.blockedExtensions);
    o["enabled"] = p.enabled;
    o["priority"] = p.priority;
    o["created_at"] = static_cast<double>(p.createdAtMs);
    o["updated_at"] = static_cast<double>(p.updatedAtMs);
    return o;
}

QJsonObject decisionToJson(const PolicyDecision &decision) {
    QJsonObject o;
    o["allowed"] = decision.allowed;
    if (!decision.reason.empty())
        o["reason"] = QString::fromStdString(decision.reason);
    if (decision.policy)
        o["policy"] = policyToJson(*decision.policy);
    return o;
}

QString extensionListToText(const std::optional<std::vector<std::string>> &list) {
    if (!list)
        return QString();
    QJsonArray a;
    for (const auto &s : *list)
        a.append(QString::fromStdString(s));
    return QString::fromUtf8(QJsonDocument(a).toJson(QJsonDocument::Compact));
}

bool extensionListFromText(const QString &text,
                           std::optional<std::vector<std::string>> &out) {
    out.reset();
    if (text.trimmed().isEmpty())
        return true;
    QJsonParseError pe{};
    const QJsonDocument doc = QJsonDocument::fromJson(text.toUtf8(), &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isArray())
        return false;
    std::vector<std::string> list;
    for (const QJsonValue &v : doc.array()) {
        if (!v.isString())
            return false;
        list.push_back(v.toString().toStdString());
    }
    out = std::move(list);
    return true;
}

bool readJsonObjectFile(const QString &path, QJsonObject &out, QString &err) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly)) {
        err = QStringLiteral("Could not open %1: %2").arg(path, f.errorString());
        return false;
    }
    QJsonParseError pe{};
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &pe);
    if (pe.error != QJsonParseError::NoError) {
        err = QStringLiteral("%1: %2 at offset %3")
                  .arg(path, pe.errorString())
                  .arg(pe.offset);
        return false;
    }
    if (!doc.isObject()) {
        err = QStringLiteral("%1: expected a JSON object").arg(path);
        return false;
    }
    out = doc.object();
    return true;
}
