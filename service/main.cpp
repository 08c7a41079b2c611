// openfleetd: runs batch commands and fleet copies from JSON requests and
// reports progress as JSON lines on stdout.
#include "LogCategories.hpp"
#include "RequestJson.hpp"
#include "ServiceConfig.hpp"
#include "SettingsCredentialResolver.hpp"
#include "SqliteDatabase.hpp"
#include "SqlitePolicyStore.hpp"
#include "SqliteTaskStore.hpp"
#include "TaskOrchestrator.hpp"
#include "openfleet/Libssh2RemoteSession.hpp"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTimer>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <memory>

using namespace openfleet;

namespace {

std::atomic<bool> g_stopRequested{false};

void onStopSignal(int) { g_stopRequested = true; }

void printLine(const QJsonValue &v) {
    const QByteArray line =
        v.isArray() ? QJsonDocument(v.toArray()).toJson(QJsonDocument::Compact)
                    : QJsonDocument(v.toObject()).toJson(QJsonDocument::Compact);
    std::fwrite(line.constData(), 1, (size_t)line.size(), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

int fail(const QString &msg) {
    std::fprintf(stderr, "openfleetd: %s\n", msg.toLocal8Bit().constData());
    return 1;
}

int exitCodeFor(const QString &status) {
    if (status == QLatin1String(taskStatusName(TaskStatus::Completed)))
        return 0;
    if (status == QLatin1String(taskStatusName(TaskStatus::PartiallyCompleted)))
        return 2;
    return 1;
}

// Streams orchestrator events and leaves the event loop once the task is
// terminal. Connected before submitting so the first events are not lost.
void followTasks(QCoreApplication &app, TaskOrchestrator &orch,
                 const std::string &userId) {
    QObject::connect(
        &orch, &TaskOrchestrator::taskStarted, &app,
        [](const QString &tid, int total, int concurrency) {
            printLine(QJsonObject{{"event", "started"},
                                  {"taskId", tid},
                                  {"total", total},
                                  {"concurrency", concurrency}});
        },
        Qt::QueuedConnection);
    QObject::connect(
        &orch, &TaskOrchestrator::subTaskUpdated, &app,
        [](const QString &tid, const QString &subId, const QString &status,
           int progress, const QString &message, const QVariant &exitCode) {
            QJsonObject o{{"event", "subtask"},   {"taskId", tid},
                          {"subTaskId", subId},   {"status", status},
                          {"progress", progress}, {"message", message}};
            o["exitCode"] = exitCode.isNull() ? QJsonValue()
                                              : QJsonValue(exitCode.toInt());
            printLine(o);
        },
        Qt::QueuedConnection);
    QObject::connect(
        &orch, &TaskOrchestrator::subTaskOutput, &app,
        [](const QString &tid, const QString &subId, const QString &chunk,
           bool isStderr) {
            printLine(QJsonObject{{"event", "output"},
                                  {"taskId", tid},
                                  {"subTaskId", subId},
                                  {"stream", isStderr ? "stderr" : "stdout"},
                                  {"chunk", chunk}});
        },
        Qt::QueuedConnection);
    QObject::connect(
        &orch, &TaskOrchestrator::overallUpdated, &app,
        [](const QString &tid, const QString &status, int progress,
           int completed, int failed, int cancelled, int total) {
            printLine(QJsonObject{{"event", "overall"},
                                  {"taskId", tid},
                                  {"status", status},
                                  {"overallProgress", progress},
                                  {"completed", completed},
                                  {"failed", failed},
                                  {"cancelled", cancelled},
                                  {"total", total}});
        },
        Qt::QueuedConnection);
    QObject::connect(
        &orch, &TaskOrchestrator::taskFinished, &app,
        [&app, &orch, userId](const QString &tid, const QString &status) {
            if (auto task = orch.getDetails(tid.toStdString(), userId))
                printLine(QJsonObject{{"event", "finished"},
                                      {"task", taskToJson(*task)}});
            app.exit(exitCodeFor(status));
        },
        Qt::QueuedConnection);
}

// Turns SIGINT/SIGTERM into a cancel of the running task.
void watchStopSignals(QCoreApplication &app, TaskOrchestrator &orch,
                      const std::string &taskId, const std::string &userId) {
    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);
    auto *poll = new QTimer(&app);
    QObject::connect(poll, &QTimer::timeout, &app, [&orch, taskId, userId] {
        if (!g_stopRequested.exchange(false))
            return;
        qCInfo(ofDaemon) << "stop requested; cancelling" << "taskId="
                         << QString::fromStdString(taskId);
        if (!orch.cancel(taskId, userId))
            qCWarning(ofDaemon) << "task could not be cancelled"
                                << "taskId=" << QString::fromStdString(taskId);
    });
    poll->start(100);
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("OpenFleet");
    QCoreApplication::setApplicationName("openfleetd");
    QCoreApplication::setApplicationVersion(OPEN_FLEET_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Runs commands and copies files across SSH hosts.\n\n"
        "Commands:\n"
        "  exec <request.json>      run a batch command\n"
        "  copy <request.json>      copy source items to target hosts\n"
        "  policy-check <ctx.json>  evaluate transfer policies\n"
        "  policy-list              list transfer policies\n"
        "  policy-add <policy.json> create a transfer policy\n"
        "  policy-remove <id>       delete a transfer policy\n"
        "  history                  list the user's tasks");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOpt({"c", "config"}, "Configuration file.", "path",
                                 defaultConfigPath());
    QCommandLineOption userOpt({"u", "user"}, "Acting user id.", "id",
                               qEnvironmentVariable("USER", "local"));
    parser.addOption(configOpt);
    parser.addOption(userOpt);
    parser.addPositionalArgument("command", "Command to run.");
    parser.addPositionalArgument("argument", "Command argument.", "[argument]");
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty())
        parser.showHelp(1);
    const QString command = args.at(0);
    const QString argument = args.size() > 1 ? args.at(1) : QString();
    const std::string userId = parser.value(userOpt).toStdString();

    ServiceConfig cfg;
    QString cfgErr;
    if (!loadServiceConfig(parser.value(configOpt), cfg, cfgErr))
        return fail(cfgErr);
    applyLoggingRules(cfg);

    PolicyRegistry policies;
    SqliteDatabase db;
    std::unique_ptr<SqliteTaskStore> taskStore;
    std::unique_ptr<SqlitePolicyStore> policyStore;
    if (!cfg.databasePath.isEmpty()) {
        std::string err;
        if (!db.open(cfg.databasePath.toStdString(), err))
            return fail(QString::fromStdString(err));
        taskStore = std::make_unique<SqliteTaskStore>(db);
        policyStore = std::make_unique<SqlitePolicyStore>(db);
        int loaded = 0;
        if (!taskStore->initSchema(err) || !policyStore->initSchema(err) ||
            !policyStore->loadInto(policies, loaded, err))
            return fail(QString::fromStdString(err));
        qCInfo(ofDaemon) << "database ready" << "path=" << cfg.databasePath
                         << "policies=" << loaded;
    } else {
        qCInfo(ofDaemon) << "no database configured; history is kept in memory";
    }

    SettingsCredentialResolver resolver(
        cfg.credentialsPath.isEmpty() ? cfg.sourcePath : cfg.credentialsPath);
    Libssh2RemoteSession prototype;
    SubTaskRunner runner(prototype, resolver, cfg.runnerOptions());
    TaskOrchestrator::Options orchOpt;
    orchOpt.cancelGraceMs = cfg.cancelGraceMs;
    TaskOrchestrator orch(runner, resolver, orchOpt);
    orch.setPolicyRegistry(&policies);
    orch.setTaskStore(taskStore.get());

    std::string restoreErr;
    if (!orch.restore(restoreErr))
        qCWarning(ofDaemon) << "history could not be restored"
                            << "error=" << QString::fromStdString(restoreErr);
    if (taskStore)
        orch.purgeFinishedOlderThan(cfg.purgeAfterDays);

    if (command == QLatin1String("exec") || command == QLatin1String("copy")) {
        if (argument.isEmpty())
            return fail(QStringLiteral("%1 needs a request file").arg(command));
        QJsonObject body;
        QString err;
        if (!readJsonObjectFile(argument, body, err))
            return fail(err);

        followTasks(app, orch, userId);
        std::optional<Task> task;
        std::string submitErr;
        if (command == QLatin1String("exec")) {
            BatchRequest req;
            req.concurrencyLimit = cfg.concurrencyLimit;
            req.timeoutSeconds = cfg.commandTimeoutSeconds;
            if (!parseBatchRequest(body, req, err))
                return fail(err);
            task = orch.submitBatch(req, userId, submitErr);
        } else {
            TransferRequest req;
            req.concurrencyLimit = cfg.concurrencyLimit;
            if (!parseTransferRequest(body, req, err))
                return fail(err);
            task = orch.submitTransfer(req, userId, submitErr);
        }
        if (!task)
            return fail(QString::fromStdString(submitErr));
        qCInfo(ofDaemon) << "task submitted" << "taskId="
                         << QString::fromStdString(task->id);
        watchStopSignals(app, orch, task->id, userId);
        return app.exec();
    }

    if (command == QLatin1String("policy-check")) {
        if (argument.isEmpty())
            return fail(QStringLiteral("policy-check needs a context file"));
        QJsonObject body;
        QString err;
        TransferContext ctx;
        ctx.userId = userId;
        if (!readJsonObjectFile(argument, body, err) ||
            !parseTransferContext(body, ctx, err))
            return fail(err);
        const PolicyDecision d = policies.validate(ctx);
        printLine(decisionToJson(d));
        return d.allowed ? 0 : 1;
    }

    if (command == QLatin1String("policy-list")) {
        QJsonArray out;
        for (const auto &p : policies.list())
            out.append(policyToJson(p));
        printLine(out);
        return 0;
    }

    if (command == QLatin1String("policy-add")) {
        if (!policyStore)
            return fail(QStringLiteral("policy-add needs Storage/databasePath"));
        QJsonObject body;
        QString err;
        TransferPolicy policy;
        if (argument.isEmpty())
            return fail(QStringLiteral("policy-add needs a policy file"));
        if (!readJsonObjectFile(argument, body, err) ||
            !parsePolicy(body, policy, err))
            return fail(err);
        std::string createErr;
        auto created = policies.create(policy, createErr);
        if (!created || !policyStore->save(*created, createErr))
            return fail(QString::fromStdString(createErr));
        qCInfo(ofPolicy) << "policy created" << "name="
                         << QString::fromStdString(created->name);
        printLine(policyToJson(*created));
        return 0;
    }

    if (command == QLatin1String("policy-remove")) {
        if (!policyStore)
            return fail(QStringLiteral("policy-remove needs Storage/databasePath"));
        std::string err;
        if (!policies.remove(argument.toStdString(), err) ||
            !policyStore->remove(argument.toStdString(), err))
            return fail(QString::fromStdString(err));
        qCInfo(ofPolicy) << "policy removed" << "id=" << argument;
        return 0;
    }

    if (command == QLatin1String("history")) {
        QJsonArray out;
        for (const auto &t : orch.listForUser(userId)) {
            QJsonObject o = taskToJson(t);
            o.remove("subTasks");
            out.append(o);
        }
        printLine(out);
        return 0;
    }

    return fail(QStringLiteral("Unknown command: %1").arg(command));
}
