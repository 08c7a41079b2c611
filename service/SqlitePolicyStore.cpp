#include "SqlitePolicyStore.hpp"
#include "LogCategories.hpp"
#include "RequestJson.hpp"

using namespace openfleet;

bool SqlitePolicyStore::initSchema(std::string &err) {
    const char *sql = R"SQL(
CREATE TABLE IF NOT EXISTS transfer_policies (
    id                 TEXT PRIMARY KEY,
    name               TEXT NOT NULL UNIQUE,
    scope              TEXT NOT NULL,
    scope_id           TEXT,
    direction          TEXT NOT NULL DEFAULT 'both',
    max_file_size      INTEGER,
    max_total_size     INTEGER,
    allowed_extensions TEXT,
    blocked_extensions TEXT,
    enabled            INTEGER NOT NULL DEFAULT 1,
    priority           INTEGER NOT NULL DEFAULT 0,
    created_at         INTEGER NOT NULL,
    updated_at         INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_transfer_policies_scope
    ON transfer_policies(scope, scope_id);
)SQL";
    std::lock_guard<std::recursive_mutex> lk(db_.mutex());
    return db_.exec(sql, err);
}

static void bindSize(SqliteStatement &st, int idx,
                     const std::optional<std::uint64_t> &v) {
    if (v)
        st.bindInt64(idx, (sqlite3_int64)*v);
    else
        st.bindNull(idx);
}

bool SqlitePolicyStore::save(const TransferPolicy &p, std::string &err) {
    std::lock_guard<std::recursive_mutex> lk(db_.mutex());
    SqliteStatement st(db_.handle(), R"SQL(
INSERT INTO transfer_policies (id, name, scope, scope_id, direction,
    max_file_size, max_total_size, allowed_extensions, blocked_extensions,
    enabled, priority, created_at, updated_at)
VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13)
ON CONFLICT(id) DO UPDATE SET
    name = excluded.name,
    scope = excluded.scope,
    scope_id = excluded.scope_id,
    direction = excluded.direction,
    max_file_size = excluded.max_file_size,
    max_total_size = excluded.max_total_size,
    allowed_extensions = excluded.allowed_extensions,
    blocked_extensions = excluded.blocked_extensions,
    enabled = excluded.enabled,
    priority = excluded.priority,
    updated_at = excluded.updated_at;
)SQL");
    if (!st.ok()) {
        err = db_.lastError();
        return false;
    }
    st.bindText(1, p.id);
    st.bindText(2, p.name);
    st.bindText(3, policyScopeName(p.scope));
    if (p.scopeId)
        st.bindText(4, *p.scopeId);
    else
        st.bindNull(4);
    st.bindText(5, transferDirectionName(p.direction));
    bindSize(st, 6, p.maxFileSize);
    bindSize(st, 7, p.maxTotalSize);
    st.bindOptionalText(8, extensionListToText(p.allowedExtensions).toStdString());
    st.bindOptionalText(9, extensionListToText(p.blockedExtensions).toStdString());
    st.bindInt64(10, p.enabled ? 1 : 0);
    st.bindInt64(11, p.priority);
    st.bindInt64(12, p.createdAtMs);
    st.bindInt64(13, p.updatedAtMs);
    if (st.step() != SQLITE_DONE) {
        err = "save policy " + p.name + ": " + db_.lastError();
        return false;
    }
    return true;
}

bool SqlitePolicyStore::remove(const std::string &id, std::string &err) {
    std::lock_guard<std::recursive_mutex> lk(db_.mutex());
    SqliteStatement st(db_.handle(), "DELETE FROM transfer_policies WHERE id = ?1;");
    if (!st.ok()) {
        err = db_.lastError();
        return false;
    }
    st.bindText(1, id);
    if (st.step() != SQLITE_DONE) {
        err = db_.lastError();
        return false;
    }
    return true;
}

bool SqlitePolicyStore::loadInto(PolicyRegistry &registry, int &loaded,
                                 std::string &err) {
    std::lock_guard<std::recursive_mutex> lk(db_.mutex());
    SqliteStatement st(db_.handle(), R"SQL(
SELECT id, name, scope, scope_id, direction, max_file_size, max_total_size,
       allowed_extensions, blocked_extensions, enabled, priority, created_at,
       updated_at
FROM transfer_policies ORDER BY created_at, id;
)SQL");
    if (!st.ok()) {
        err = db_.lastError();
        return false;
    }
    loaded = 0;
    int rc = SQLITE_ROW;
    while ((rc = st.step()) == SQLITE_ROW) {
        TransferPolicy p;
        p.id = st.columnText(0);
        p.name = st.columnText(1);
        auto scope = parsePolicyScope(st.columnText(2));
        auto direction = parseTransferDirection(st.columnText(4));
        if (!scope || !direction) {
            qCWarning(ofPolicy) << "skipping policy with unknown scope or direction"
                                << "policyId=" << QString::fromStdString(p.id);
            continue;
        }
        p.scope = *scope;
        p.direction = *direction;
        if (!st.columnIsNull(3))
            p.scopeId = st.columnText(3);
        if (!st.columnIsNull(5))
            p.maxFileSize = (std::uint64_t)st.columnInt64(5);
        if (!st.columnIsNull(6))
            p.maxTotalSize = (std::uint64_t)st.columnInt64(6);
        if (!extensionListFromText(QString::fromStdString(st.columnText(7)),
                                   p.allowedExtensions))
            qCWarning(ofPolicy) << "malformed allowed_extensions; ignoring list"
                                << "policy=" << QString::fromStdString(p.name);
        if (!extensionListFromText(QString::fromStdString(st.columnText(8)),
                                   p.blockedExtensions))
            qCWarning(ofPolicy) << "malformed blocked_extensions; ignoring list"
                                << "policy=" << QString::fromStdString(p.name);
        p.enabled = st.columnInt64(9) != 0;
        p.priority = (int)st.columnInt64(10);
        p.createdAtMs = st.columnInt64(11);
        p.updatedAtMs = st.columnInt64(12);
        registry.insertLoaded(std::move(p));
        ++loaded;
    }
    if (rc != SQLITE_DONE) {
        err = db_.lastError();
        return false;
    }
    return true;
}
