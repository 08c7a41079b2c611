#include "SqliteTaskStore.hpp"
#include "LogCategories.hpp"
#include "RequestJson.hpp"
#include <QJsonDocument>
#include <QJsonParseError>

using namespace openfleet;

bool SqliteTaskStore::initSchema(std::string &err) {
    const char *sql = R"SQL(
CREATE TABLE IF NOT EXISTS tasks (
    id                 TEXT PRIMARY KEY,
    user_id            TEXT NOT NULL,
    kind               TEXT NOT NULL,
    status             TEXT NOT NULL,
    concurrency_limit  INTEGER NOT NULL,
    overall_progress   INTEGER NOT NULL DEFAULT 0,
    total_subtasks     INTEGER NOT NULL DEFAULT 0,
    completed_subtasks INTEGER NOT NULL DEFAULT 0,
    failed_subtasks    INTEGER NOT NULL DEFAULT 0,
    cancelled_subtasks INTEGER NOT NULL DEFAULT 0,
    message            TEXT,
    payload_json       TEXT NOT NULL,
    created_at         INTEGER NOT NULL,
    updated_at         INTEGER NOT NULL,
    started_at         INTEGER,
    ended_at           INTEGER
);

CREATE TABLE IF NOT EXISTS sub_tasks (
    id                   TEXT PRIMARY KEY,
    task_id              TEXT NOT NULL,
    position             INTEGER NOT NULL,
    connection_id        INTEGER NOT NULL,
    label                TEXT,
    source_item_index    INTEGER NOT NULL DEFAULT -1,
    status               TEXT NOT NULL,
    progress             INTEGER NOT NULL DEFAULT 0,
    exit_code            INTEGER,
    output               TEXT,
    message              TEXT,
    transfer_method_used TEXT,
    started_at           INTEGER,
    ended_at             INTEGER,
    FOREIGN KEY(task_id) REFERENCES tasks(id) ON DELETE CASCADE
);

CREATE INDEX IF NOT EXISTS idx_tasks_user ON tasks(user_id, created_at);
CREATE INDEX IF NOT EXISTS idx_sub_tasks_task ON sub_tasks(task_id, position);
)SQL";
    std::lock_guard<std::recursive_mutex> lk(db_.mutex());
    return db_.exec(sql, err);
}

static void bindTime(SqliteStatement &st, int idx, std::int64_t ms) {
    if (ms > 0)
        st.bindInt64(idx, ms);
    else
        st.bindNull(idx);
}

bool SqliteTaskStore::saveTask(const Task &task, std::string &err) {
    std::lock_guard<std::recursive_mutex> lk(db_.mutex());
    if (!db_.exec("BEGIN IMMEDIATE;", err))
        return false;

    auto fail = [&](const std::string &what) {
        err = what + ": " + db_.lastError();
        std::string rollbackErr;
        if (!db_.exec("ROLLBACK;", rollbackErr))
            qCWarning(ofStore) << "rollback failed" << "error="
                               << QString::fromStdString(rollbackErr);
        return false;
    };

    {
        SqliteStatement st(db_.handle(), R"SQL(
INSERT INTO tasks (id, user_id, kind, status, concurrency_limit,
    overall_progress, total_subtasks, completed_subtasks, failed_subtasks,
    cancelled_subtasks, message, payload_json, created_at, updated_at,
    started_at, ended_at)
VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16)
ON CONFLICT(id) DO UPDATE SET
    status = excluded.status,
    overall_progress = excluded.overall_progress,
    total_subtasks = excluded.total_subtasks,
    completed_subtasks = excluded.completed_subtasks,
    failed_subtasks = excluded.failed_subtasks,
    cancelled_subtasks = excluded.cancelled_subtasks,
    message = excluded.message,
    updated_at = excluded.updated_at,
    started_at = excluded.started_at,
    ended_at = excluded.ended_at;
)SQL");
        if (!st.ok())
            return fail("prepare tasks upsert");
        const QByteArray payload =
            QJsonDocument(payloadToJson(task.payload)).toJson(QJsonDocument::Compact);
        st.bindText(1, task.id);
        st.bindText(2, task.userId);
        st.bindText(3, taskKindName(task.kind));
        st.bindText(4, taskStatusName(task.status));
        st.bindInt64(5, task.concurrencyLimit);
        st.bindInt64(6, task.overallProgress);
        st.bindInt64(7, task.totalSubTasks);
        st.bindInt64(8, task.completedSubTasks);
        st.bindInt64(9, task.failedSubTasks);
        st.bindInt64(10, task.cancelledSubTasks);
        st.bindOptionalText(11, task.message);
        st.bindText(12, payload.toStdString());
        st.bindInt64(13, task.createdAtMs);
        st.bindInt64(14, task.updatedAtMs);
        bindTime(st, 15, task.startedAtMs);
        bindTime(st, 16, task.endedAtMs);
        if (st.step() != SQLITE_DONE)
            return fail("save task " + task.id);
    }

    {
        SqliteStatement del(db_.handle(), "DELETE FROM sub_tasks WHERE task_id = ?1;");
        if (!del.ok())
            return fail("prepare sub_tasks delete");
        del.bindText(1, task.id);
        if (del.step() != SQLITE_DONE)
            return fail("clear sub_tasks of " + task.id);
    }

    SqliteStatement ins(db_.handle(), R"SQL(
INSERT INTO sub_tasks (id, task_id, position, connection_id, label,
    source_item_index, status, progress, exit_code, output, message,
    transfer_method_used, started_at, ended_at)
VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14);
)SQL");
    if (!ins.ok())
        return fail("prepare sub_tasks insert");
    int position = 0;
    for (const auto &sub : task.subTasks) {
        ins.reset();
        ins.bindText(1, sub.id);
        ins.bindText(2, task.id);
        ins.bindInt64(3, position++);
        ins.bindInt64(4, sub.connectionId);
        ins.bindOptionalText(5, sub.label);
        ins.bindInt64(6, sub.sourceItemIndex);
        ins.bindText(7, subTaskStatusName(sub.status));
        ins.bindInt64(8, sub.progress);
        if (sub.exitCode)
            ins.bindInt64(9, *sub.exitCode);
        else
            ins.bindNull(9);
        ins.bindOptionalText(10, sub.output);
        ins.bindOptionalText(11, sub.message);
        if (sub.transferMethodUsed)
            ins.bindText(12, transferMethodName(*sub.transferMethodUsed));
        else
            ins.bindNull(12);
        bindTime(ins, 13, sub.startedAtMs);
        bindTime(ins, 14, sub.endedAtMs);
        if (ins.step() != SQLITE_DONE)
            return fail("save sub task " + sub.id);
    }

    if (!db_.exec("COMMIT;", err))
        return fail("commit");
    return true;
}

bool SqliteTaskStore::loadSubTasks(Task &task, std::string &err) {
    SqliteStatement st(db_.handle(), R"SQL(
SELECT id, connection_id, label, source_item_index, status, progress,
       exit_code, output, message, transfer_method_used, started_at, ended_at
FROM sub_tasks WHERE task_id = ?1 ORDER BY position;
)SQL");
    if (!st.ok()) {
        err = db_.lastError();
        return false;
    }
    st.bindText(1, task.id);
    int rc = SQLITE_ROW;
    while ((rc = st.step()) == SQLITE_ROW) {
        SubTask sub;
        sub.id = st.columnText(0);
        sub.taskId = task.id;
        sub.connectionId = st.columnInt64(1);
        sub.label = st.columnText(2);
        sub.sourceItemIndex = (int)st.columnInt64(3);
        auto status = parseSubTaskStatus(st.columnText(4));
        if (!status) {
            qCWarning(ofStore) << "unknown sub task status; marking failed"
                               << "subTaskId=" << QString::fromStdString(sub.id);
            status = SubTaskStatus::Failed;
        }
        sub.status = *status;
        sub.progress = clampProgress((int)st.columnInt64(5));
        if (!st.columnIsNull(6))
            sub.exitCode = (int)st.columnInt64(6);
        sub.output = st.columnText(7);
        sub.message = st.columnText(8);
        if (!st.columnIsNull(9))
            sub.transferMethodUsed = parseTransferMethod(st.columnText(9));
        sub.startedAtMs = st.columnInt64(10);
        sub.endedAtMs = st.columnInt64(11);
        task.subTasks.push_back(std::move(sub));
    }
    if (rc != SQLITE_DONE) {
        err = db_.lastError();
        return false;
    }
    return true;
}

bool SqliteTaskStore::loadTasks(std::vector<Task> &out, std::string &err) {
    std::lock_guard<std::recursive_mutex> lk(db_.mutex());
    SqliteStatement st(db_.handle(), R"SQL(
SELECT id, user_id, kind, status, concurrency_limit, overall_progress,
       total_subtasks, completed_subtasks, failed_subtasks, cancelled_subtasks,
       message, payload_json, created_at, updated_at, started_at, ended_at
FROM tasks ORDER BY created_at, id;
)SQL");
    if (!st.ok()) {
        err = db_.lastError();
        return false;
    }
    int rc = SQLITE_ROW;
    while ((rc = st.step()) == SQLITE_ROW) {
        Task task;
        task.id = st.columnText(0);
        task.userId = st.columnText(1);
        auto kind = parseTaskKind(st.columnText(2));
        auto status = parseTaskStatus(st.columnText(3));
        QJsonParseError pe{};
        const QJsonDocument doc = QJsonDocument::fromJson(
            QByteArray::fromStdString(st.columnText(11)), &pe);
        QString payloadErr;
        if (!kind || !status || pe.error != QJsonParseError::NoError ||
            !doc.isObject() ||
            !parsePayload(doc.object(), task.payload, payloadErr)) {
            qCWarning(ofStore) << "skipping unreadable task row"
                               << "taskId=" << QString::fromStdString(task.id)
                               << "error=" << payloadErr;
            continue;
        }
        task.kind = *kind;
        task.status = *status;
        task.concurrencyLimit = (int)st.columnInt64(4);
        task.overallProgress = (int)st.columnInt64(5);
        task.totalSubTasks = (int)st.columnInt64(6);
        task.completedSubTasks = (int)st.columnInt64(7);
        task.failedSubTasks = (int)st.columnInt64(8);
        task.cancelledSubTasks = (int)st.columnInt64(9);
        task.message = st.columnText(10);
        task.createdAtMs = st.columnInt64(12);
        task.updatedAtMs = st.columnInt64(13);
        task.startedAtMs = st.columnInt64(14);
        task.endedAtMs = st.columnInt64(15);
        if (!loadSubTasks(task, err))
            return false;
        out.push_back(std::move(task));
    }
    if (rc != SQLITE_DONE) {
        err = db_.lastError();
        return false;
    }
    return true;
}

bool SqliteTaskStore::deleteTask(const std::string &taskId, std::string &err) {
    std::lock_guard<std::recursive_mutex> lk(db_.mutex());
    SqliteStatement st(db_.handle(), "DELETE FROM tasks WHERE id = ?1;");
    if (!st.ok()) {
        err = db_.lastError();
        return false;
    }
    st.bindText(1, taskId);
    if (st.step() != SQLITE_DONE) {
        err = db_.lastError();
        return false;
    }
    return true;
}

bool SqliteTaskStore::purgeFinishedBefore(std::int64_t cutoffMs, int &removed,
                                          std::string &err) {
    std::lock_guard<std::recursive_mutex> lk(db_.mutex());
    SqliteStatement st(db_.handle(), R"SQL(
DELETE FROM tasks
WHERE status IN ('completed', 'partially-completed', 'failed', 'cancelled')
  AND ended_at IS NOT NULL AND ended_at < ?1;
)SQL");
    if (!st.ok()) {
        err = db_.lastError();
        return false;
    }
    st.bindInt64(1, cutoffMs);
    if (st.step() != SQLITE_DONE) {
        err = db_.lastError();
        return false;
    }
    removed = sqlite3_changes(db_.handle());
    return true;
}
