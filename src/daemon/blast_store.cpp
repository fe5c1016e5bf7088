#include "daemon/blast_store.hpp"

#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>

#include <QDateTime>
#include <QRegularExpression>
#include <QString>

#include <sqlite3.h>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace blastd {

namespace {

constexpr int kBusyTimeoutMs = 5000;

constexpr const char *kCreateActivitiesTable =
    "CREATE TABLE IF NOT EXISTS activities ("
    "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "    client_id TEXT,"
    "    project TEXT,"
    "    git_remote TEXT,"
    "    started_at INTEGER NOT NULL,"
    "    ended_at INTEGER NOT NULL,"
    "    filename TEXT,"
    "    filetype TEXT,"
    "    lines_added INTEGER DEFAULT 0,"
    "    lines_removed INTEGER DEFAULT 0,"
    "    git_branch TEXT,"
    "    actions_per_minute REAL,"
    "    words_per_minute REAL,"
    "    editor TEXT DEFAULT 'neovim',"
    "    machine TEXT,"
    "    synced INTEGER NOT NULL DEFAULT 0,"
    "    created_at INTEGER NOT NULL DEFAULT 0"
    ");";

constexpr const char *kCreateIndexes =
    "CREATE INDEX IF NOT EXISTS idx_activities_synced ON activities(synced);"
    "CREATE INDEX IF NOT EXISTS idx_activities_started_at ON activities(started_at);";

// Random v4-shaped UUIDs for rows written before client ids existed.
constexpr const char *kBackfillClientIds =
    "UPDATE activities SET client_id = lower("
    "    hex(randomblob(4)) || '-' ||"
    "    hex(randomblob(2)) || '-4' ||"
    "    substr(hex(randomblob(2)), 2) || '-' ||"
    "    substr('89ab', abs(random()) % 4 + 1, 1) ||"
    "    substr(hex(randomblob(2)), 2) || '-' ||"
    "    hex(randomblob(6))"
    ") WHERE client_id IS NULL OR client_id = '';";

constexpr const char *kSelectColumns =
    "SELECT id, client_id, project, git_remote, started_at, ended_at, "
    "filename, filetype, lines_added, lines_removed, git_branch, "
    "actions_per_minute, words_per_minute, editor, machine, synced, created_at "
    "FROM activities ";

std::string sqliteMessage(sqlite3 *db, const std::string &context)
{
    return context + ": " + (db ? sqlite3_errmsg(db) : "no database");
}

class Statement {
public:
    Statement(sqlite3 *db, const char *sql)
    {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) {
            throw StorageFault(sqliteMessage(db, "sqlite prepare failed"));
        }
    }

    ~Statement()
    {
        if (stmt) {
            sqlite3_finalize(stmt);
        }
    }

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return stmt;
    }

private:
    sqlite3_stmt *stmt = nullptr;
};

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw StorageFault(message);
    }
}

// Rolls back unless commit() was reached.
class Transaction {
public:
    explicit Transaction(sqlite3 *db)
        : m_db(db)
    {
        execOrThrow(m_db, "BEGIN IMMEDIATE;");
    }

    ~Transaction()
    {
        if (!m_committed) {
            sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
        }
    }

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void commit()
    {
        execOrThrow(m_db, "COMMIT;");
        m_committed = true;
    }

private:
    sqlite3 *m_db;
    bool m_committed = false;
};

bool columnExists(sqlite3 *db, const std::string &table, const std::string &column)
{
    const std::string sql = "PRAGMA table_info(" + table + ");";
    Statement stmt(db, sql.c_str());

    while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        const char *name = reinterpret_cast<const char *>(sqlite3_column_text(stmt.get(), 1));
        if (name && column == name) {
            return true;
        }
    }
    return false;
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

Activity readActivity(sqlite3_stmt *stmt)
{
    Activity activity;
    activity.id = sqlite3_column_int64(stmt, 0);
    activity.clientId = columnText(stmt, 1);
    activity.project = columnText(stmt, 2);
    activity.gitRemote = columnText(stmt, 3);
    activity.startedAt = fromEpochMillis(sqlite3_column_int64(stmt, 4));
    activity.endedAt = fromEpochMillis(sqlite3_column_int64(stmt, 5));
    activity.filename = columnText(stmt, 6);
    activity.filetype = columnText(stmt, 7);
    activity.linesAdded = sqlite3_column_int(stmt, 8);
    activity.linesRemoved = sqlite3_column_int(stmt, 9);
    activity.gitBranch = columnText(stmt, 10);
    activity.actionsPerMinute = sqlite3_column_double(stmt, 11);
    activity.wordsPerMinute = sqlite3_column_double(stmt, 12);
    activity.editor = columnText(stmt, 13);
    activity.machine = columnText(stmt, 14);
    activity.synced = sqlite3_column_int(stmt, 15) != 0;
    activity.createdAt = fromEpochMillis(sqlite3_column_int64(stmt, 16));
    return activity;
}

// Timestamps written as DATETIME text by older releases:
// "2025-02-15 10:00:00", "2025-02-15 10:00:00.5+01:00",
// "2025-02-15T10:00:00Z" or Go's "2025-02-15 10:00:00 +0000 UTC".
// A missing zone means UTC.
std::optional<std::int64_t> parseLegacyTimestamp(const std::string &value)
{
    static const QRegularExpression pattern(QStringLiteral(
        "^(\\d{4}-\\d{2}-\\d{2})[T ](\\d{2}:\\d{2}:\\d{2})(\\.\\d+)?"
        "\\s*(Z|[+-]\\d{2}:?\\d{2})?(\\s+[A-Za-z]+)?(\\s+m=\\S+)?$"));

    const QRegularExpressionMatch match =
        pattern.match(QString::fromStdString(value).trimmed());
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    QString iso = match.captured(1) + QLatin1Char('T') + match.captured(2);
    const QString fraction = match.captured(3);
    if (!fraction.isEmpty()) {
        iso += fraction.left(4);
    }
    QString zone = match.captured(4);
    if (zone.isEmpty() || zone == QLatin1String("Z")) {
        zone = QStringLiteral("Z");
    } else if (!zone.contains(QLatin1Char(':'))) {
        zone.insert(3, QLatin1Char(':'));
    }
    iso += zone;

    const QDateTime parsed = QDateTime::fromString(iso, Qt::ISODateWithMs);
    if (!parsed.isValid()) {
        return std::nullopt;
    }
    return parsed.toMSecsSinceEpoch();
}

std::int64_t legacyColumnMillis(sqlite3_stmt *stmt, int index, std::int64_t id)
{
    if (sqlite3_column_type(stmt, index) != SQLITE_TEXT) {
        return sqlite3_column_int64(stmt, index);
    }

    const std::string text = columnText(stmt, index);
    if (const auto millis = parseLegacyTimestamp(text)) {
        return *millis;
    }

    BLASTD_LOG_WARN(QStringLiteral("BlastStore"),
                    QStringLiteral("convertLegacyTimestamps"),
                    QStringLiteral("legacy_timestamp_unparseable"),
                    QStringLiteral("schema_upgrade"),
                    QStringLiteral("epoch_zero"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"id", id}, {"value", text}}));
    return 0;
}

// Rewrites DATETIME text columns as epoch milliseconds, all rows or none.
void convertLegacyTimestamps(sqlite3 *db)
{
    constexpr const char *kTextRows =
        "SELECT id, started_at, ended_at, created_at FROM activities "
        "WHERE typeof(started_at) = 'text' OR typeof(ended_at) = 'text' "
        "OR typeof(created_at) = 'text';";

    Transaction transaction(db);
    Statement select(db, kTextRows);
    Statement update(db,
                     "UPDATE activities SET started_at = ?, ended_at = ?, created_at = ? "
                     "WHERE id = ?;");

    int converted = 0;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(select.get())) == SQLITE_ROW) {
        const std::int64_t id = sqlite3_column_int64(select.get(), 0);

        sqlite3_reset(update.get());
        sqlite3_bind_int64(update.get(), 1, legacyColumnMillis(select.get(), 1, id));
        sqlite3_bind_int64(update.get(), 2, legacyColumnMillis(select.get(), 2, id));
        sqlite3_bind_int64(update.get(), 3, legacyColumnMillis(select.get(), 3, id));
        sqlite3_bind_int64(update.get(), 4, id);
        if (sqlite3_step(update.get()) != SQLITE_DONE) {
            throw StorageFault(sqliteMessage(db, "convert legacy timestamps failed"));
        }
        ++converted;
    }
    if (rc != SQLITE_DONE) {
        throw StorageFault(sqliteMessage(db, "read legacy timestamps failed"));
    }

    transaction.commit();

    if (converted > 0) {
        BLASTD_LOG_INFO(QStringLiteral("BlastStore"),
                        QStringLiteral("upgradeSchema"),
                        QStringLiteral("schema_upgrade"),
                        QStringLiteral("legacy_datetime_text"),
                        QStringLiteral("rewrite_epoch_millis"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"rows", converted}}));
    }
}

// Brings tables created by older releases up to the current column set.
void upgradeSchema(sqlite3 *db)
{
    if (!columnExists(db, "activities", "client_id")) {
        BLASTD_LOG_INFO(QStringLiteral("BlastStore"),
                        QStringLiteral("upgradeSchema"),
                        QStringLiteral("schema_upgrade"),
                        QStringLiteral("missing_column"),
                        QStringLiteral("alter_table"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"column", "client_id"}}));
        execOrThrow(db, "ALTER TABLE activities ADD COLUMN client_id TEXT;");
    }
    execOrThrow(db, kBackfillClientIds);

    if (!columnExists(db, "activities", "filename")) {
        execOrThrow(db, "ALTER TABLE activities ADD COLUMN filename TEXT;");
    }

    if (columnExists(db, "activities", "git_commit")
        && !columnExists(db, "activities", "git_branch")) {
        BLASTD_LOG_INFO(QStringLiteral("BlastStore"),
                        QStringLiteral("upgradeSchema"),
                        QStringLiteral("schema_upgrade"),
                        QStringLiteral("legacy_column"),
                        QStringLiteral("rename_column"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"from", "git_commit"}, {"to", "git_branch"}}));
        execOrThrow(db, "ALTER TABLE activities RENAME COLUMN git_commit TO git_branch;");
    }

    if (!columnExists(db, "activities", "created_at")) {
        execOrThrow(db,
                    "ALTER TABLE activities ADD COLUMN created_at INTEGER NOT NULL DEFAULT 0;");
    }

    convertLegacyTimestamps(db);
}

} // namespace

struct BlastStore::Impl {
    sqlite3 *db = nullptr;
    mutable std::mutex mutex;
};

BlastStore::BlastStore(const std::string &dbPath)
    : impl(std::make_unique<Impl>())
{
    const std::filesystem::path path(dbPath);
    if (path.has_parent_path()) {
        std::error_code error;
        std::filesystem::create_directories(path.parent_path(), error);
        if (error) {
            throw StorageFault("failed to create database directory: " + error.message());
        }
    }

    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(dbPath.c_str(), &impl->db, flags, nullptr) != SQLITE_OK) {
        const std::string message = sqliteMessage(impl->db, "failed to open activity database");
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw StorageFault(message);
    }
    sqlite3_busy_timeout(impl->db, kBusyTimeoutMs);

    try {
        execOrThrow(impl->db, kCreateActivitiesTable);
        upgradeSchema(impl->db);
        execOrThrow(impl->db, kCreateIndexes);
    } catch (const StorageFault &) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
        throw;
    }
}

BlastStore::~BlastStore()
{
    if (impl && impl->db) {
        sqlite3_close(impl->db);
        impl->db = nullptr;
    }
}

std::int64_t BlastStore::append(Activity &activity)
{
    if (activity.clientId.empty()) {
        activity.clientId = generateClientId();
    }
    const auto createdAt = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db,
                   "INSERT INTO activities (client_id, project, git_remote, started_at, "
                   "ended_at, filename, filetype, lines_added, lines_removed, git_branch, "
                   "actions_per_minute, words_per_minute, editor, machine, synced, created_at) "
                   "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 0, ?);");
    bindText(stmt.get(), 1, activity.clientId);
    bindText(stmt.get(), 2, activity.project);
    bindText(stmt.get(), 3, activity.gitRemote);
    sqlite3_bind_int64(stmt.get(), 4, toEpochMillis(activity.startedAt));
    sqlite3_bind_int64(stmt.get(), 5, toEpochMillis(activity.endedAt));
    bindText(stmt.get(), 6, activity.filename);
    bindText(stmt.get(), 7, activity.filetype);
    sqlite3_bind_int(stmt.get(), 8, activity.linesAdded);
    sqlite3_bind_int(stmt.get(), 9, activity.linesRemoved);
    bindText(stmt.get(), 10, activity.gitBranch);
    sqlite3_bind_double(stmt.get(), 11, activity.actionsPerMinute);
    sqlite3_bind_double(stmt.get(), 12, activity.wordsPerMinute);
    bindText(stmt.get(), 13, activity.editor);
    bindText(stmt.get(), 14, activity.machine);
    sqlite3_bind_int64(stmt.get(), 15, toEpochMillis(createdAt));

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw StorageFault(sqliteMessage(impl->db, "insert activity failed"));
    }

    activity.id = sqlite3_last_insert_rowid(impl->db);
    activity.synced = false;
    activity.createdAt = fromEpochMillis(toEpochMillis(createdAt));
    return activity.id;
}

std::vector<Activity> BlastStore::unconsumed(int limit) const
{
    std::vector<Activity> activities;
    if (limit <= 0) {
        return activities;
    }

    const std::string sql = std::string(kSelectColumns)
        + "WHERE synced = 0 ORDER BY started_at ASC, id ASC LIMIT ?;";

    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, sql.c_str());
    sqlite3_bind_int(stmt.get(), 1, limit);

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        activities.push_back(readActivity(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        throw StorageFault(sqliteMessage(impl->db, "read unconsumed activities failed"));
    }
    return activities;
}

void BlastStore::markConsumed(const std::vector<std::int64_t> &ids)
{
    if (ids.empty()) {
        return;
    }

    std::lock_guard<std::mutex> lock(impl->mutex);
    Transaction transaction(impl->db);
    Statement stmt(impl->db, "UPDATE activities SET synced = 1 WHERE id = ?;");

    for (const std::int64_t id : ids) {
        sqlite3_reset(stmt.get());
        sqlite3_bind_int64(stmt.get(), 1, id);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            throw StorageFault(sqliteMessage(impl->db, "mark activity consumed failed"));
        }
        if (sqlite3_changes(impl->db) != 1) {
            throw StorageFault("mark activity consumed failed: no activity with id "
                               + std::to_string(id));
        }
    }

    transaction.commit();
}

int BlastStore::countUnconsumed() const
{
    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, "SELECT COUNT(*) FROM activities WHERE synced = 0;");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw StorageFault(sqliteMessage(impl->db, "count activities failed"));
    }
    return sqlite3_column_int(stmt.get(), 0);
}

std::optional<Activity> BlastStore::activity(std::int64_t id) const
{
    const std::string sql = std::string(kSelectColumns) + "WHERE id = ? LIMIT 1;";

    std::lock_guard<std::mutex> lock(impl->mutex);
    Statement stmt(impl->db, sql.c_str());
    sqlite3_bind_int64(stmt.get(), 1, id);

    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return readActivity(stmt.get());
    }
    if (rc != SQLITE_DONE) {
        throw StorageFault(sqliteMessage(impl->db, "read activity failed"));
    }
    return std::nullopt;
}

} // namespace blastd
