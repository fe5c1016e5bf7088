#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <chrono>
#include <filesystem>
#include <set>

#include <sqlite3.h>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "daemon/blast_store.hpp"

namespace {

std::chrono::system_clock::time_point at(int seconds)
{
    return std::chrono::system_clock::time_point{std::chrono::seconds{1739613600 + seconds}};
}

blastd::Activity makeActivity(int startOffset, const std::string &project = "blast")
{
    blastd::Activity activity;
    activity.project = project;
    activity.gitRemote = "git@github.com:taigrr/blast.git";
    activity.startedAt = at(startOffset);
    activity.endedAt = at(startOffset + 60);
    activity.filename = "main.go";
    activity.filetype = "go";
    activity.linesAdded = 3;
    activity.linesRemoved = 1;
    activity.gitBranch = "main";
    activity.actionsPerMinute = 42.5;
    activity.wordsPerMinute = 61.0;
    activity.editor = "neovim";
    activity.machine = "workstation";
    return activity;
}

} // namespace

class StoreTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testAppendAssignsIdentity();
    void testAppendKeepsClientId();
    void testFieldsPersist();
    void testUnconsumedOrdering();
    void testUnconsumedLimit();
    void testMarkConsumedHidesActivities();
    void testMarkConsumedAllOrNothing();
    void testMarkConsumedEmptyIsNoop();
    void testPersistsAcrossReopen();
    void testLegacySchemaUpgrade();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    std::string dbPath() const;
};

void StoreTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void StoreTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void StoreTests::init()
{
    std::error_code error;
    std::filesystem::remove(dbPath(), error);
}

std::string StoreTests::dbPath() const
{
    return (m_tempDir.path() + QStringLiteral("/data/blast.db")).toStdString();
}

void StoreTests::testAppendAssignsIdentity()
{
    blastd::BlastStore store(dbPath());

    auto first = makeActivity(0);
    auto second = makeActivity(10);
    const auto firstId = store.append(first);
    const auto secondId = store.append(second);

    QVERIFY(firstId > 0);
    QVERIFY(secondId > firstId);
    QCOMPARE(first.id, firstId);
    QVERIFY(!first.clientId.empty());
    QVERIFY(!second.clientId.empty());
    QVERIFY(first.clientId != second.clientId);
    QVERIFY(!first.synced);
}

void StoreTests::testAppendKeepsClientId()
{
    blastd::BlastStore store(dbPath());

    auto activity = makeActivity(0);
    activity.clientId = "client-token-1";
    const auto id = store.append(activity);

    const auto stored = store.activity(id);
    QVERIFY(stored.has_value());
    QCOMPARE(QString::fromStdString(stored->clientId), QStringLiteral("client-token-1"));
}

void StoreTests::testFieldsPersist()
{
    blastd::BlastStore store(dbPath());

    auto activity = makeActivity(5);
    const auto id = store.append(activity);

    const auto stored = store.activity(id);
    QVERIFY(stored.has_value());
    QCOMPARE(QString::fromStdString(stored->project), QStringLiteral("blast"));
    QCOMPARE(QString::fromStdString(stored->gitBranch), QStringLiteral("main"));
    QCOMPARE(QString::fromStdString(stored->machine), QStringLiteral("workstation"));
    QCOMPARE(stored->linesAdded, 3);
    QCOMPARE(stored->linesRemoved, 1);
    QCOMPARE(stored->actionsPerMinute, 42.5);
    QVERIFY(stored->startedAt == at(5));
    QVERIFY(stored->endedAt == at(65));
    QVERIFY(!stored->synced);
    QVERIFY(stored->createdAt.time_since_epoch().count() > 0);
}

void StoreTests::testUnconsumedOrdering()
{
    blastd::BlastStore store(dbPath());

    auto late = makeActivity(300, "late");
    auto early = makeActivity(0, "early");
    auto tieA = makeActivity(100, "tie-a");
    auto tieB = makeActivity(100, "tie-b");
    store.append(late);
    store.append(early);
    store.append(tieA);
    store.append(tieB);

    const auto activities = store.unconsumed(10);
    QCOMPARE(static_cast<int>(activities.size()), 4);
    QCOMPARE(QString::fromStdString(activities[0].project), QStringLiteral("early"));
    QCOMPARE(QString::fromStdString(activities[1].project), QStringLiteral("tie-a"));
    QCOMPARE(QString::fromStdString(activities[2].project), QStringLiteral("tie-b"));
    QCOMPARE(QString::fromStdString(activities[3].project), QStringLiteral("late"));
    QVERIFY(activities[1].id < activities[2].id);
}

void StoreTests::testUnconsumedLimit()
{
    blastd::BlastStore store(dbPath());
    for (int i = 0; i < 5; ++i) {
        auto activity = makeActivity(i);
        store.append(activity);
    }

    QCOMPARE(static_cast<int>(store.unconsumed(3).size()), 3);
    QCOMPARE(static_cast<int>(store.unconsumed(10).size()), 5);
    QVERIFY(store.unconsumed(0).empty());
}

void StoreTests::testMarkConsumedHidesActivities()
{
    blastd::BlastStore store(dbPath());

    std::vector<std::int64_t> ids;
    for (int i = 0; i < 4; ++i) {
        auto activity = makeActivity(i);
        ids.push_back(store.append(activity));
    }

    store.markConsumed({ids[0], ids[2]});

    const auto remaining = store.unconsumed(10);
    QCOMPARE(static_cast<int>(remaining.size()), 2);
    std::set<std::int64_t> remainingIds;
    for (const auto &activity : remaining) {
        QVERIFY(!activity.synced);
        remainingIds.insert(activity.id);
    }
    QVERIFY(remainingIds.count(ids[1]) == 1);
    QVERIFY(remainingIds.count(ids[3]) == 1);

    const auto consumed = store.activity(ids[0]);
    QVERIFY(consumed.has_value());
    QVERIFY(consumed->synced);
    QCOMPARE(store.countUnconsumed(), 2);
}

void StoreTests::testMarkConsumedAllOrNothing()
{
    blastd::BlastStore store(dbPath());

    auto first = makeActivity(0);
    auto second = makeActivity(1);
    const auto firstId = store.append(first);
    const auto secondId = store.append(second);

    bool threw = false;
    try {
        store.markConsumed({firstId, secondId + 1000, secondId});
    } catch (const blastd::StorageFault &) {
        threw = true;
    }
    QVERIFY(threw);
    QCOMPARE(store.countUnconsumed(), 2);
    QVERIFY(!store.activity(firstId)->synced);
    QVERIFY(!store.activity(secondId)->synced);
}

void StoreTests::testMarkConsumedEmptyIsNoop()
{
    blastd::BlastStore store(dbPath());
    auto activity = makeActivity(0);
    store.append(activity);

    store.markConsumed({});
    QCOMPARE(store.countUnconsumed(), 1);
}

void StoreTests::testPersistsAcrossReopen()
{
    std::int64_t id = 0;
    {
        blastd::BlastStore store(dbPath());
        auto activity = makeActivity(0);
        id = store.append(activity);
        auto other = makeActivity(1);
        store.append(other);
        store.markConsumed({id});
    }

    {
        blastd::BlastStore store(dbPath());
        QCOMPARE(store.countUnconsumed(), 1);
        QVERIFY(store.activity(id)->synced);

        auto next = makeActivity(2);
        QVERIFY(store.append(next) > id + 1);
    }
}

void StoreTests::testLegacySchemaUpgrade()
{
    const std::filesystem::path path(dbPath());
    std::filesystem::create_directories(path.parent_path());

    // Schema and value formats of databases written by earlier releases.
    sqlite3 *db = nullptr;
    QCOMPARE(sqlite3_open(path.string().c_str(), &db), SQLITE_OK);
    const char *legacy =
        "CREATE TABLE activities ("
        "    id INTEGER PRIMARY KEY AUTOINCREMENT,"
        "    project TEXT,"
        "    git_remote TEXT,"
        "    started_at DATETIME NOT NULL,"
        "    ended_at DATETIME NOT NULL,"
        "    filetype TEXT,"
        "    lines_added INTEGER DEFAULT 0,"
        "    lines_removed INTEGER DEFAULT 0,"
        "    git_commit TEXT,"
        "    actions_per_minute REAL,"
        "    words_per_minute REAL,"
        "    editor TEXT DEFAULT 'neovim',"
        "    machine TEXT,"
        "    synced BOOLEAN DEFAULT FALSE,"
        "    created_at DATETIME DEFAULT CURRENT_TIMESTAMP"
        ");"
        "CREATE INDEX IF NOT EXISTS idx_activities_synced ON activities(synced);"
        "CREATE INDEX IF NOT EXISTS idx_activities_started_at ON activities(started_at);"
        "INSERT INTO activities (project, started_at, ended_at, git_commit, created_at) "
        "VALUES ('late', '2025-02-15 12:00:00+00:00', '2025-02-15 12:05:00.250+00:00', "
        "'feature/x', '2025-02-15 12:05:01');"
        "INSERT INTO activities (project, started_at, ended_at, synced) "
        "VALUES ('early', '2025-02-15 09:30:00 +0100 CET', '2025-02-15 08:45:00 +0000 UTC', 0);";
    QCOMPARE(sqlite3_exec(db, legacy, nullptr, nullptr, nullptr), SQLITE_OK);
    sqlite3_close(db);

    blastd::BlastStore store(dbPath());

    // Written after the upgrade; starts between the two legacy rows.
    auto fresh = makeActivity(3600);
    const auto freshId = store.append(fresh);

    const auto activities = store.unconsumed(10);
    QCOMPARE(static_cast<int>(activities.size()), 3);

    QCOMPARE(QString::fromStdString(activities[0].project), QStringLiteral("early"));
    QCOMPARE(QString::fromStdString(blastd::toRfc3339Utc(activities[0].startedAt)),
             QStringLiteral("2025-02-15T08:30:00Z"));
    QCOMPARE(QString::fromStdString(blastd::toRfc3339Utc(activities[0].endedAt)),
             QStringLiteral("2025-02-15T08:45:00Z"));

    QCOMPARE(activities[1].id, freshId);

    const auto &late = activities[2];
    QCOMPARE(QString::fromStdString(late.project), QStringLiteral("late"));
    QCOMPARE(QString::fromStdString(late.gitBranch), QStringLiteral("feature/x"));
    QCOMPARE(static_cast<int>(late.clientId.size()), 36);
    QCOMPARE(static_cast<qint64>(blastd::toEpochMillis(late.startedAt)), qint64(1739620800000));
    QCOMPARE(static_cast<qint64>(blastd::toEpochMillis(late.endedAt)), qint64(1739621100250));
    QCOMPARE(QString::fromStdString(blastd::toRfc3339Utc(late.createdAt)),
             QStringLiteral("2025-02-15T12:05:01Z"));

    QVERIFY(freshId > late.id);
}

QTEST_MAIN(StoreTests)
#include "test_store.moc"
