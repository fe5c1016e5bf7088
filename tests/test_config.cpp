#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <stdexcept>

#include "daemon/blast_config.hpp"

namespace {

void writeIni(const QString &path, const QByteArray &content)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(content);
    }
}

} // namespace

class ConfigTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();

    void testDefaults();
    void testUserConfigFile();
    void testXdgConfigPreferred();
    void testExplicitConfigFile();
    void testMissingExplicitFileThrows();
    void testEnvironmentOverridesFile();
    void testInvalidNumbersFallBack();
    void testCreatesDatabaseDirectory();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    QByteArray m_prevXdg;
};

void ConfigTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    m_prevXdg = qgetenv("XDG_CONFIG_HOME");
}

void ConfigTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
    if (m_prevXdg.isEmpty()) {
        qunsetenv("XDG_CONFIG_HOME");
    } else {
        qputenv("XDG_CONFIG_HOME", m_prevXdg);
    }
}

void ConfigTests::init()
{
    static int counter = 0;
    const QString home = m_tempDir.path() + QStringLiteral("/home-%1").arg(++counter);
    QVERIFY(QDir().mkpath(home));
    qputenv("HOME", home.toUtf8());
    qunsetenv("XDG_CONFIG_HOME");
    qunsetenv("BLASTD_SERVER_URL");
    qunsetenv("BLASTD_API_TOKEN");
    qunsetenv("BLASTD_SOCKET_PATH");
    qunsetenv("BLASTD_DB_PATH");
}

void ConfigTests::testDefaults()
{
    const QString home = qEnvironmentVariable("HOME");
    const blastd::Config config = blastd::loadConfig();

    QCOMPARE(QString::fromStdString(config.serverUrl), QStringLiteral("https://blast.taigrr.com"));
    QVERIFY(config.apiToken.empty());
    QCOMPARE(config.syncIntervalMinutes, 10);
    QCOMPARE(config.syncBatchSize, 100);
    QVERIFY(!config.metricsOnly);
    QCOMPARE(QString::fromStdString(config.socketPath),
             home + QStringLiteral("/.local/share/blastd/blastd.sock"));
    QCOMPARE(QString::fromStdString(config.dbPath),
             home + QStringLiteral("/.local/share/blastd/blast.db"));
    QCOMPARE(QString::fromStdString(config.machine), QSysInfo::machineHostName());
}

void ConfigTests::testUserConfigFile()
{
    const QString home = qEnvironmentVariable("HOME");
    writeIni(home + QStringLiteral("/.config/blastd/config.ini"),
             "server_url=http://localhost:8080\n"
             "api_token=abc123\n"
             "sync_interval_minutes=5\n"
             "sync_batch_size=25\n"
             "machine=laptop\n"
             "metrics_only=true\n");

    const blastd::Config config = blastd::loadConfig();
    QCOMPARE(QString::fromStdString(config.serverUrl), QStringLiteral("http://localhost:8080"));
    QCOMPARE(QString::fromStdString(config.apiToken), QStringLiteral("abc123"));
    QCOMPARE(config.syncIntervalMinutes, 5);
    QCOMPARE(config.syncBatchSize, 25);
    QCOMPARE(QString::fromStdString(config.machine), QStringLiteral("laptop"));
    QVERIFY(config.metricsOnly);
}

void ConfigTests::testXdgConfigPreferred()
{
    const QString home = qEnvironmentVariable("HOME");
    const QString xdg = home + QStringLiteral("/xdg");
    qputenv("XDG_CONFIG_HOME", xdg.toUtf8());
    writeIni(xdg + QStringLiteral("/blastd/config.ini"), "api_token=from-xdg\n");
    writeIni(home + QStringLiteral("/.config/blastd/config.ini"), "api_token=from-home\n");

    QCOMPARE(QString::fromStdString(blastd::loadConfig().apiToken), QStringLiteral("from-xdg"));
}

void ConfigTests::testExplicitConfigFile()
{
    const QString path = qEnvironmentVariable("HOME") + QStringLiteral("/custom.ini");
    writeIni(path, "socket_path=/tmp/blastd-custom.sock\n");

    const blastd::Config config = blastd::loadConfig(path);
    QCOMPARE(QString::fromStdString(config.socketPath), QStringLiteral("/tmp/blastd-custom.sock"));
}

void ConfigTests::testMissingExplicitFileThrows()
{
    bool threw = false;
    try {
        blastd::loadConfig(qEnvironmentVariable("HOME") + QStringLiteral("/missing.ini"));
    } catch (const std::runtime_error &) {
        threw = true;
    }
    QVERIFY(threw);
}

void ConfigTests::testEnvironmentOverridesFile()
{
    const QString home = qEnvironmentVariable("HOME");
    writeIni(home + QStringLiteral("/.config/blastd/config.ini"),
             "api_token=from-file\nserver_url=http://file.test\n");
    qputenv("BLASTD_API_TOKEN", "from-env");
    qputenv("BLASTD_DB_PATH", (home + QStringLiteral("/env/data.db")).toUtf8());
    qputenv("BLASTD_SOCKET_PATH", (home + QStringLiteral("/env/blastd.sock")).toUtf8());

    const blastd::Config config = blastd::loadConfig();
    QCOMPARE(QString::fromStdString(config.apiToken), QStringLiteral("from-env"));
    QCOMPARE(QString::fromStdString(config.serverUrl), QStringLiteral("http://file.test"));
    QCOMPARE(QString::fromStdString(config.dbPath), home + QStringLiteral("/env/data.db"));
    QCOMPARE(QString::fromStdString(config.socketPath), home + QStringLiteral("/env/blastd.sock"));
}

void ConfigTests::testInvalidNumbersFallBack()
{
    const QString home = qEnvironmentVariable("HOME");
    writeIni(home + QStringLiteral("/.config/blastd/config.ini"),
             "sync_interval_minutes=0\nsync_batch_size=lots\n");

    const blastd::Config config = blastd::loadConfig();
    QCOMPARE(config.syncIntervalMinutes, 10);
    QCOMPARE(config.syncBatchSize, 100);
}

void ConfigTests::testCreatesDatabaseDirectory()
{
    const QString dir = qEnvironmentVariable("HOME") + QStringLiteral("/nested/state");
    qputenv("BLASTD_DB_PATH", (dir + QStringLiteral("/blast.db")).toUtf8());

    blastd::loadConfig();
    QVERIFY(QFileInfo(dir).isDir());
}

QTEST_MAIN(ConfigTests)
#include "test_config.moc"
