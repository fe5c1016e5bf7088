#include "daemon/blast_config.hpp"

#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStringList>
#include <QSysInfo>

#include <stdexcept>

namespace blastd {

namespace {

constexpr int kDefaultSyncIntervalMinutes = 10;
constexpr int kDefaultSyncBatchSize = 100;

QStringList candidateConfigPaths()
{
    QStringList paths;
    const QString xdg = qEnvironmentVariable("XDG_CONFIG_HOME");
    if (!xdg.isEmpty()) {
        paths << xdg + QStringLiteral("/blastd/config.ini");
    }
    const QString home = qEnvironmentVariable("HOME");
    if (!home.isEmpty()) {
        paths << home + QStringLiteral("/.config/blastd/config.ini");
    }
    return paths;
}

std::string settingString(const QSettings &settings, const char *key, const std::string &fallback)
{
    const QString name = QString::fromLatin1(key);
    if (!settings.contains(name)) {
        return fallback;
    }
    return settings.value(name).toString().toStdString();
}

int settingInt(const QSettings &settings, const char *key, int fallback)
{
    const QString name = QString::fromLatin1(key);
    if (!settings.contains(name)) {
        return fallback;
    }
    bool ok = false;
    const int value = settings.value(name).toInt(&ok);
    return ok ? value : fallback;
}

bool settingBool(const QSettings &settings, const char *key, bool fallback)
{
    const QString name = QString::fromLatin1(key);
    if (!settings.contains(name)) {
        return fallback;
    }
    const QString value = settings.value(name).toString().trimmed().toLower();
    return value == QLatin1String("true") || value == QLatin1String("1")
        || value == QLatin1String("yes");
}

void applyFile(Config &config, const QString &path)
{
    QSettings settings(path, QSettings::IniFormat);
    if (settings.status() != QSettings::NoError) {
        throw std::runtime_error("failed to read config file " + path.toStdString());
    }

    config.serverUrl = settingString(settings, "server_url", config.serverUrl);
    config.apiToken = settingString(settings, "api_token", config.apiToken);
    config.syncIntervalMinutes =
        settingInt(settings, "sync_interval_minutes", config.syncIntervalMinutes);
    config.syncBatchSize = settingInt(settings, "sync_batch_size", config.syncBatchSize);
    config.socketPath = settingString(settings, "socket_path", config.socketPath);
    config.dbPath = settingString(settings, "db_path", config.dbPath);
    config.machine = settingString(settings, "machine", config.machine);
    config.metricsOnly = settingBool(settings, "metrics_only", config.metricsOnly);
}

void applyEnvironment(Config &config)
{
    const auto overrideWith = [](const char *name, std::string &target) {
        const QString value = qEnvironmentVariable(name);
        if (!value.isEmpty()) {
            target = value.toStdString();
        }
    };
    overrideWith("BLASTD_SERVER_URL", config.serverUrl);
    overrideWith("BLASTD_API_TOKEN", config.apiToken);
    overrideWith("BLASTD_SOCKET_PATH", config.socketPath);
    overrideWith("BLASTD_DB_PATH", config.dbPath);
}

} // namespace

QString defaultDataDir()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/blastd");
    }
    return home + QStringLiteral("/.local/share/blastd");
}

Config defaultConfig()
{
    Config config;
    const QString dataDir = defaultDataDir();
    config.socketPath = (dataDir + QStringLiteral("/blastd.sock")).toStdString();
    config.dbPath = (dataDir + QStringLiteral("/blast.db")).toStdString();
    config.machine = QSysInfo::machineHostName().toStdString();
    return config;
}

Config loadConfig(const QString &explicitPath)
{
    Config config = defaultConfig();

    if (!explicitPath.isEmpty()) {
        if (!QFileInfo::exists(explicitPath)) {
            throw std::runtime_error("config file not found: " + explicitPath.toStdString());
        }
        applyFile(config, explicitPath);
    } else {
        for (const QString &path : candidateConfigPaths()) {
            if (QFileInfo::exists(path)) {
                applyFile(config, path);
                break;
            }
        }
    }

    applyEnvironment(config);

    if (config.syncIntervalMinutes <= 0) {
        config.syncIntervalMinutes = kDefaultSyncIntervalMinutes;
    }
    if (config.syncBatchSize <= 0) {
        config.syncBatchSize = kDefaultSyncBatchSize;
    }

    const QString dataDir = QFileInfo(QString::fromStdString(config.dbPath)).absolutePath();
    if (!QDir().mkpath(dataDir)) {
        throw std::runtime_error("failed to create data directory " + dataDir.toStdString());
    }

    return config;
}

} // namespace blastd
