#pragma once

#include <chrono>
#include <string>

#include <QString>

namespace blastd {

struct Config {
    std::string serverUrl = "https://blast.taigrr.com";
    std::string apiToken;

    int syncIntervalMinutes = 10;
    int syncBatchSize = 100;
    bool metricsOnly = false;
    std::chrono::milliseconds minBackoff = std::chrono::seconds(30);
    std::chrono::milliseconds maxBackoff = std::chrono::minutes(30);

    std::string socketPath;
    std::string dbPath;
    std::string machine;
};

// $HOME/.local/share/blastd
QString defaultDataDir();

Config defaultConfig();

// Defaults, then the first config.ini found (or `explicitPath`), then
// BLASTD_* environment overrides. Creates the database directory.
// Throws std::runtime_error when the file cannot be read.
Config loadConfig(const QString &explicitPath = QString());

} // namespace blastd
