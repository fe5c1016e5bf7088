#include "daemon/blast_daemon.hpp"

#include <QDebug>

#include <nlohmann/json.hpp>

#include "common/blastd_version.hpp"
#include "common/logging.hpp"
#include "daemon/blast_intake_server.hpp"
#include "daemon/sync_engine.hpp"
#include "daemon/sync_transport.hpp"

namespace blastd {

namespace {

SyncEngineOptions engineOptions(const Config &config)
{
    SyncEngineOptions options;
    options.serverUrl = config.serverUrl;
    options.apiToken = config.apiToken;
    options.interval = std::chrono::minutes(config.syncIntervalMinutes);
    options.batchSize = config.syncBatchSize;
    options.metricsOnly = config.metricsOnly;
    options.minBackoff = config.minBackoff;
    options.maxBackoff = config.maxBackoff;
    return options;
}

} // namespace

BlastDaemon::BlastDaemon(Config config, QObject *parent)
    : BlastDaemon(std::move(config), std::make_unique<QtHttpTransport>(), parent)
{
}

BlastDaemon::BlastDaemon(Config config,
                         std::unique_ptr<SyncTransport> transport,
                         QObject *parent)
    : QObject(parent)
    , m_config(std::move(config))
    , m_store(std::make_unique<BlastStore>(m_config.dbPath))
    , m_rateLimiter(kManualSyncLimit, kManualSyncWindow)
{
    m_syncEngine = std::make_unique<SyncEngine>(*m_store, std::move(transport),
                                                engineOptions(m_config));
    m_intakeServer = std::make_unique<BlastIntakeServer>(*m_store, m_rateLimiter,
                                                         m_config.machine);
    m_intakeServer->setSyncTrigger([this] { m_syncEngine->syncNow(); });
}

BlastDaemon::~BlastDaemon()
{
    stop();
}

bool BlastDaemon::start()
{
    if (m_running) {
        return true;
    }

    qInfo() << "blastd: daemon starting (version" << BLASTD_VERSION << ")";
    BLASTD_LOG_INFO(QStringLiteral("BlastDaemon"),
                    QStringLiteral("start"),
                    QStringLiteral("daemon_start"),
                    QStringLiteral("user_start"),
                    QStringLiteral("config"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"socket", m_config.socketPath},
                                    {"database", m_config.dbPath},
                                    {"server", m_config.serverUrl},
                                    {"syncIntervalMinutes", m_config.syncIntervalMinutes},
                                    {"batchSize", m_config.syncBatchSize},
                                    {"metricsOnly", m_config.metricsOnly},
                                    {"hasToken", !m_config.apiToken.empty()}}));

    if (!m_intakeServer->start(QString::fromStdString(m_config.socketPath))) {
        BLASTD_LOG_ERROR(QStringLiteral("BlastDaemon"),
                         QStringLiteral("start"),
                         QStringLiteral("daemon_start_failed"),
                         QStringLiteral("socket_unavailable"),
                         QStringLiteral("local_socket"),
                         logging::defaultWho(),
                         QString(),
                         (nlohmann::json{{"socket", m_config.socketPath}}));
        return false;
    }

    m_syncThread.reset(QThread::create([this] { m_syncEngine->run(); }));
    m_syncThread->start();
    m_running = true;
    return true;
}

void BlastDaemon::stop()
{
    if (!m_running) {
        return;
    }
    m_running = false;

    qInfo() << "blastd: stopping daemon...";
    m_syncEngine->stop();
    m_intakeServer->stop();
    if (m_syncThread) {
        m_syncThread->wait();
        m_syncThread.reset();
    }
}

BlastStore &BlastDaemon::store()
{
    return *m_store;
}

SyncEngine &BlastDaemon::syncEngine()
{
    return *m_syncEngine;
}

BlastIntakeServer &BlastDaemon::intakeServer()
{
    return *m_intakeServer;
}

} // namespace blastd
