#include "daemon/sync_engine.hpp"

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/sync_wire.hpp"
#include "daemon/backoff.hpp"

namespace blastd {

namespace {

const QString kComponent = QStringLiteral("SyncEngine");

bool isSuccessStatus(int statusCode)
{
    return statusCode >= 200 && statusCode < 300;
}

} // namespace

SyncEngine::SyncEngine(ActivityBuffer &buffer,
                       std::unique_ptr<SyncTransport> transport,
                       SyncEngineOptions options)
    : m_buffer(buffer)
    , m_transport(std::move(transport))
    , m_options(std::move(options))
{
    if (m_options.batchSize <= 0) {
        m_options.batchSize = 100;
    }
}

SyncEngine::~SyncEngine() = default;

void SyncEngine::run()
{
    BLASTD_LOG_INFO(kComponent,
                    QStringLiteral("run"),
                    QStringLiteral("sync_loop_start"),
                    QStringLiteral("daemon_start"),
                    QStringLiteral("interval_timer"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"intervalMs", m_options.interval.count()},
                                    {"batchSize", m_options.batchSize}}));

    drainBacklog();

    while (!m_shutdown.waitFor(m_options.interval)) {
        drainBacklog();
    }

    // Best-effort final flush.
    drainBacklog();

    BLASTD_LOG_INFO(kComponent,
                    QStringLiteral("run"),
                    QStringLiteral("sync_loop_stop"),
                    QStringLiteral("shutdown"),
                    QStringLiteral("shutdown_signal"),
                    logging::defaultWho(),
                    QString(),
                    nlohmann::json::object());
}

void SyncEngine::stop()
{
    m_shutdown.trigger();
}

DrainOutcome SyncEngine::drainBacklog()
{
    std::string lastError;
    return drain(lastError);
}

void SyncEngine::syncNow()
{
    if (!hasCredential()) {
        throw NoCredential();
    }

    std::string lastError;
    if (drain(lastError) == DrainOutcome::Interrupted) {
        std::string message = "sync interrupted by shutdown";
        if (!lastError.empty()) {
            message += ": " + lastError;
        }
        throw TransientFault(message);
    }
}

DrainOutcome SyncEngine::drain(std::string &lastError)
{
    if (!hasCredential()) {
        BLASTD_LOG_INFO(kComponent,
                        QStringLiteral("drainBacklog"),
                        QStringLiteral("sync_skipped"),
                        QStringLiteral("no_api_token"),
                        QStringLiteral("config_check"),
                        logging::defaultWho(),
                        QString(),
                        nlohmann::json::object());
        return DrainOutcome::SkippedNoCredential;
    }

    std::lock_guard<std::mutex> lock(m_drainMutex);
    logging::CorrelationScope corrScope(logging::newCorrelationId());

    // Backoff lives for one drain; a new drain starts from the minimum.
    Backoff backoff(m_options.minBackoff, m_options.maxBackoff);
    int batches = 0;

    for (;;) {
        try {
            const std::vector<Activity> batch = m_buffer.unconsumed(m_options.batchSize);
            if (batch.empty()) {
                break;
            }

            forwardBatch(batch);
            backoff.reset();
            ++batches;

            if (static_cast<int>(batch.size()) < m_options.batchSize) {
                break;
            }
            continue;
        } catch (const StorageFault &ex) {
            lastError = std::string("get unsynced activities: ") + ex.what();
        } catch (const TransientFault &ex) {
            lastError = ex.what();
        }

        const auto delay = backoff.next();
        BLASTD_LOG_WARN(kComponent,
                        QStringLiteral("drainBacklog"),
                        QStringLiteral("sync_batch_failed"),
                        QStringLiteral("transient_fault"),
                        QStringLiteral("exponential_backoff"),
                        logging::defaultWho(),
                        QString(),
                        (nlohmann::json{{"error", lastError},
                                        {"retryInMs", delay.count()}}));

        if (m_shutdown.waitFor(delay)) {
            return DrainOutcome::Interrupted;
        }
    }

    BLASTD_LOG_DEBUG(kComponent,
                     QStringLiteral("drainBacklog"),
                     QStringLiteral("sync_drained"),
                     QStringLiteral("backlog_empty"),
                     QStringLiteral("batch_loop"),
                     logging::defaultWho(),
                     QString(),
                     (nlohmann::json{{"batches", batches}}));
    return DrainOutcome::Drained;
}

void SyncEngine::forwardBatch(const std::vector<Activity> &activities)
{
    if (activities.empty()) {
        return;
    }

    BLASTD_LOG_INFO(kComponent,
                    QStringLiteral("forwardBatch"),
                    QStringLiteral("sync_batch_start"),
                    QStringLiteral("unsynced_backlog"),
                    QStringLiteral("http_post"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"count", activities.size()},
                                    {"metricsOnly", m_options.metricsOnly}}));

    SyncRequestBody request;
    request.activities.reserve(activities.size());
    for (const auto &activity : activities) {
        request.activities.push_back(toSyncPayload(activity, m_options.metricsOnly));
    }

    std::string body;
    try {
        body = nlohmann::json(request).dump();
    } catch (const nlohmann::json::exception &ex) {
        throw TransientFault(std::string("marshal request: ") + ex.what());
    }

    const TransportReply reply = m_transport->post(endpointUrl(), m_options.apiToken, body);
    if (!reply.delivered) {
        throw TransientFault("request failed: " + reply.error);
    }
    if (!isSuccessStatus(reply.statusCode)) {
        throw TransientFault("server returned status " + std::to_string(reply.statusCode));
    }

    SyncResponseBody response;
    try {
        response = nlohmann::json::parse(reply.body).get<SyncResponseBody>();
    } catch (const nlohmann::json::exception &ex) {
        throw TransientFault(std::string("decode response: ") + ex.what());
    }

    if (!response.success) {
        throw TransientFault("server returned success=false");
    }

    std::vector<std::int64_t> ids;
    ids.reserve(activities.size());
    for (const auto &activity : activities) {
        ids.push_back(activity.id);
    }

    try {
        m_buffer.markConsumed(ids);
    } catch (const StorageFault &ex) {
        // The server has the data; the retry relies on clientUUID dedup.
        throw TransientFault(std::string("mark as synced: ") + ex.what());
    }

    BLASTD_LOG_INFO(kComponent,
                    QStringLiteral("forwardBatch"),
                    QStringLiteral("sync_batch_done"),
                    QStringLiteral("server_accepted"),
                    QStringLiteral("http_post"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"count", activities.size()},
                                    {"serverCount", response.count}}));
}

bool SyncEngine::hasCredential() const
{
    return !m_options.apiToken.empty();
}

const SyncEngineOptions &SyncEngine::options() const
{
    return m_options;
}

ShutdownSignal &SyncEngine::shutdownSignal()
{
    return m_shutdown;
}

std::string SyncEngine::endpointUrl() const
{
    std::string base = m_options.serverUrl;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + "/api/activities";
}

} // namespace blastd
