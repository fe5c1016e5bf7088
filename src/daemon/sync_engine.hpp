#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "common/shutdown_signal.hpp"
#include "daemon/activity_buffer.hpp"
#include "daemon/sync_transport.hpp"

namespace blastd {

struct SyncEngineOptions {
    std::string serverUrl;
    std::string apiToken;
    std::chrono::milliseconds interval = std::chrono::minutes(10);
    int batchSize = 100;
    bool metricsOnly = false;
    std::chrono::milliseconds minBackoff = std::chrono::seconds(30);
    std::chrono::milliseconds maxBackoff = std::chrono::minutes(30);
};

enum class DrainOutcome {
    Drained,
    SkippedNoCredential,
    Interrupted
};

/**
 * SyncEngine drains the activity buffer to the remote collection endpoint.
 *
 * run() is the long-lived loop: one drain at start, one per interval tick,
 * and a final drain once the shutdown signal fires. syncNow() is the
 * on-demand entry used by the intake server. Drains never overlap.
 */
class SyncEngine {
public:
    SyncEngine(ActivityBuffer &buffer,
               std::unique_ptr<SyncTransport> transport,
               SyncEngineOptions options);
    ~SyncEngine();

    SyncEngine(const SyncEngine &) = delete;
    SyncEngine &operator=(const SyncEngine &) = delete;

    // Blocks until stop() is called and the final drain has finished.
    void run();
    void stop();

    // Sends batches until the backlog is empty. Failures back off and
    // retry; only shutdown ends a drain early.
    DrainOutcome drainBacklog();

    // Throws NoCredential without a token, TransientFault when shutdown
    // interrupted the drain.
    void syncNow();

    // Sends one batch and marks it consumed. Throws TransientFault.
    void forwardBatch(const std::vector<Activity> &activities);

    bool hasCredential() const;
    const SyncEngineOptions &options() const;
    ShutdownSignal &shutdownSignal();

private:
    DrainOutcome drain(std::string &lastError);
    std::string endpointUrl() const;

    ActivityBuffer &m_buffer;
    std::unique_ptr<SyncTransport> m_transport;
    SyncEngineOptions m_options;
    ShutdownSignal m_shutdown;

    std::mutex m_drainMutex;
};

} // namespace blastd
