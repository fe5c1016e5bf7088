#pragma once

#include <chrono>
#include <memory>

#include <QObject>
#include <QThread>

#include "daemon/blast_config.hpp"
#include "daemon/blast_store.hpp"
#include "daemon/sync_rate_limiter.hpp"

namespace blastd {

class BlastIntakeServer;
class SyncEngine;
class SyncTransport;

/**
 * BlastDaemon coordinates:
 * - the durable activity buffer (BlastStore)
 * - the intake server accepting editor clients
 * - the sync engine thread forwarding batches to the remote server
 *
 * It is designed to be owned from main() next to Qt's event loop, which
 * accepts intake connections.
 */
class BlastDaemon : public QObject
{
    Q_OBJECT
public:
    // Manual syncs allowed per client-visible window.
    static constexpr int kManualSyncLimit = 10;
    static constexpr std::chrono::minutes kManualSyncWindow{10};

    explicit BlastDaemon(Config config, QObject *parent = nullptr);
    BlastDaemon(Config config,
                std::unique_ptr<SyncTransport> transport,
                QObject *parent = nullptr);
    ~BlastDaemon() override;

    // Binds the intake socket and starts the sync thread. Returns false
    // when the socket cannot be acquired.
    bool start();

    // Broadcasts shutdown, closes the socket and blocks until the sync
    // thread has made its final flush.
    void stop();

    BlastStore &store();
    SyncEngine &syncEngine();
    BlastIntakeServer &intakeServer();

private:
    Config m_config;
    std::unique_ptr<BlastStore> m_store;
    SyncRateLimiter m_rateLimiter;
    std::unique_ptr<SyncEngine> m_syncEngine;
    std::unique_ptr<BlastIntakeServer> m_intakeServer;
    std::unique_ptr<QThread> m_syncThread;
    bool m_running = false;
};

} // namespace blastd
