#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <QLocalServer>
#include <QString>
#include <QThread>

#include <nlohmann/json.hpp>

#include "common/intake_wire.hpp"
#include "daemon/activity_buffer.hpp"
#include "daemon/sync_rate_limiter.hpp"

namespace blastd {

/**
 * BlastIntakeServer accepts editor clients on a local UNIX socket and
 * speaks line-delimited JSON: one request object per line, one response
 * object per line, in order.
 *
 * Each connection is served by its own thread for its whole lifetime, so
 * a blocking manual sync only stalls the client that asked for it.
 */
class BlastIntakeServer : public QLocalServer
{
    Q_OBJECT
public:
    using SyncTrigger = std::function<void()>;

    BlastIntakeServer(ActivityBuffer &buffer,
                      SyncRateLimiter &rateLimiter,
                      std::string machine,
                      QObject *parent = nullptr);
    ~BlastIntakeServer() override;

    // Runs one drain on behalf of a client; errors are reported back to it.
    // Must be set before start().
    void setSyncTrigger(SyncTrigger trigger);

    // Removes a stale socket file, listens, restricts the file to the owner.
    bool start(const QString &socketPath);

    // Stops accepting, removes the socket file and joins connection threads.
    void stop();

    // Process a single request line without a socket round-trip.
    std::string handleLine(const std::string &line);

    int activeConnections() const;

protected:
    void incomingConnection(quintptr socketDescriptor) override;

private:
    void serveConnection(quintptr socketDescriptor);
    IntakeResponse handleActivity(const nlohmann::json &data);
    IntakeResponse handleSync();

    ActivityBuffer &m_buffer;
    SyncRateLimiter &m_rateLimiter;
    const std::string m_machine;
    SyncTrigger m_syncTrigger;

    QString m_socketPath;
    std::vector<std::unique_ptr<QThread>> m_workers;
    std::atomic<bool> m_stopping{false};
    std::atomic<int> m_activeConnections{0};
};

} // namespace blastd
