#pragma once

#include <string>

namespace blastd {

struct TransportReply {
    // False when no HTTP response was received at all.
    bool delivered = false;
    int statusCode = 0;
    std::string body;
    std::string error;
};

// Outbound seam of the sync engine: one blocking JSON POST per batch.
class SyncTransport {
public:
    virtual ~SyncTransport() = default;

    virtual TransportReply post(const std::string &url,
                                const std::string &bearerToken,
                                const std::string &jsonBody) = 0;
};

// QNetworkAccessManager-based transport. Each call spins a local event
// loop in the calling thread, so it can be used from any QThread.
class QtHttpTransport : public SyncTransport {
public:
    TransportReply post(const std::string &url,
                        const std::string &bearerToken,
                        const std::string &jsonBody) override;
};

} // namespace blastd
