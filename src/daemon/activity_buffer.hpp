#pragma once

#include <cstdint>
#include <vector>

#include "common/models.hpp"

namespace blastd {

// Store-and-forward contract shared by the intake server and the sync
// engine. Every operation is atomic on its own; implementations are
// internally synchronized and may be called from any thread.
class ActivityBuffer {
public:
    virtual ~ActivityBuffer() = default;

    // Persists the activity as unconsumed. Assigns id, createdAt and, when
    // empty, clientId on the passed object. Throws StorageFault.
    virtual std::int64_t append(Activity &activity) = 0;

    // Up to `limit` unconsumed activities ordered by startedAt, then id.
    virtual std::vector<Activity> unconsumed(int limit) const = 0;

    // Marks every id consumed, or none of them. Throws StorageFault.
    virtual void markConsumed(const std::vector<std::int64_t> &ids) = 0;
};

} // namespace blastd
