#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "daemon/activity_buffer.hpp"

namespace blastd {

// BlastStore is the SQLite-backed durable buffer. Consumed rows are kept;
// only the synced flag changes after a confirmed forward.
class BlastStore : public ActivityBuffer {
public:
    explicit BlastStore(const std::string &dbPath);
    ~BlastStore() override;

    BlastStore(const BlastStore &) = delete;
    BlastStore &operator=(const BlastStore &) = delete;

    std::int64_t append(Activity &activity) override;
    std::vector<Activity> unconsumed(int limit) const override;
    void markConsumed(const std::vector<std::int64_t> &ids) override;

    // Diagnostics.
    int countUnconsumed() const;
    std::optional<Activity> activity(std::int64_t id) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl;
};

} // namespace blastd
