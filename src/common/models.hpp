#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace blastd {

// Editor recorded when the client leaves the field blank.
constexpr const char *kDefaultEditor = "neovim";

// Replacement for identifying fields when metrics-only mode is enabled.
constexpr const char *kRedactedValue = "private";

// One recorded editing interval, as held in the durable buffer.
struct Activity {
    std::int64_t id = 0;
    std::string clientId;

    std::string project;
    std::string gitRemote;
    std::chrono::system_clock::time_point startedAt;
    std::chrono::system_clock::time_point endedAt;
    std::string filename;
    std::string filetype;
    int linesAdded = 0;
    int linesRemoved = 0;
    std::string gitBranch;
    double actionsPerMinute = 0.0;
    double wordsPerMinute = 0.0;
    std::string editor;
    std::string machine;

    bool synced = false;
    std::chrono::system_clock::time_point createdAt;
};

} // namespace blastd
