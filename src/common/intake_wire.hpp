#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"

namespace blastd {

// Local client protocol: one JSON object per line in each direction.
// Field names are snake_case and must stay independent of the sync wire.

struct IntakeRequest {
    std::string type;
    nlohmann::json data;
};

struct IntakeActivityData {
    std::string project;
    std::string gitRemote;
    std::string startedAt;
    std::string endedAt;
    std::string filename;
    std::string filetype;
    int linesAdded = 0;
    int linesRemoved = 0;
    std::string gitBranch;
    double actionsPerMinute = 0.0;
    double wordsPerMinute = 0.0;
    std::string editor;
};

struct IntakeResponse {
    bool ok = false;
    std::string error;
    std::string message;

    static IntakeResponse success(const std::string &message = std::string())
    {
        return IntakeResponse{true, std::string(), message};
    }

    static IntakeResponse failure(const std::string &error)
    {
        return IntakeResponse{false, error, std::string()};
    }
};

inline void from_json(const nlohmann::json &j, IntakeRequest &request)
{
    if (!j.is_object()) {
        throw ClientInputFault("request must be an object");
    }
    request.type = optionalString(j, "type");
    auto it = j.find("data");
    request.data = it == j.end() ? nlohmann::json() : *it;
}

inline void from_json(const nlohmann::json &j, IntakeActivityData &data)
{
    if (!j.is_object()) {
        throw ClientInputFault("activity data must be an object");
    }
    data.project = optionalString(j, "project");
    data.gitRemote = optionalString(j, "git_remote");
    data.startedAt = optionalString(j, "started_at");
    data.endedAt = optionalString(j, "ended_at");
    data.filename = optionalString(j, "filename");
    data.filetype = optionalString(j, "filetype");
    data.linesAdded = optionalInt(j, "lines_added");
    data.linesRemoved = optionalInt(j, "lines_removed");
    data.gitBranch = optionalString(j, "git_branch");
    data.actionsPerMinute = optionalDouble(j, "actions_per_minute");
    data.wordsPerMinute = optionalDouble(j, "words_per_minute");
    data.editor = optionalString(j, "editor");
}

inline void to_json(nlohmann::json &j, const IntakeResponse &response)
{
    j = nlohmann::json{{"ok", response.ok}};
    if (!response.error.empty()) {
        j["error"] = response.error;
    }
    if (!response.message.empty()) {
        j["message"] = response.message;
    }
}

} // namespace blastd
