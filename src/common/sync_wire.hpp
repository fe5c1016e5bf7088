#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/models.hpp"

namespace blastd {

// Remote collection protocol (POST /api/activities). Field names are
// camelCase and belong to the remote server, not to local clients.

struct SyncActivityPayload {
    std::string clientUUID;
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
    std::string machine;
};

struct SyncRequestBody {
    std::vector<SyncActivityPayload> activities;
};

struct SyncResponseBody {
    bool success = false;
    int count = 0;
    std::vector<std::string> activityIds;
};

inline SyncActivityPayload toSyncPayload(const Activity &activity, bool metricsOnly)
{
    SyncActivityPayload payload;
    payload.clientUUID = activity.clientId;
    payload.project = metricsOnly ? kRedactedValue : activity.project;
    payload.gitRemote = metricsOnly ? kRedactedValue : activity.gitRemote;
    payload.startedAt = toRfc3339Utc(activity.startedAt);
    payload.endedAt = toRfc3339Utc(activity.endedAt);
    payload.filename = metricsOnly ? std::string() : activity.filename;
    payload.filetype = activity.filetype;
    payload.linesAdded = activity.linesAdded;
    payload.linesRemoved = activity.linesRemoved;
    payload.gitBranch = activity.gitBranch;
    payload.actionsPerMinute = activity.actionsPerMinute;
    payload.wordsPerMinute = activity.wordsPerMinute;
    payload.editor = activity.editor;
    payload.machine = activity.machine;
    return payload;
}

inline void to_json(nlohmann::json &j, const SyncActivityPayload &payload)
{
    j = nlohmann::json{
        {"clientUUID", payload.clientUUID},
        {"startedAt", payload.startedAt},
        {"endedAt", payload.endedAt},
        {"linesAdded", payload.linesAdded},
        {"linesRemoved", payload.linesRemoved},
        {"editor", payload.editor}
    };

    // Optional fields are left out rather than sent empty.
    const auto putString = [&j](const char *key, const std::string &value) {
        if (!value.empty()) {
            j[key] = value;
        }
    };
    putString("project", payload.project);
    putString("gitRemote", payload.gitRemote);
    putString("filename", payload.filename);
    putString("filetype", payload.filetype);
    putString("gitBranch", payload.gitBranch);
    putString("machine", payload.machine);
    if (payload.actionsPerMinute != 0.0) {
        j["actionsPerMinute"] = payload.actionsPerMinute;
    }
    if (payload.wordsPerMinute != 0.0) {
        j["wordsPerMinute"] = payload.wordsPerMinute;
    }
}

inline void to_json(nlohmann::json &j, const SyncRequestBody &body)
{
    j = nlohmann::json{{"activities", body.activities}};
}

// Strict on types: a field present with the wrong type makes the whole
// response malformed. Absent or null fields keep their defaults.
inline void from_json(const nlohmann::json &j, SyncResponseBody &body)
{
    if (!j.is_object()) {
        throw TransientFault("decode response: expected an object");
    }

    auto success = j.find("success");
    if (success != j.end() && !success->is_null()) {
        if (!success->is_boolean()) {
            throw TransientFault("decode response: success must be a boolean");
        }
        body.success = success->get<bool>();
    }

    auto count = j.find("count");
    if (count != j.end() && !count->is_null()) {
        if (!count->is_number_integer()) {
            throw TransientFault("decode response: count must be an integer");
        }
        body.count = count->get<int>();
    }

    body.activityIds.clear();
    auto activities = j.find("activities");
    if (activities == j.end() || activities->is_null()) {
        return;
    }
    if (!activities->is_array()) {
        throw TransientFault("decode response: activities must be an array");
    }
    for (const auto &entry : *activities) {
        if (!entry.is_object()) {
            throw TransientFault("decode response: activity entry must be an object");
        }
        auto id = entry.find("id");
        if (id == entry.end() || id->is_null()) {
            body.activityIds.emplace_back();
        } else if (id->is_string()) {
            body.activityIds.push_back(id->get<std::string>());
        } else {
            throw TransientFault("decode response: activity id must be a string");
        }
    }
}

} // namespace blastd
