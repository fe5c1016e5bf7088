#pragma once

#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include <QDateTime>
#include <QRegularExpression>
#include <QString>
#include <QUuid>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"

namespace blastd {

inline std::int64_t toEpochMillis(std::chrono::system_clock::time_point timestamp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               timestamp.time_since_epoch())
        .count();
}

inline std::chrono::system_clock::time_point fromEpochMillis(std::int64_t value)
{
    return std::chrono::system_clock::time_point{
        std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::milliseconds{value})};
}

// RFC 3339 in UTC, second precision ("2025-02-15T10:00:00Z").
inline std::string toRfc3339Utc(std::chrono::system_clock::time_point timestamp)
{
    const QDateTime utc =
        QDateTime::fromMSecsSinceEpoch(toEpochMillis(timestamp)).toUTC();
    return utc.toString(Qt::ISODate).toStdString();
}

// Accepts RFC 3339 timestamps only: the zone designator is mandatory,
// fractional seconds are optional and truncated to milliseconds.
inline std::optional<std::chrono::system_clock::time_point> parseRfc3339(
    const std::string &value)
{
    static const QRegularExpression pattern(QStringLiteral(
        "^(\\d{4}-\\d{2}-\\d{2}[Tt]\\d{2}:\\d{2}:\\d{2})(\\.\\d+)?([Zz]|[+-]\\d{2}:\\d{2})$"));

    const QRegularExpressionMatch match =
        pattern.match(QString::fromStdString(value));
    if (!match.hasMatch()) {
        return std::nullopt;
    }

    QString normalized = match.captured(1).toUpper();
    const QString fraction = match.captured(2);
    if (!fraction.isEmpty()) {
        normalized += fraction.left(4);
    }
    const QString zone = match.captured(3).toUpper();
    normalized += zone;

    const QDateTime parsed = QDateTime::fromString(normalized, Qt::ISODateWithMs);
    if (!parsed.isValid()) {
        return std::nullopt;
    }
    return fromEpochMillis(parsed.toMSecsSinceEpoch());
}

inline std::string generateClientId()
{
    return QUuid::createUuid().toString(QUuid::WithoutBraces).toStdString();
}

// Typed field readers for loosely structured client payloads. A missing or
// null field yields the fallback; a field of the wrong JSON type throws.
inline std::string optionalString(const nlohmann::json &j,
                                  const char *key,
                                  const std::string &fallback = std::string())
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_string()) {
        throw ClientInputFault(std::string("field ") + key + " must be a string");
    }
    return it->get<std::string>();
}

inline int optionalInt(const nlohmann::json &j, const char *key, int fallback = 0)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_number_integer()) {
        throw ClientInputFault(std::string("field ") + key + " must be an integer");
    }
    const bool inRange = it->is_number_unsigned()
        ? it->get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
        : it->get<std::int64_t>() >= std::numeric_limits<int>::min()
            && it->get<std::int64_t>() <= std::numeric_limits<int>::max();
    if (!inRange) {
        throw ClientInputFault(std::string("field ") + key + " is out of range");
    }
    return it->get<int>();
}

inline double optionalDouble(const nlohmann::json &j, const char *key, double fallback = 0.0)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_number()) {
        throw ClientInputFault(std::string("field ") + key + " must be a number");
    }
    return it->get<double>();
}

} // namespace blastd
