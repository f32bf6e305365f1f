#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace MarketStream {
namespace Timestamps {

using UtcMillis = std::chrono::sys_time<std::chrono::milliseconds>;

/**
 * Parse an exchange timestamp into UTC.
 * Accepts "2024-05-01T12:00:00Z", "...+00:00", "...+0800", "2024-05-01 12:00:00",
 * "2024/05/01 12:00", and date-only "2024-05-01" (midnight).
 * One space may separate the time from its zone ("2024-05-01 12:00:00 -05:00").
 * A missing zone is read as UTC. Fractional seconds beyond milliseconds are truncated.
 * @return nullopt when the text is not a recognizable calendar timestamp
 */
std::optional<UtcMillis> parseUtc(std::string_view text);

// "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string formatUtc(UtcMillis tp);

// parseUtc + formatUtc; equal instants always produce identical strings
std::optional<std::string> normalizeToUtc(std::string_view text);

std::string nowUtc();

} // namespace Timestamps
} // namespace MarketStream
