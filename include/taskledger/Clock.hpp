#pragma once

#include <chrono>
#include <string>

namespace taskledger {

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::microseconds>;

// Current wall-clock time truncated to microseconds, so it survives a text round-trip.
Timestamp now();

// Fixed-width UTC form: 2026-10-19T08:15:02.123456Z
std::string formatTimestamp(Timestamp ts);

// Inverse of formatTimestamp. Also accepts a missing fraction and a missing 'Z'.
// Throws ValidationError on malformed input.
Timestamp parseTimestamp(const std::string& text);

// Random RFC 4122 version 4 identifier.
std::string generateId();

} // namespace taskledger
