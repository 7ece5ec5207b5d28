#include "taskledger/Clock.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <random>
#include "taskledger/Errors.hpp"

namespace taskledger {

Timestamp now() {
    return std::chrono::time_point_cast<std::chrono::microseconds>(std::chrono::system_clock::now());
}

std::string formatTimestamp(Timestamp ts) {
    using namespace std::chrono;
    const auto secs = floor<seconds>(ts);
    const auto micros = duration_cast<microseconds>(ts - secs).count();

    std::time_t t = static_cast<std::time_t>(secs.time_since_epoch().count());
    std::tm tm{};
    gmtime_r(&t, &tm);

    char buf[40];
    const size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    std::snprintf(buf + n, sizeof(buf) - n, ".%06lldZ", static_cast<long long>(micros));
    return std::string(buf);
}

namespace {

// "dddd-dd-ddTdd:dd:dd"; sscanf alone would accept signs and blanks in the fields.
bool hasDateTimeLayout(const std::string& text) {
    static const char* kLayout = "dddd-dd-ddTdd:dd:dd";
    if (text.size() < 19) return false;
    for (size_t i = 0; i < 19; ++i) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (kLayout[i] == 'd' ? !std::isdigit(c) : c != static_cast<unsigned char>(kLayout[i])) {
            return false;
        }
    }
    return true;
}

} // namespace

Timestamp parseTimestamp(const std::string& text) {
    if (!hasDateTimeLayout(text)) {
        throw ValidationError("malformed timestamp: " + text);
    }
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6
        || consumed != 19) {
        throw ValidationError("malformed timestamp: " + text);
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        throw ValidationError("timestamp out of range: " + text);
    }

    size_t pos = static_cast<size_t>(consumed);
    long long micros = 0;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            if (digits < 6) {
                micros = micros * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) throw ValidationError("malformed timestamp fraction: " + text);
        for (int i = digits; i < 6; ++i) micros *= 10;
    }
    if (pos < text.size() && text[pos] == 'Z') {
        ++pos;
    } else if (text.compare(pos, std::string::npos, "+00:00") == 0) {
        pos += 6;
    }
    if (pos != text.size()) {
        throw ValidationError("unexpected timestamp suffix: " + text);
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const std::time_t secs = timegm(&tm);

    return Timestamp(std::chrono::seconds(secs) + std::chrono::microseconds(micros));
}

std::string generateId() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    const uint64_t hi = rng();
    const uint64_t lo = rng();

    unsigned char bytes[16];
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<unsigned char>((hi >> (8 * (7 - i))) & 0xFFu);
        bytes[8 + i] = static_cast<unsigned char>((lo >> (8 * (7 - i))) & 0xFFu);
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0Fu) | 0x40u); // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3Fu) | 0x80u); // RFC 4122 variant

    static const char* kHex = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
        out.push_back(kHex[bytes[i] >> 4]);
        out.push_back(kHex[bytes[i] & 0x0F]);
    }
    return out;
}

} // namespace taskledger
