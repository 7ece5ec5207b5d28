#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace taskledger {

inline constexpr const char* kRecordsKey = "records";
inline constexpr const char* kChecksumKey = "checksum";

// Compact serialization of everything except the checksum member. Object keys come
// out sorted, so the bytes do not depend on insertion order.
std::string canonicalContent(const nlohmann::json& document);

// SHA-256 hex over canonicalContent(document).
std::string computeChecksum(const nlohmann::json& document);

// False when the checksum member is absent, not a string, or does not match.
bool verifyChecksum(const nlohmann::json& document);

// Returns a copy of the document with a freshly computed checksum.
nlohmann::json sealDocument(nlohmann::json document);

} // namespace taskledger
