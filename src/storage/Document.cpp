#include "taskledger/Document.hpp"

#include "taskledger/Checksum.hpp"

using json = nlohmann::json;

namespace taskledger {

std::string canonicalContent(const json& document) {
    json content = json::object();
    if (document.is_object()) {
        for (auto it = document.begin(); it != document.end(); ++it) {
            if (it.key() == kChecksumKey) continue;
            content[it.key()] = it.value();
        }
    }
    // nlohmann::json keeps object members in a std::map, so dump() is key-sorted.
    return content.dump();
}

std::string computeChecksum(const json& document) {
    return sha256Hex(canonicalContent(document));
}

bool verifyChecksum(const json& document) {
    if (!document.is_object()) return false;
    auto it = document.find(kChecksumKey);
    if (it == document.end() || !it->is_string()) return false;
    return it->get<std::string>() == computeChecksum(document);
}

json sealDocument(json document) {
    document[kChecksumKey] = computeChecksum(document);
    return document;
}

} // namespace taskledger
