#include "taskledger/Checksum.hpp"
#include "taskledger/Document.hpp"
#include "taskledger/Task.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

using json = nlohmann::json;
using namespace taskledger;

static void expect(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "Test failed: " << msg << std::endl;
        std::exit(1);
    }
}

static json sampleDocument() {
    json records = json::array();
    records.push_back(Task::create("Implement auth", "JWT", "Joao", "PENDING", "HIGH").toJson());
    records.push_back(Task::create("Configure CI", "Pipeline", "Maria", "DONE", "CRITICAL").toJson());
    return json{{kRecordsKey, records}};
}

int main() {
    // Known SHA-256 vectors.
    expect(sha256Hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855", "sha256 of empty input");
    expect(sha256Hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad", "sha256 of abc");

    json doc = sampleDocument();
    json sealed = sealDocument(doc);
    expect(sealed[kChecksumKey].is_string(), "sealed document carries a checksum");
    expect(sealed[kChecksumKey].get<std::string>().size() == 64, "checksum is 64 hex chars");
    expect(verifyChecksum(sealed), "freshly sealed document verifies");

    // The checksum member never takes part in the hash.
    expect(computeChecksum(sealed) == computeChecksum(doc), "checksum excludes itself");

    // Member order does not matter.
    json a = json::parse(R"({"records":[{"b":1,"a":2}],"extra":"x"})");
    json b = json::parse(R"({"extra":"x","records":[{"a":2,"b":1}]})");
    expect(canonicalContent(a) == canonicalContent(b), "canonical form ignores key order");
    expect(computeChecksum(a) == computeChecksum(b), "checksum ignores key order");

    // Any change to the content without resealing must fail verification.
    json tampered = sealed;
    tampered[kRecordsKey][0]["title"] = "Implement auth!";
    expect(!verifyChecksum(tampered), "changed title detected");

    tampered = sealed;
    tampered[kRecordsKey][1]["version"] = 7;
    expect(!verifyChecksum(tampered), "changed version detected");

    tampered = sealed;
    tampered[kRecordsKey].erase(0);
    expect(!verifyChecksum(tampered), "dropped record detected");

    tampered = sealed;
    tampered["note"] = "added";
    expect(!verifyChecksum(tampered), "extra top-level member detected");

    // Resealing after the change makes it valid again.
    expect(verifyChecksum(sealDocument(tampered)), "resealed document verifies");

    json noChecksum = doc;
    expect(!verifyChecksum(noChecksum), "missing checksum fails");
    json wrongType = doc;
    wrongType[kChecksumKey] = 12;
    expect(!verifyChecksum(wrongType), "non-string checksum fails");
    json emptyChecksum = doc;
    emptyChecksum[kChecksumKey] = "";
    expect(!verifyChecksum(emptyChecksum), "empty checksum fails");
    expect(!verifyChecksum(json::array()), "non-object document fails");

    std::cout << "All tests passed." << std::endl;
    return 0;
}
