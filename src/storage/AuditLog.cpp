#include "taskledger/AuditLog.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include "taskledger/Errors.hpp"

using json = nlohmann::json;

namespace taskledger {

std::string toString(AuditOperation op) {
    switch (op) {
    case AuditOperation::Create: return "CREATE";
    case AuditOperation::Update: return "UPDATE";
    case AuditOperation::Delete: return "DELETE";
    }
    return "UNKNOWN";
}

std::optional<AuditOperation> parseAuditOperation(const std::string& text) {
    if (text == "CREATE") return AuditOperation::Create;
    if (text == "UPDATE") return AuditOperation::Update;
    if (text == "DELETE") return AuditOperation::Delete;
    return std::nullopt;
}

json AuditEntry::toJson() const {
    return {
        {"timestamp", formatTimestamp(timestamp)},
        {"operation", toString(operation)},
        {"record_id", recordId},
        {"actor", actor},
        {"details", details}
    };
}

AuditLog::AuditLog(const std::string& logPath) : logPath_(logPath) {
    namespace fs = std::filesystem;
    fs::path parent = fs::path(logPath_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw StorageError("AuditLog: cannot create directory " + parent.string() + ": " + ec.message());
        }
    }
    ensureOpen();
    if (!stream_) {
        throw StorageError("AuditLog: cannot open " + logPath_);
    }
}

AuditLog::~AuditLog() {
    if (stream_.is_open()) {
        stream_.flush();
        stream_.close();
    }
}

void AuditLog::ensureOpen() {
    if (!stream_.is_open()) {
        stream_.clear();
        stream_.open(logPath_, std::ios::binary | std::ios::app);
    }
}

void AuditLog::append(AuditOperation operation,
                      const std::string& recordId,
                      const std::string& actor,
                      const json& details,
                      std::optional<Timestamp> timestamp) {
    AuditEntry entry{timestamp ? *timestamp : now(), operation, recordId,
                     actor.empty() ? kDefaultActor : actor, details};
    std::string line;
    try {
        line = entry.toJson().dump() + "\n";
    } catch (const json::exception& e) {
        std::cerr << "AuditLog: cannot encode entry for " << recordId << ": " << e.what() << "\n";
        throw StorageError(std::string("AuditLog: cannot encode entry: ") + e.what());
    }

    std::lock_guard<std::mutex> lk(mutex_);
    ensureOpen();
    if (!stream_) {
        throw StorageError("AuditLog: stream not good for " + logPath_);
    }
    stream_.write(line.data(), static_cast<std::streamsize>(line.size()));
    stream_.flush();
    if (!stream_) {
        std::cerr << "AuditLog: write failed for " << logPath_ << "\n";
        stream_.close();
        throw StorageError("AuditLog: write failed for " + logPath_);
    }
}

std::vector<AuditEntry> AuditLog::query(const AuditQuery& filter) const {
    std::vector<AuditEntry> results;

    std::lock_guard<std::mutex> lk(mutex_);
    std::ifstream in(logPath_, std::ios::binary);
    if (!in) {
        if (!std::filesystem::exists(logPath_)) return results;
        throw StorageError("AuditLog: cannot read " + logPath_);
    }

    std::string line;
    size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        if (line.empty()) continue;

        auto rec = json::parse(line, nullptr, false);
        if (rec.is_discarded() || !rec.is_object()) {
            std::cerr << "AuditLog: invalid JSON at line " << lineNo << "; skipping\n";
            continue;
        }

        AuditEntry entry;
        try {
            auto op = parseAuditOperation(rec.value("operation", ""));
            if (!op) {
                std::cerr << "AuditLog: unknown operation at line " << lineNo << "; skipping\n";
                continue;
            }
            entry.operation = *op;
            entry.timestamp = parseTimestamp(rec.at("timestamp").get<std::string>());
            entry.recordId = rec.at("record_id").get<std::string>();
            entry.actor = rec.value("actor", std::string(kDefaultActor));
            entry.details = rec.value("details", json::object());
        } catch (const std::exception& e) {
            std::cerr << "AuditLog: malformed entry at line " << lineNo << " (" << e.what() << "); skipping\n";
            continue;
        }

        if (filter.recordId && entry.recordId != *filter.recordId) continue;
        if (filter.operation && entry.operation != *filter.operation) continue;
        results.push_back(std::move(entry));
    }
    if (in.bad()) {
        throw StorageError("AuditLog: read failed for " + logPath_);
    }

    // Reverse file order first so the stable sort puts later appends ahead on equal timestamps.
    std::reverse(results.begin(), results.end());
    std::stable_sort(results.begin(), results.end(), [](const AuditEntry& a, const AuditEntry& b) {
        return a.timestamp > b.timestamp;
    });

    if (filter.limit && results.size() > *filter.limit) {
        results.resize(*filter.limit);
    }
    return results;
}

void AuditLog::clear() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (stream_.is_open()) stream_.close();
    {
        std::ofstream truncStream(logPath_, std::ios::binary | std::ios::trunc | std::ios::out);
        if (!truncStream) {
            std::cerr << "AuditLog: failed to truncate " << logPath_ << "\n";
            throw StorageError("AuditLog: failed to truncate " + logPath_);
        }
    }
    ensureOpen();
}

} // namespace taskledger
