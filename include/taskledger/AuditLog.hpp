#pragma once

#include <cstddef>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "taskledger/Clock.hpp"

namespace taskledger {

enum class AuditOperation { Create, Update, Delete };

std::string toString(AuditOperation op);
std::optional<AuditOperation> parseAuditOperation(const std::string& text);

inline constexpr const char* kDefaultActor = "system";

struct AuditEntry {
    Timestamp timestamp{};
    AuditOperation operation = AuditOperation::Create;
    std::string recordId;
    std::string actor;
    nlohmann::json details;

    nlohmann::json toJson() const;
};

struct AuditQuery {
    std::optional<std::string> recordId;
    std::optional<AuditOperation> operation;
    // At most this many entries, newest first. 0 yields an empty result.
    std::optional<std::size_t> limit;
};

// Append-only, one JSON object per line. Reads always rescan the file.
class AuditLog {
public:
    explicit AuditLog(const std::string& logPath);
    ~AuditLog();

    AuditLog(const AuditLog&) = delete;
    AuditLog& operator=(const AuditLog&) = delete;

    // Throws StorageError if the line cannot be encoded or written.
    // Without a timestamp the entry is stamped with now().
    void append(AuditOperation operation,
                const std::string& recordId,
                const std::string& actor,
                const nlohmann::json& details,
                std::optional<Timestamp> timestamp = std::nullopt);

    // Newest first. Entries sharing a timestamp come out in reverse append order.
    std::vector<AuditEntry> query(const AuditQuery& filter = {}) const;

    // Truncates the whole log. Maintenance only.
    void clear();

    const std::string& path() const { return logPath_; }

private:
    std::string logPath_;
    std::ofstream stream_;
    mutable std::mutex mutex_;

    void ensureOpen();
};

} // namespace taskledger
