//TaskRepository.hpp
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "taskledger/AuditLog.hpp"
#include "taskledger/Task.hpp"

namespace taskledger {

struct TaskFilter {
    std::optional<TaskStatus> status;
    std::optional<TaskPriority> priority;
    std::optional<std::string> assignee;
};

struct RepositoryOptions {
    std::string dataFile = "data/tasks.json";
    std::string auditFile = "data/audit.log";
    int jsonIndent = 2;

    // <dir>/tasks.json and <dir>/audit.log, with TASKLEDGER_JSON_INDENT applied.
    static RepositoryOptions fromDataDir(const std::string& dataDir);
};

// Owns the checksummed task document and its audit log. Every public operation
// holds one exclusive lock across load -> mutate -> save.
class TaskRepository {
public:
    using Options = RepositoryOptions;

    explicit TaskRepository(Options options = Options());
    ~TaskRepository();

    TaskRepository(const TaskRepository&) = delete;
    TaskRepository& operator=(const TaskRepository&) = delete;

    // Throws DuplicateIdError if a task with the same id is stored.
    // Mutating calls throw ValidationError for an actor that is not valid UTF-8.
    Task create(const Task& task, const std::string& actor = kDefaultActor);

    std::optional<Task> get(const std::string& id) const;

    std::vector<Task> list(const TaskFilter& filter = {}) const;

    // nullopt if the id is unknown. A no-op update returns the stored task without writing.
    std::optional<Task> update(const std::string& id,
                               const FieldChanges& changes,
                               const std::string& actor = kDefaultActor);

    // False if the id is unknown.
    bool remove(const std::string& id, const std::string& actor = kDefaultActor);

    std::vector<AuditEntry> history(const std::string& id) const;

    // Loads the document and checks its checksum without throwing on mismatch.
    bool verifyIntegrity() const;

    std::size_t count() const;

    nlohmann::json config() const;

    AuditLog& auditLog() { return *audit_; }

private:
    Options options_;
    std::unique_ptr<AuditLog> audit_;
    mutable std::mutex mutex_;

    // Callers hold mutex_.
    nlohmann::json loadDocument() const;
    void saveDocument(nlohmann::json document) const;
    std::vector<Task> decodeRecords(const nlohmann::json& document) const;
};

} // namespace taskledger
