#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "taskledger/Clock.hpp"

namespace taskledger {

enum class TaskStatus { Pending, InProgress, Done, Cancelled };
enum class TaskPriority { Low, Medium, High, Critical };

// Fields a caller may change through Task::update. id, version and timestamps are not here.
enum class TaskField { Title, Description, Status, Priority, Assignee };

std::string toString(TaskStatus status);
std::string toString(TaskPriority priority);
std::string toString(TaskField field);

std::optional<TaskStatus> parseStatus(const std::string& text);
std::optional<TaskPriority> parsePriority(const std::string& text);
std::optional<TaskField> parseTaskField(const std::string& name);

// Proposed textual value per field. Status and priority use their wire names (e.g. "IN_PROGRESS").
using FieldChanges = std::map<TaskField, std::string>;

struct FieldChange {
    std::string previous;
    std::string next;
};

// Result of an accepted update; empty when nothing changed.
struct ChangeSet {
    std::map<TaskField, FieldChange> fields;
    uint64_t version = 0;
    Timestamp updatedAt{};

    bool empty() const { return fields.empty(); }

    // {"changes": {field: {"previous", "new"}}, "version": n, "updated_at": ts}
    nlohmann::json toJson() const;
};

class Task {
public:
    Task(std::string title,
         std::string description,
         std::string assignee,
         TaskStatus status = TaskStatus::Pending,
         TaskPriority priority = TaskPriority::Medium,
         std::string id = "");

    // Same as the constructor but takes status/priority as text and validates them.
    static Task create(const std::string& title,
                       const std::string& description,
                       const std::string& assignee,
                       const std::string& status = "PENDING",
                       const std::string& priority = "MEDIUM",
                       const std::string& id = "");

    // Applies every field whose proposed value differs from the current one.
    // All-or-nothing: an invalid status/priority throws ValidationError before anything changes.
    ChangeSet update(const FieldChanges& changes);

    nlohmann::json toJson() const;
    static Task fromJson(const nlohmann::json& j);

    // One-line description for console output.
    std::string summary() const;

    const std::string& id() const { return id_; }
    const std::string& title() const { return title_; }
    const std::string& description() const { return description_; }
    const std::string& assignee() const { return assignee_; }
    TaskStatus status() const { return status_; }
    TaskPriority priority() const { return priority_; }
    uint64_t version() const { return version_; }
    Timestamp createdAt() const { return createdAt_; }
    Timestamp updatedAt() const { return updatedAt_; }

    bool operator==(const Task& other) const;
    bool operator!=(const Task& other) const { return !(*this == other); }

private:
    std::string id_;
    std::string title_;
    std::string description_;
    std::string assignee_;
    TaskStatus status_;
    TaskPriority priority_;
    uint64_t version_ = 1;
    Timestamp createdAt_;
    Timestamp updatedAt_;

    std::string fieldValue(TaskField field) const;
    void setField(TaskField field, const std::string& value);
};

} // namespace taskledger
