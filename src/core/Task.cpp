#include "taskledger/Task.hpp"

#include <sstream>
#include "taskledger/Errors.hpp"

using json = nlohmann::json;

namespace taskledger {

namespace {

const char* kStatusNames = "PENDING, IN_PROGRESS, DONE, CANCELLED";
const char* kPriorityNames = "LOW, MEDIUM, HIGH, CRITICAL";

TaskStatus requireStatus(const std::string& text) {
    auto status = parseStatus(text);
    if (!status) {
        throw ValidationError("invalid status: " + text + ". Use: " + kStatusNames);
    }
    return *status;
}

TaskPriority requirePriority(const std::string& text) {
    auto priority = parsePriority(text);
    if (!priority) {
        throw ValidationError("invalid priority: " + text + ". Use: " + kPriorityNames);
    }
    return *priority;
}

std::string requireString(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        throw ValidationError(std::string("task field '") + key + "' missing or not a string");
    }
    return it->get<std::string>();
}

} // namespace

std::string toString(TaskStatus status) {
    switch (status) {
    case TaskStatus::Pending: return "PENDING";
    case TaskStatus::InProgress: return "IN_PROGRESS";
    case TaskStatus::Done: return "DONE";
    case TaskStatus::Cancelled: return "CANCELLED";
    }
    return "UNKNOWN";
}

std::string toString(TaskPriority priority) {
    switch (priority) {
    case TaskPriority::Low: return "LOW";
    case TaskPriority::Medium: return "MEDIUM";
    case TaskPriority::High: return "HIGH";
    case TaskPriority::Critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

std::string toString(TaskField field) {
    switch (field) {
    case TaskField::Title: return "title";
    case TaskField::Description: return "description";
    case TaskField::Status: return "status";
    case TaskField::Priority: return "priority";
    case TaskField::Assignee: return "assignee";
    }
    return "unknown";
}

std::optional<TaskStatus> parseStatus(const std::string& text) {
    if (text == "PENDING") return TaskStatus::Pending;
    if (text == "IN_PROGRESS") return TaskStatus::InProgress;
    if (text == "DONE") return TaskStatus::Done;
    if (text == "CANCELLED") return TaskStatus::Cancelled;
    return std::nullopt;
}

std::optional<TaskPriority> parsePriority(const std::string& text) {
    if (text == "LOW") return TaskPriority::Low;
    if (text == "MEDIUM") return TaskPriority::Medium;
    if (text == "HIGH") return TaskPriority::High;
    if (text == "CRITICAL") return TaskPriority::Critical;
    return std::nullopt;
}

std::optional<TaskField> parseTaskField(const std::string& name) {
    if (name == "title") return TaskField::Title;
    if (name == "description") return TaskField::Description;
    if (name == "status") return TaskField::Status;
    if (name == "priority") return TaskField::Priority;
    if (name == "assignee") return TaskField::Assignee;
    return std::nullopt;
}

json ChangeSet::toJson() const {
    json changes = json::object();
    for (const auto& kv : fields) {
        changes[toString(kv.first)] = {
            {"previous", kv.second.previous},
            {"new", kv.second.next}
        };
    }
    return {
        {"changes", changes},
        {"version", version},
        {"updated_at", formatTimestamp(updatedAt)}
    };
}

Task::Task(std::string title,
           std::string description,
           std::string assignee,
           TaskStatus status,
           TaskPriority priority,
           std::string id)
    : id_(id.empty() ? generateId() : std::move(id)),
      title_(std::move(title)),
      description_(std::move(description)),
      assignee_(std::move(assignee)),
      status_(status),
      priority_(priority),
      createdAt_(now()),
      updatedAt_(createdAt_) {}

Task Task::create(const std::string& title,
                  const std::string& description,
                  const std::string& assignee,
                  const std::string& status,
                  const std::string& priority,
                  const std::string& id) {
    return Task(title, description, assignee, requireStatus(status), requirePriority(priority), id);
}

std::string Task::fieldValue(TaskField field) const {
    switch (field) {
    case TaskField::Title: return title_;
    case TaskField::Description: return description_;
    case TaskField::Status: return toString(status_);
    case TaskField::Priority: return toString(priority_);
    case TaskField::Assignee: return assignee_;
    }
    return {};
}

void Task::setField(TaskField field, const std::string& value) {
    switch (field) {
    case TaskField::Title: title_ = value; break;
    case TaskField::Description: description_ = value; break;
    case TaskField::Status: status_ = requireStatus(value); break;
    case TaskField::Priority: priority_ = requirePriority(value); break;
    case TaskField::Assignee: assignee_ = value; break;
    }
}

ChangeSet Task::update(const FieldChanges& changes) {
    // Validate everything up front so a bad value leaves the task untouched.
    for (const auto& kv : changes) {
        if (kv.first == TaskField::Status) requireStatus(kv.second);
        if (kv.first == TaskField::Priority) requirePriority(kv.second);
    }

    ChangeSet result;
    for (const auto& kv : changes) {
        std::string current = fieldValue(kv.first);
        if (current != kv.second) {
            result.fields[kv.first] = FieldChange{current, kv.second};
        }
    }
    if (result.empty()) return result;

    for (const auto& kv : result.fields) {
        setField(kv.first, kv.second.next);
    }

    ++version_;
    Timestamp stamp = now();
    if (stamp <= updatedAt_) {
        stamp = updatedAt_ + std::chrono::microseconds(1);
    }
    updatedAt_ = stamp;

    result.version = version_;
    result.updatedAt = updatedAt_;
    return result;
}

json Task::toJson() const {
    return {
        {"id", id_},
        {"title", title_},
        {"description", description_},
        {"status", toString(status_)},
        {"priority", toString(priority_)},
        {"assignee", assignee_},
        {"version", version_},
        {"created_at", formatTimestamp(createdAt_)},
        {"updated_at", formatTimestamp(updatedAt_)}
    };
}

Task Task::fromJson(const json& j) {
    if (!j.is_object()) throw ValidationError("task record is not an object");
    if (requireString(j, "id").empty()) throw ValidationError("task field 'id' is empty");

    Task task = Task::create(requireString(j, "title"),
                             requireString(j, "description"),
                             requireString(j, "assignee"),
                             requireString(j, "status"),
                             requireString(j, "priority"),
                             requireString(j, "id"));

    auto v = j.find("version");
    if (v != j.end()) {
        if (!v->is_number_unsigned() || v->get<uint64_t>() < 1) {
            throw ValidationError("task field 'version' must be a positive integer");
        }
        task.version_ = v->get<uint64_t>();
    }
    task.createdAt_ = parseTimestamp(requireString(j, "created_at"));
    task.updatedAt_ = parseTimestamp(requireString(j, "updated_at"));
    return task;
}

std::string Task::summary() const {
    std::ostringstream out;
    out << "Task(id=" << id_.substr(0, 8)
        << ", title='" << title_ << "'"
        << ", status=" << toString(status_)
        << ", priority=" << toString(priority_)
        << ", assignee='" << assignee_ << "'"
        << ", version=" << version_ << ")";
    return out.str();
}

bool Task::operator==(const Task& other) const {
    return id_ == other.id_
        && title_ == other.title_
        && description_ == other.description_
        && assignee_ == other.assignee_
        && status_ == other.status_
        && priority_ == other.priority_
        && version_ == other.version_
        && createdAt_ == other.createdAt_
        && updatedAt_ == other.updatedAt_;
}

} // namespace taskledger
