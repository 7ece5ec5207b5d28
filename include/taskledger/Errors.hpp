#pragma once

#include <stdexcept>
#include <string>

namespace taskledger {

class TaskLedgerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Invalid status/priority or malformed task fields; raised before anything is applied.
class ValidationError : public TaskLedgerError {
public:
    using TaskLedgerError::TaskLedgerError;
};

class DuplicateIdError : public TaskLedgerError {
public:
    explicit DuplicateIdError(const std::string& id)
        : TaskLedgerError("task with id " + id + " already exists"), id_(id) {}

    const std::string& id() const { return id_; }

private:
    std::string id_;
};

// Checksum missing or mismatched on load. Never repaired automatically.
class IntegrityError : public TaskLedgerError {
public:
    using TaskLedgerError::TaskLedgerError;
};

class StorageError : public TaskLedgerError {
public:
    using TaskLedgerError::TaskLedgerError;
};

} // namespace taskledger
