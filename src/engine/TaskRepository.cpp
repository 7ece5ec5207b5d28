//TaskRepository.cpp
#include "TaskRepository.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>
#include "taskledger/Document.hpp"
#include "taskledger/Errors.hpp"

using json = nlohmann::json;

namespace taskledger {

namespace {

json encodeRecords(const std::vector<Task>& tasks) {
    json records = json::array();
    for (const auto& t : tasks) {
        records.push_back(t.toJson());
    }
    return json{{kRecordsKey, records}};
}

bool matches(const Task& task, const TaskFilter& filter) {
    if (filter.status && task.status() != *filter.status) return false;
    if (filter.priority && task.priority() != *filter.priority) return false;
    if (filter.assignee && task.assignee() != *filter.assignee) return false;
    return true;
}

// The actor is serialized only when the audit line is written, after the save.
// Reject anything that cannot be encoded before the document is touched.
std::string checkedActor(const std::string& actor) {
    try {
        json(actor).dump();
    } catch (const json::exception&) {
        throw ValidationError("actor is not valid UTF-8");
    }
    return actor;
}

} // namespace

RepositoryOptions RepositoryOptions::fromDataDir(const std::string& dataDir) {
    namespace fs = std::filesystem;
    RepositoryOptions opts;
    fs::path dir = dataDir.empty() ? fs::path(".") : fs::path(dataDir);
    opts.dataFile = (dir / "tasks.json").string();
    opts.auditFile = (dir / "audit.log").string();
    if (const char* envIndent = std::getenv("TASKLEDGER_JSON_INDENT")) {
        try { opts.jsonIndent = std::max(-1, std::stoi(envIndent)); } catch (const std::exception&) {
            std::cerr << "TaskRepository: ignoring invalid TASKLEDGER_JSON_INDENT=" << envIndent << "\n";
        }
    }
    return opts;
}

TaskRepository::TaskRepository(Options options) : options_(std::move(options)) {
    namespace fs = std::filesystem;
    if (options_.dataFile.empty()) throw StorageError("TaskRepository: empty data file path");

    fs::path parent = fs::path(options_.dataFile).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw StorageError("TaskRepository: cannot create directory " + parent.string() + ": " + ec.message());
        }
    }

    audit_ = std::make_unique<AuditLog>(options_.auditFile);

    std::cerr << "TaskRepository: dataFile=" << options_.dataFile
              << " auditFile=" << options_.auditFile
              << " indent=" << options_.jsonIndent << "\n";

    std::lock_guard<std::mutex> lk(mutex_);
    if (!fs::exists(options_.dataFile)) {
        saveDocument(encodeRecords({}));
        std::cerr << "TaskRepository: initialized empty document\n";
    }
}

TaskRepository::~TaskRepository() = default;

json TaskRepository::loadDocument() const {
    std::ifstream in(options_.dataFile, std::ios::binary);
    if (!in) {
        if (!std::filesystem::exists(options_.dataFile)) {
            return encodeRecords({});
        }
        throw StorageError("TaskRepository: cannot read " + options_.dataFile);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        throw StorageError("TaskRepository: read failed for " + options_.dataFile);
    }

    auto document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        std::cerr << "TaskRepository: INTEGRITY FAILURE: " << options_.dataFile << " is not a JSON object\n";
        throw IntegrityError("integrity error: " + options_.dataFile + " is not a valid document");
    }
    if (!verifyChecksum(document)) {
        std::cerr << "TaskRepository: INTEGRITY FAILURE: checksum mismatch in " << options_.dataFile << "\n";
        throw IntegrityError("integrity error: corrupted data detected in " + options_.dataFile);
    }
    auto records = document.find(kRecordsKey);
    if (records == document.end() || !records->is_array()) {
        std::cerr << "TaskRepository: INTEGRITY FAILURE: records missing in " << options_.dataFile << "\n";
        throw IntegrityError("integrity error: " + options_.dataFile + " has no record list");
    }
    return document;
}

std::vector<Task> TaskRepository::decodeRecords(const json& document) const {
    std::vector<Task> tasks;
    const auto& records = document.at(kRecordsKey);
    tasks.reserve(records.size());
    for (const auto& r : records) {
        try {
            tasks.push_back(Task::fromJson(r));
        } catch (const ValidationError& e) {
            std::cerr << "TaskRepository: INTEGRITY FAILURE: bad record in " << options_.dataFile << ": " << e.what() << "\n";
            throw IntegrityError(std::string("integrity error: malformed record: ") + e.what());
        }
    }
    return tasks;
}

void TaskRepository::saveDocument(json document) const {
    namespace fs = std::filesystem;
    std::string payload;
    try {
        payload = sealDocument(std::move(document)).dump(options_.jsonIndent);
    } catch (const json::exception& e) {
        throw StorageError(std::string("TaskRepository: cannot serialize document: ") + e.what());
    }
    payload.push_back('\n');

    // Write a sibling file and rename it over the target so readers never see a partial document.
    const std::string tmpPath = options_.dataFile + ".tmp";
    {
        std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
        if (out) {
            out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
            out.flush();
        }
        if (!out) {
            std::cerr << "TaskRepository: failed to write " << tmpPath << "\n";
            std::error_code ignored;
            fs::remove(tmpPath, ignored);
            throw StorageError("TaskRepository: failed to write " + tmpPath);
        }
    }

    // Data must reach the disk before the rename makes it visible.
    int fd = ::open(tmpPath.c_str(), O_RDONLY);
    bool synced = fd >= 0 && ::fsync(fd) == 0;
    if (fd >= 0) ::close(fd);
    if (!synced) {
        std::cerr << "TaskRepository: fsync failed for " << tmpPath << "\n";
        std::error_code ignored;
        fs::remove(tmpPath, ignored);
        throw StorageError("TaskRepository: fsync failed for " + tmpPath);
    }

    std::error_code ec;
    fs::rename(tmpPath, options_.dataFile, ec);
    if (ec) {
        std::cerr << "TaskRepository: rename to " << options_.dataFile << " failed: " << ec.message() << "\n";
        std::error_code ignored;
        fs::remove(tmpPath, ignored);
        throw StorageError("TaskRepository: cannot replace " + options_.dataFile + ": " + ec.message());
    }
}

Task TaskRepository::create(const Task& task, const std::string& actor) {
    const std::string who = checkedActor(actor);
    Timestamp stamp;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto tasks = decodeRecords(loadDocument());
        bool exists = std::any_of(tasks.begin(), tasks.end(), [&](const Task& t) { return t.id() == task.id(); });
        if (exists) throw DuplicateIdError(task.id());
        tasks.push_back(task);
        saveDocument(encodeRecords(tasks));
        stamp = now();
    }
    audit_->append(AuditOperation::Create, task.id(), who, json{{"task", task.toJson()}}, stamp);
    return task;
}

std::optional<Task> TaskRepository::get(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto tasks = decodeRecords(loadDocument());
    auto it = std::find_if(tasks.begin(), tasks.end(), [&](const Task& t) { return t.id() == id; });
    if (it == tasks.end()) return std::nullopt;
    return *it;
}

std::vector<Task> TaskRepository::list(const TaskFilter& filter) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto tasks = decodeRecords(loadDocument());
    std::vector<Task> out;
    for (auto& t : tasks) {
        if (matches(t, filter)) out.push_back(std::move(t));
    }
    return out;
}

std::optional<Task> TaskRepository::update(const std::string& id,
                                           const FieldChanges& changes,
                                           const std::string& actor) {
    const std::string who = checkedActor(actor);
    ChangeSet changeSet;
    std::optional<Task> updated;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto tasks = decodeRecords(loadDocument());
        auto it = std::find_if(tasks.begin(), tasks.end(), [&](const Task& t) { return t.id() == id; });
        if (it == tasks.end()) return std::nullopt;

        changeSet = it->update(changes);
        if (changeSet.empty()) return *it;

        saveDocument(encodeRecords(tasks));
        updated = *it;
    }
    audit_->append(AuditOperation::Update, id, who, changeSet.toJson(), changeSet.updatedAt);
    return updated;
}

bool TaskRepository::remove(const std::string& id, const std::string& actor) {
    const std::string who = checkedActor(actor);
    json snapshot;
    Timestamp stamp;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto tasks = decodeRecords(loadDocument());
        auto it = std::find_if(tasks.begin(), tasks.end(), [&](const Task& t) { return t.id() == id; });
        if (it == tasks.end()) return false;

        snapshot = it->toJson();
        const Timestamp lastUpdate = it->updatedAt();
        tasks.erase(it);
        saveDocument(encodeRecords(tasks));
        // Never older than the record's last UPDATE entry.
        stamp = std::max(now(), lastUpdate);
    }
    audit_->append(AuditOperation::Delete, id, who, json{{"task", snapshot}}, stamp);
    return true;
}

std::vector<AuditEntry> TaskRepository::history(const std::string& id) const {
    AuditQuery q;
    q.recordId = id;
    return audit_->query(q);
}

bool TaskRepository::verifyIntegrity() const {
    std::lock_guard<std::mutex> lk(mutex_);
    try {
        decodeRecords(loadDocument());
    } catch (const IntegrityError&) {
        return false;
    }
    return true;
}

std::size_t TaskRepository::count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return decodeRecords(loadDocument()).size();
}

json TaskRepository::config() const {
    return {
        {"data_file", options_.dataFile},
        {"audit_file", options_.auditFile},
        {"json_indent", options_.jsonIndent}
    };
}

} // namespace taskledger
