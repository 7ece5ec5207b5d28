#include "TaskRepository.hpp"
#include "taskledger/Document.hpp"
#include "taskledger/Errors.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using json = nlohmann::json;
using namespace taskledger;

static void expect(bool cond, const std::string& msg) {
    if (!cond) {
        std::cerr << "Test failed: " << msg << std::endl;
        std::exit(1);
    }
}

static RepositoryOptions freshOptions(const std::string& dir) {
    std::filesystem::remove_all(dir);
    RepositoryOptions opts;
    opts.dataFile = dir + "/tasks.json";
    opts.auditFile = dir + "/audit.log";
    return opts;
}

static std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

static void writeFile(const std::string& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

template <typename Fn>
static bool throwsStorage(Fn fn) {
    try {
        fn();
    } catch (const StorageError&) {
        return true;
    }
    return false;
}

template <typename Fn>
static bool throwsValidation(Fn fn) {
    try {
        fn();
    } catch (const ValidationError&) {
        return true;
    }
    return false;
}

template <typename Fn>
static bool throwsIntegrity(Fn fn) {
    try {
        fn();
    } catch (const IntegrityError&) {
        return true;
    }
    return false;
}

static void testInitialDocument() {
    auto opts = freshOptions("testdata_repo/init");
    TaskRepository repo(opts);
    expect(std::filesystem::exists(opts.dataFile), "data file created on construction");
    auto doc = json::parse(readFile(opts.dataFile));
    expect(doc[kRecordsKey].is_array() && doc[kRecordsKey].empty(), "empty record list");
    expect(verifyChecksum(doc), "initial document carries a valid checksum");
    expect(repo.count() == 0 && repo.list().empty(), "no tasks yet");
    expect(repo.verifyIntegrity(), "initial document intact");
    expect(repo.config()["data_file"] == opts.dataFile, "config reports data file");
}

static void testAuthScenario() {
    auto opts = freshOptions("testdata_repo/scenario");
    TaskRepository repo(opts);

    Task auth = Task::create("Implement auth", "JWT login", "Joao", "PENDING", "HIGH");
    auto created = repo.create(auth, "manager");
    expect(created.version() == 1, "created at version 1");

    auto v2 = repo.update(auth.id(), {{TaskField::Status, "IN_PROGRESS"}}, "joao");
    expect(v2 && v2->version() == 2, "status update -> version 2");
    auto v3 = repo.update(auth.id(), {{TaskField::Priority, "CRITICAL"}}, "manager");
    expect(v3 && v3->version() == 3, "priority update -> version 3");

    auto stored = repo.get(auth.id());
    expect(stored && stored->version() == 3, "stored version is 3");
    expect(stored->status() == TaskStatus::InProgress && stored->priority() == TaskPriority::Critical, "stored fields updated");
    expect(stored->createdAt() == auth.createdAt(), "created_at persisted unchanged");

    auto history = repo.history(auth.id());
    expect(history.size() == 3, "history has three entries");
    expect(history[0].operation == AuditOperation::Update, "newest is UPDATE");
    expect(history[1].operation == AuditOperation::Update, "then UPDATE");
    expect(history[2].operation == AuditOperation::Create, "oldest is CREATE");

    const auto& statusChange = history[1].details["changes"];
    expect(statusChange.size() == 1, "status update has one change");
    expect(statusChange["status"]["previous"] == "PENDING", "status previous");
    expect(statusChange["status"]["new"] == "IN_PROGRESS", "status new");
    expect(history[1].details["version"] == 2, "change-set carries version 2");
    expect(history[1].actor == "joao", "actor recorded");
    expect(history[0].details["changes"]["priority"]["new"] == "CRITICAL", "priority change recorded");
    expect(history[2].details["task"]["title"] == "Implement auth", "CREATE carries snapshot");
    expect(history[2].details["task"]["version"] == 1, "CREATE snapshot is version 1");
}

static void testNoOpUpdate() {
    auto opts = freshOptions("testdata_repo/noop");
    TaskRepository repo(opts);
    Task t = Task::create("Docs", "Write docs", "Carlos");
    repo.create(t);

    const auto before = readFile(opts.dataFile);
    auto same = repo.update(t.id(), {{TaskField::Title, "Docs"}, {TaskField::Status, "PENDING"}}, "carlos");
    expect(same && same->version() == 1, "no-op update keeps version");
    expect(*same == t, "no-op update returns the unchanged task");
    expect(readFile(opts.dataFile) == before, "no-op update does not rewrite the file");
    expect(repo.history(t.id()).size() == 1, "no-op update is not audited");

    auto missing = repo.update("no-such-id", {{TaskField::Title, "x"}});
    expect(!missing, "update of unknown id returns nullopt");
    expect(repo.auditLog().query().size() == 1, "not-found update is not audited");
}

static void testInvalidUpdateRejected() {
    auto opts = freshOptions("testdata_repo/invalid");
    TaskRepository repo(opts);
    Task t = Task::create("Docs", "Write docs", "Carlos");
    repo.create(t);
    const auto before = readFile(opts.dataFile);

    bool threw = false;
    try {
        repo.update(t.id(), {{TaskField::Title, "New"}, {TaskField::Status, "ARCHIVED"}});
    } catch (const ValidationError&) {
        threw = true;
    }
    expect(threw, "invalid status raises ValidationError");
    expect(readFile(opts.dataFile) == before, "rejected update leaves the document unchanged");
    expect(repo.get(t.id())->title() == "Docs", "no partial application");
    expect(repo.history(t.id()).size() == 1, "rejected update is not audited");
}

static void testDuplicateId() {
    auto opts = freshOptions("testdata_repo/duplicate");
    TaskRepository repo(opts);
    Task t = Task::create("First", "one", "Ana", "PENDING", "LOW", "fixed-id");
    repo.create(t);
    const auto before = readFile(opts.dataFile);

    bool threw = false;
    try {
        repo.create(Task::create("Second", "two", "Bob", "DONE", "HIGH", "fixed-id"), "bob");
    } catch (const DuplicateIdError& e) {
        threw = e.id() == "fixed-id";
    }
    expect(threw, "duplicate id raises DuplicateIdError");
    expect(readFile(opts.dataFile) == before, "document unchanged after duplicate");
    expect(repo.count() == 1, "still one record");
    expect(repo.history("fixed-id").size() == 1, "duplicate create not audited");
}

static void testListFilters() {
    auto opts = freshOptions("testdata_repo/list");
    TaskRepository repo(opts);
    Task a = Task::create("A", "", "Ana", "PENDING", "HIGH");
    Task b = Task::create("B", "", "Bob", "DONE", "HIGH");
    Task c = Task::create("C", "", "Ana", "DONE", "LOW");
    Task d = Task::create("D", "", "Ana", "PENDING", "HIGH");
    for (const auto& t : {a, b, c, d}) repo.create(t);

    auto all = repo.list();
    expect(all.size() == 4, "list without filter");
    expect(all[0].id() == a.id() && all[3].id() == d.id(), "document order preserved");

    TaskFilter high;
    high.priority = TaskPriority::High;
    expect(repo.list(high).size() == 3, "priority filter");

    TaskFilter anaPendingHigh;
    anaPendingHigh.assignee = "Ana";
    anaPendingHigh.status = TaskStatus::Pending;
    anaPendingHigh.priority = TaskPriority::High;
    auto matched = repo.list(anaPendingHigh);
    expect(matched.size() == 2 && matched[0].id() == a.id() && matched[1].id() == d.id(), "filters combine with AND");

    TaskFilter nobody;
    nobody.assignee = "Zed";
    expect(repo.list(nobody).empty(), "assignee filter with no match");
}

static void testDelete() {
    auto opts = freshOptions("testdata_repo/delete");
    TaskRepository repo(opts);
    Task keep = Task::create("Keep", "", "Ana");
    Task drop = Task::create("Drop", "", "Bob");
    repo.create(keep);
    repo.create(drop);
    repo.update(drop.id(), {{TaskField::Assignee, "Carla"}}, "ana");

    expect(!repo.remove("no-such-id", "ana"), "delete of unknown id returns false");
    expect(repo.auditLog().query().size() == 3, "failed delete is not audited");

    expect(repo.remove(drop.id(), "ana"), "delete existing id");
    expect(repo.count() == 1, "exactly one record removed");
    expect(repo.get(keep.id()).has_value(), "other record kept");
    expect(!repo.get(drop.id()).has_value(), "deleted record gone");

    AuditQuery deletes;
    deletes.operation = AuditOperation::Delete;
    auto entries = repo.auditLog().query(deletes);
    expect(entries.size() == 1, "one DELETE entry");
    expect(entries[0].recordId == drop.id() && entries[0].actor == "ana", "DELETE entry references the record");
    expect(entries[0].details["task"]["assignee"] == "Carla", "DELETE carries the last snapshot");
    expect(entries[0].details["task"]["version"] == 2, "DELETE snapshot has last version");

    auto history = repo.history(drop.id());
    expect(history.size() == 3 && history[0].operation == AuditOperation::Delete, "history ends with DELETE");
    expect(!repo.remove(drop.id(), "ana"), "second delete returns false");
}

static void testPersistenceAcrossInstances() {
    auto opts = freshOptions("testdata_repo/reopen");
    Task t = Task::create("Persist", "across instances", "Ana", "IN_PROGRESS", "CRITICAL");
    {
        TaskRepository repo(opts);
        repo.create(t, "ana");
        repo.update(t.id(), {{TaskField::Description, "still here"}}, "ana");
    }
    TaskRepository reopened(opts);
    auto loaded = reopened.get(t.id());
    expect(loaded.has_value(), "task survives reopening");
    expect(loaded->description() == "still here" && loaded->version() == 2, "latest state survives");
    expect(reopened.history(t.id()).size() == 2, "audit trail survives");
    expect(!std::filesystem::exists(opts.dataFile + ".tmp"), "no temporary file left behind");
}

static void testCorruptionDetected() {
    auto opts = freshOptions("testdata_repo/corrupt");
    TaskRepository repo(opts);
    Task t = Task::create("Implement auth", "JWT login", "Joao", "PENDING", "HIGH");
    repo.create(t);

    auto doc = json::parse(readFile(opts.dataFile));
    doc[kRecordsKey][0]["title"] = "Implement auth (edited by hand)";
    writeFile(opts.dataFile, doc.dump(2));
    const auto corrupted = readFile(opts.dataFile);

    expect(!repo.verifyIntegrity(), "verifyIntegrity reports the mismatch");
    expect(throwsIntegrity([&] { repo.get(t.id()); }), "get fails with IntegrityError");
    expect(throwsIntegrity([&] { repo.list(); }), "list fails with IntegrityError");
    expect(throwsIntegrity([&] { repo.update(t.id(), {{TaskField::Status, "DONE"}}); }), "update fails with IntegrityError");
    expect(throwsIntegrity([&] { repo.remove(t.id()); }), "delete fails with IntegrityError");
    expect(throwsIntegrity([&] { repo.create(Task::create("x", "y", "z")); }), "create fails with IntegrityError");
    expect(readFile(opts.dataFile) == corrupted, "corrupted file is never repaired");
    expect(repo.auditLog().query().size() == 1, "failed operations are not audited");

    // Missing checksum is treated the same way.
    doc.erase(kChecksumKey);
    writeFile(opts.dataFile, doc.dump());
    expect(throwsIntegrity([&] { repo.list(); }), "missing checksum fails");

    // So is a file that is not JSON at all.
    writeFile(opts.dataFile, "{\"records\": [");
    expect(throwsIntegrity([&] { repo.list(); }), "truncated file fails");

    // A consistent checksum over a record that fails validation is still rejected.
    json bad = json::parse(R"({"records":[{"id":"x","title":"t","description":"d","assignee":"a",
        "status":"BLOCKED","priority":"LOW","version":1,
        "created_at":"2026-01-01T00:00:00.000000Z","updated_at":"2026-01-01T00:00:00.000000Z"}]})");
    writeFile(opts.dataFile, sealDocument(bad).dump());
    expect(throwsIntegrity([&] { repo.get("x"); }), "invalid record in sealed document fails");
    expect(throwsIntegrity([&] { repo.count(); }), "count rejects an invalid record too");
}

static void testActorMustBeEncodable() {
    auto opts = freshOptions("testdata_repo/actor");
    TaskRepository repo(opts);
    Task kept = Task::create("Kept", "", "Ana");
    repo.create(kept, "ana");
    const auto before = readFile(opts.dataFile);
    const std::string latin1Actor = "Jo\xe3o";

    Task t = Task::create("Implement auth", "JWT login", "Joao");
    expect(throwsValidation([&] { repo.create(t, latin1Actor); }), "create rejects a non UTF-8 actor");
    expect(!repo.get(t.id()).has_value(), "rejected create is not persisted");
    expect(repo.history(t.id()).empty(), "rejected create is not audited");

    expect(throwsValidation([&] { repo.update(kept.id(), {{TaskField::Status, "DONE"}}, latin1Actor); }),
           "update rejects a non UTF-8 actor");
    expect(throwsValidation([&] { repo.remove(kept.id(), latin1Actor); }), "delete rejects a non UTF-8 actor");
    expect(readFile(opts.dataFile) == before, "document untouched by rejected actors");
    expect(repo.get(kept.id())->version() == 1, "record unchanged");
    expect(repo.auditLog().query().size() == 1, "only the original CREATE is audited");

    auto accented = repo.update(kept.id(), {{TaskField::Status, "DONE"}}, "Jo\xc3\xa3o");
    expect(accented && accented->version() == 2, "UTF-8 actor accepted");
    expect(repo.history(kept.id())[0].actor == "Jo\xc3\xa3o", "UTF-8 actor recorded");
}

static void testFailedSaveKeepsPreviousDocument() {
    namespace fs = std::filesystem;
    auto opts = freshOptions("testdata_repo/storage");
    TaskRepository repo(opts);
    Task t = Task::create("Persisted", "", "Ana");
    repo.create(t, "ana");
    const auto before = readFile(opts.dataFile);

    // A non-empty directory where the temporary file goes cannot be written or removed.
    const std::string tmpPath = opts.dataFile + ".tmp";
    fs::create_directories(tmpPath);
    writeFile(tmpPath + "/blocker", "x");

    expect(throwsStorage([&] { repo.create(Task::create("Lost", "", "Bob"), "bob"); }), "create raises StorageError");
    expect(throwsStorage([&] { repo.update(t.id(), {{TaskField::Status, "DONE"}}, "ana"); }), "update raises StorageError");
    expect(throwsStorage([&] { repo.remove(t.id(), "ana"); }), "delete raises StorageError");
    expect(readFile(opts.dataFile) == before, "previous document left intact");
    expect(repo.verifyIntegrity(), "previous document still verifies");
    expect(repo.auditLog().query().size() == 1, "failed saves are not audited");

    fs::remove_all(tmpPath);
    auto done = repo.update(t.id(), {{TaskField::Status, "DONE"}}, "ana");
    expect(done && done->version() == 2, "saving works again once the path is free");
}

static void testCompactIndent() {
    auto opts = freshOptions("testdata_repo/compact");
    opts.jsonIndent = -1;
    TaskRepository repo(opts);
    repo.create(Task::create("Compact", "", "Ana"));
    auto text = readFile(opts.dataFile);
    expect(text.find('\n') == text.size() - 1, "compact document is a single line");
    expect(verifyChecksum(json::parse(text)), "compact document verifies");
}

int main() {
    testInitialDocument();
    testAuthScenario();
    testNoOpUpdate();
    testInvalidUpdateRejected();
    testDuplicateId();
    testListFilters();
    testDelete();
    testPersistenceAcrossInstances();
    testCorruptionDetected();
    testCompactIndent();
    testActorMustBeEncodable();
    testFailedSaveKeepsPreviousDocument();
    std::filesystem::remove_all("testdata_repo");
    std::cout << "All tests passed." << std::endl;
    return 0;
}
