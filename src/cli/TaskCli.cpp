#include "TaskRepository.hpp"
#include "taskledger/Errors.hpp"

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

using namespace taskledger;

namespace {

struct Args {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
};

void usage() {
    std::cerr
        << "Usage: taskledger [--actor NAME] <command> [args]\n"
        << "  create <title> <description> <assignee> [--priority P] [--status S]\n"
        << "  list [--status S] [--priority P] [--assignee A]\n"
        << "  view <id>\n"
        << "  update <id> [--title T] [--description D] [--status S] [--priority P] [--assignee A]\n"
        << "  delete <id>\n"
        << "  history <id>\n"
        << "Status: PENDING, IN_PROGRESS, DONE, CANCELLED\n"
        << "Priority: LOW, MEDIUM, HIGH, CRITICAL\n"
        << "Data directory: $TASKLEDGER_DATA_DIR (default ./data)\n";
}

// Splits "--name value" pairs from positional arguments. Returns false on a dangling option.
bool parseArgs(int argc, char** argv, int start, Args& out) {
    for (int i = start; i < argc; ++i) {
        std::string a = argv[i];
        if (a.size() > 2 && a.compare(0, 2, "--") == 0) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << a << "\n";
                return false;
            }
            out.options[a.substr(2)] = argv[++i];
        } else {
            out.positional.push_back(a);
        }
    }
    return true;
}

std::optional<std::string> option(const Args& args, const std::string& name) {
    auto it = args.options.find(name);
    if (it == args.options.end()) return std::nullopt;
    return it->second;
}

bool onlyKnownOptions(const Args& args, const std::vector<std::string>& known) {
    for (const auto& kv : args.options) {
        bool found = false;
        for (const auto& k : known) found = found || k == kv.first;
        if (!found) {
            std::cerr << "Unknown option --" << kv.first << "\n";
            return false;
        }
    }
    return true;
}

int cmdCreate(TaskRepository& repo, const Args& args, const std::string& actor) {
    if (args.positional.size() != 3 || !onlyKnownOptions(args, {"priority", "status"})) {
        usage();
        return 1;
    }
    Task task = Task::create(args.positional[0], args.positional[1], args.positional[2],
                             option(args, "status").value_or("PENDING"),
                             option(args, "priority").value_or("MEDIUM"));
    repo.create(task, actor);
    std::cout << "Task created.\n"
              << "  ID: " << task.id() << "\n"
              << "  Title: " << task.title() << "\n"
              << "  Status: " << toString(task.status()) << "\n"
              << "  Priority: " << toString(task.priority()) << "\n"
              << "  Assignee: " << task.assignee() << "\n";
    return 0;
}

int cmdList(TaskRepository& repo, const Args& args) {
    if (!args.positional.empty() || !onlyKnownOptions(args, {"status", "priority", "assignee"})) {
        usage();
        return 1;
    }
    TaskFilter filter;
    if (auto s = option(args, "status")) {
        filter.status = parseStatus(*s);
        if (!filter.status) throw ValidationError("invalid status: " + *s);
    }
    if (auto p = option(args, "priority")) {
        filter.priority = parsePriority(*p);
        if (!filter.priority) throw ValidationError("invalid priority: " + *p);
    }
    filter.assignee = option(args, "assignee");

    auto tasks = repo.list(filter);
    if (tasks.empty()) {
        std::cout << "No tasks found.\n";
        return 0;
    }

    std::cout << "\n" << std::left
              << std::setw(10) << "ID" << " "
              << std::setw(30) << "Title" << " "
              << std::setw(15) << "Status" << " "
              << std::setw(10) << "Priority" << " "
              << std::setw(20) << "Assignee" << " "
              << "Version\n"
              << std::string(105, '-') << "\n";
    for (const auto& t : tasks) {
        std::cout << std::setw(10) << t.id().substr(0, 8) << " "
                  << std::setw(30) << t.title().substr(0, 28) << " "
                  << std::setw(15) << toString(t.status()) << " "
                  << std::setw(10) << toString(t.priority()) << " "
                  << std::setw(20) << t.assignee() << " "
                  << "v" << t.version() << "\n";
    }
    std::cout << "\nTotal: " << tasks.size() << " task(s)\n";
    return 0;
}

int cmdView(TaskRepository& repo, const Args& args) {
    if (args.positional.size() != 1 || !args.options.empty()) {
        usage();
        return 1;
    }
    auto task = repo.get(args.positional[0]);
    if (!task) {
        std::cerr << "Task " << args.positional[0] << " not found.\n";
        return 1;
    }
    std::cout << "\n" << std::string(60, '=') << "\n"
              << "ID: " << task->id() << "\n"
              << "Title: " << task->title() << "\n"
              << "Description: " << task->description() << "\n"
              << "Status: " << toString(task->status()) << "\n"
              << "Priority: " << toString(task->priority()) << "\n"
              << "Assignee: " << task->assignee() << "\n"
              << "Version: " << task->version() << "\n"
              << "Created at: " << formatTimestamp(task->createdAt()) << "\n"
              << "Updated at: " << formatTimestamp(task->updatedAt()) << "\n"
              << std::string(60, '=') << "\n\n";
    return 0;
}

int cmdUpdate(TaskRepository& repo, const Args& args, const std::string& actor) {
    if (args.positional.size() != 1) {
        usage();
        return 1;
    }
    FieldChanges changes;
    for (const auto& kv : args.options) {
        auto field = parseTaskField(kv.first);
        if (!field) {
            std::cerr << "Unknown option --" << kv.first << "\n";
            return 1;
        }
        changes[*field] = kv.second;
    }
    if (changes.empty()) {
        std::cerr << "No fields to update were given.\n";
        return 1;
    }

    const auto& id = args.positional[0];
    auto task = repo.update(id, changes, actor);
    if (!task) {
        std::cerr << "Task " << id << " not found.\n";
        return 1;
    }
    std::cout << "Task " << task->id().substr(0, 8) << " updated.\n"
              << "  Version: v" << task->version() << "\n";
    return 0;
}

int cmdDelete(TaskRepository& repo, const Args& args, const std::string& actor) {
    if (args.positional.size() != 1 || !args.options.empty()) {
        usage();
        return 1;
    }
    const auto& id = args.positional[0];
    if (!repo.remove(id, actor)) {
        std::cerr << "Task " << id << " not found.\n";
        return 1;
    }
    std::cout << "Task " << id << " deleted.\n";
    return 0;
}

int cmdHistory(TaskRepository& repo, const Args& args) {
    if (args.positional.size() != 1 || !args.options.empty()) {
        usage();
        return 1;
    }
    const auto& id = args.positional[0];
    auto entries = repo.history(id);
    if (entries.empty()) {
        std::cout << "No history found for task " << id << ".\n";
        return 0;
    }

    std::cout << "\nHistory of task " << id << ":\n" << std::string(80, '-') << "\n";
    for (const auto& e : entries) {
        std::cout << "\n[" << formatTimestamp(e.timestamp) << "] "
                  << toString(e.operation) << " by " << e.actor << "\n";
        auto changes = e.details.find("changes");
        if (changes != e.details.end() && changes->is_object()) {
            for (auto it = changes->begin(); it != changes->end(); ++it) {
                std::cout << "  " << it.key() << ": "
                          << it.value().value("previous", "") << " -> "
                          << it.value().value("new", "") << "\n";
            }
        }
    }
    std::cout << std::string(80, '-') << "\n";
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::string actor = kDefaultActor;
    int i = 1;
    while (i < argc && std::string(argv[i]) == "--actor") {
        if (i + 1 >= argc) {
            usage();
            return 1;
        }
        actor = argv[i + 1];
        i += 2;
    }
    if (i >= argc) {
        usage();
        return 1;
    }
    const std::string command = argv[i];

    Args args;
    if (!parseArgs(argc, argv, i + 1, args)) {
        usage();
        return 1;
    }

    std::string dataDir = "data";
    if (const char* envDir = std::getenv("TASKLEDGER_DATA_DIR")) dataDir = envDir;

    try {
        TaskRepository repo(RepositoryOptions::fromDataDir(dataDir));
        if (command == "create") return cmdCreate(repo, args, actor);
        if (command == "list") return cmdList(repo, args);
        if (command == "view") return cmdView(repo, args);
        if (command == "update") return cmdUpdate(repo, args, actor);
        if (command == "delete") return cmdDelete(repo, args, actor);
        if (command == "history") return cmdHistory(repo, args);
        std::cerr << "Unknown command: " << command << "\n";
        usage();
        return 1;
    } catch (const IntegrityError& e) {
        std::cerr << "\n" << std::string(60, '!') << "\n"
                  << "DATA INTEGRITY FAILURE: " << e.what() << "\n"
                  << "The task file was modified outside TaskLedger or is corrupted.\n"
                  << "Nothing was changed. Restore the file from a backup before continuing.\n"
                  << std::string(60, '!') << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
