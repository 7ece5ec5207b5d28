// Walkthrough of the repository operations against a scratch data directory.
#include "TaskRepository.hpp"
#include "taskledger/Errors.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

using namespace taskledger;

namespace {

void separator(const std::string& title) {
    std::cout << "\n" << std::string(70, '=') << "\n" << title << "\n" << std::string(70, '-') << "\n";
}

} // namespace

int main(int argc, char** argv) {
    const std::string dataDir = argc > 1 ? argv[1] : "data/demo";

    try {
        const auto options = RepositoryOptions::fromDataDir(dataDir);
        // Start from scratch, touching only the files the demo owns.
        for (const auto& owned : {options.dataFile, options.dataFile + ".tmp", options.auditFile}) {
            std::error_code ec;
            std::filesystem::remove(owned, ec);
            if (ec) {
                std::cerr << "Demo: cannot remove " << owned << ": " << ec.message() << "\n";
                return 1;
            }
        }
        TaskRepository repo(options);

        separator("1. Creating tasks");
        Task auth("Implement authentication", "Login with JWT", "Joao Silva",
                  TaskStatus::Pending, TaskPriority::High);
        Task ci("Configure CI/CD", "Continuous integration pipeline", "Maria Santos",
                TaskStatus::Pending, TaskPriority::Critical);
        Task docs("Write documentation", "Document the API and usage guides", "Carlos Lima");
        for (const auto& t : {auth, ci, docs}) {
            repo.create(t, "manager");
            std::cout << "created " << t.title() << " (v" << t.version() << ")\n";
        }

        separator("2. Listing tasks");
        for (const auto& t : repo.list()) {
            std::cout << "* " << t.summary() << "\n";
        }

        separator("3. Updating tasks (versioning)");
        auto v2 = repo.update(auth.id(), {{TaskField::Status, "IN_PROGRESS"}}, "joao");
        std::cout << auth.title() << " -> v" << v2->version() << "\n";
        auto v3 = repo.update(auth.id(), {{TaskField::Priority, "CRITICAL"}}, "manager");
        std::cout << auth.title() << " -> v" << v3->version() << "\n";
        auto same = repo.update(auth.id(), {{TaskField::Priority, "CRITICAL"}}, "manager");
        std::cout << "repeating the same change keeps v" << same->version() << "\n";
        repo.update(ci.id(), {{TaskField::Status, "DONE"}, {TaskField::Assignee, "Ana Costa"}}, "maria");

        separator("4. Filtering");
        TaskFilter critical;
        critical.priority = TaskPriority::Critical;
        for (const auto& t : repo.list(critical)) {
            std::cout << "CRITICAL: " << t.summary() << "\n";
        }

        separator("5. Rejected operations");
        try {
            repo.create(auth, "manager");
        } catch (const DuplicateIdError& e) {
            std::cout << "duplicate rejected: " << e.what() << "\n";
        }
        try {
            repo.update(docs.id(), {{TaskField::Status, "ARCHIVED"}}, "carlos");
        } catch (const ValidationError& e) {
            std::cout << "validation rejected: " << e.what() << "\n";
        }

        separator("6. History of " + auth.title());
        for (const auto& e : repo.history(auth.id())) {
            std::cout << "[" << formatTimestamp(e.timestamp) << "] " << toString(e.operation)
                      << " by " << e.actor << " " << e.details.dump() << "\n";
        }

        separator("7. Deleting");
        std::cout << "delete docs: " << (repo.remove(docs.id(), "manager") ? "ok" : "not found") << "\n";
        std::cout << "delete again: " << (repo.remove(docs.id(), "manager") ? "ok" : "not found") << "\n";
        std::cout << "remaining tasks: " << repo.count() << "\n";

        separator("8. Integrity check");
        std::cout << "document intact: " << (repo.verifyIntegrity() ? "yes" : "no") << "\n";
        {
            // Tamper with the file the way an outside editor would.
            const std::string path = repo.config().at("data_file").get<std::string>();
            std::ifstream in(path);
            nlohmann::json doc = nlohmann::json::parse(in);
            in.close();
            doc["records"][0]["title"] = "tampered";
            std::ofstream(path, std::ios::trunc) << doc.dump(2);
        }
        std::cout << "document intact after tampering: " << (repo.verifyIntegrity() ? "yes" : "no") << "\n";
        try {
            repo.list();
        } catch (const IntegrityError& e) {
            std::cout << "list refused: " << e.what() << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Demo failed: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
