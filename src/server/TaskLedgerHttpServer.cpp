#include "TaskLedgerHttpServer.hpp"

#include <iostream>
#include "taskledger/Errors.hpp"

using json = nlohmann::json;
using namespace taskledger;

TaskLedgerHttpServer::TaskLedgerHttpServer(std::string host, int port, std::string dataDir)
    : host_(std::move(host)),
      port_(port),
      repo_(RepositoryOptions::fromDataDir(dataDir)),
      dataDir_(std::move(dataDir)),
      startTime_(std::chrono::steady_clock::now()) {
    setupRoutes();
}

void TaskLedgerHttpServer::run() {
    std::cout << "TaskLedger HTTP server listening on "
              << host_ << ":" << port_ << std::endl;
    if (!server_.listen(host_.c_str(), port_)) {
        throw StorageError("TaskLedgerHttpServer: cannot listen on " + host_ + ":" + std::to_string(port_));
    }
}

void TaskLedgerHttpServer::setupRoutes() {

    // JSON helpers
    auto ok = [](const json& data) {
        return json{
            {"status", "ok"},
            {"data", data}
        };
    };

    auto err = [](int code, const std::string& message) {
        return json{
            {"status", "error"},
            {"error", {
                {"code", code},
                {"message", message}
            }}
        };
    };

    auto isJsonContent = [](const httplib::Request& req) {
        auto ct = req.get_header_value("Content-Type");
        return ct.find("application/json") != std::string::npos;
    };

    auto actorOf = [](const httplib::Request& req) {
        auto actor = req.get_header_value("X-Actor");
        return actor.empty() ? std::string(kDefaultActor) : actor;
    };

    auto addCors = [](httplib::Response& res) {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, PATCH, DELETE, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type, X-Actor");
    };

    // Maps the core error taxonomy onto HTTP statuses. Integrity failures are logged loudly.
    auto fail = [err, addCors](httplib::Response& res, const std::exception& e) {
        int code = 500;
        std::string message = e.what();
        if (dynamic_cast<const ValidationError*>(&e)) {
            code = 400;
        } else if (dynamic_cast<const DuplicateIdError*>(&e)) {
            code = 409;
        } else if (dynamic_cast<const IntegrityError*>(&e)) {
            std::cerr << "TaskLedgerHttpServer: DATA INTEGRITY FAILURE: " << e.what() << "\n";
            message = std::string("integrity failure: ") + e.what();
        } else if (dynamic_cast<const json::exception*>(&e)) {
            code = 400;
            message = std::string("Invalid JSON: ") + e.what();
        }
        res.status = code;
        res.set_content(err(code, message).dump(), "application/json");
        addCors(res);
    };

    auto historyJson = [](const std::vector<AuditEntry>& entries) {
        json out = json::array();
        for (const auto& e : entries) out.push_back(e.toJson());
        return out;
    };

    server_.Options(R"(.*)", [addCors](const httplib::Request&, httplib::Response& res) {
        addCors(res);
        res.status = 200;
        res.set_content("", "text/plain");
    });

    // --- HEALTH ---
    server_.Get("/v1/health", [this, ok, addCors](const httplib::Request&, httplib::Response& res) {
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - startTime_).count();
        json data = {
            {"uptime_seconds", uptime},
            {"integrity_ok", repo_.verifyIntegrity()}
        };
        res.set_content(ok(data).dump(), "application/json");
        addCors(res);
    });

    // --- CONFIG ---
    server_.Get("/v1/config", [this, ok, addCors](const httplib::Request&, httplib::Response& res) {
        json data = repo_.config();
        data["data_dir"] = dataDir_;
        res.set_content(ok(data).dump(), "application/json");
        addCors(res);
    });

    // --- CREATE TASK ---
    server_.Post("/v1/tasks", [this, ok, err, isJsonContent, actorOf, addCors, fail](const httplib::Request& req, httplib::Response& res) {
        if (!isJsonContent(req)) {
            res.status = 415;
            res.set_content(err(415, "Content-Type must be application/json").dump(), "application/json");
            addCors(res);
            return;
        }
        try {
            auto j = json::parse(req.body);
            auto title = j.value("title", "");
            if (title.empty()) {
                res.status = 400;
                res.set_content(err(400, "Missing task title").dump(), "application/json");
                addCors(res);
                return;
            }
            Task task = Task::create(title,
                                     j.value("description", ""),
                                     j.value("assignee", ""),
                                     j.value("status", "PENDING"),
                                     j.value("priority", "MEDIUM"),
                                     j.value("id", ""));
            auto created = repo_.create(task, actorOf(req));
            res.status = 201;
            res.set_content(ok(created.toJson()).dump(), "application/json");
            addCors(res);
        } catch (const std::exception& e) {
            fail(res, e);
        }
    });

    // --- LIST TASKS ---
    server_.Get("/v1/tasks", [this, ok, err, addCors, fail](const httplib::Request& req, httplib::Response& res) {
        TaskFilter filter;
        auto status = req.get_param_value("status");
        auto priority = req.get_param_value("priority");
        auto assignee = req.get_param_value("assignee");
        if (!status.empty()) {
            filter.status = parseStatus(status);
            if (!filter.status) {
                res.status = 400;
                res.set_content(err(400, "invalid status: " + status).dump(), "application/json");
                addCors(res);
                return;
            }
        }
        if (!priority.empty()) {
            filter.priority = parsePriority(priority);
            if (!filter.priority) {
                res.status = 400;
                res.set_content(err(400, "invalid priority: " + priority).dump(), "application/json");
                addCors(res);
                return;
            }
        }
        if (!assignee.empty()) filter.assignee = assignee;

        try {
            json items = json::array();
            for (const auto& t : repo_.list(filter)) items.push_back(t.toJson());
            res.set_content(ok(json{{"total", items.size()}, {"tasks", items}}).dump(), "application/json");
            addCors(res);
        } catch (const std::exception& e) {
            fail(res, e);
        }
    });

    // --- GET TASK ---
    server_.Get(R"(/v1/tasks/([^/]+))", [this, ok, err, addCors, fail](const httplib::Request& req, httplib::Response& res) {
        std::string id = req.matches[1];
        try {
            auto task = repo_.get(id);
            if (!task) {
                res.status = 404;
                res.set_content(err(404, "Task not found").dump(), "application/json");
            } else {
                res.set_content(ok(task->toJson()).dump(), "application/json");
            }
            addCors(res);
        } catch (const std::exception& e) {
            fail(res, e);
        }
    });

    // --- UPDATE TASK (partial) ---
    server_.Patch(R"(/v1/tasks/([^/]+))", [this, ok, err, isJsonContent, actorOf, addCors, fail](const httplib::Request& req, httplib::Response& res) {
        std::string id = req.matches[1];
        if (!isJsonContent(req)) {
            res.status = 415;
            res.set_content(err(415, "Content-Type must be application/json").dump(), "application/json");
            addCors(res);
            return;
        }
        try {
            auto j = json::parse(req.body);
            if (!j.is_object() || j.empty()) {
                res.status = 400;
                res.set_content(err(400, "No fields to update").dump(), "application/json");
                addCors(res);
                return;
            }
            FieldChanges changes;
            for (auto it = j.begin(); it != j.end(); ++it) {
                auto field = parseTaskField(it.key());
                if (!field || !it.value().is_string()) {
                    res.status = 400;
                    res.set_content(err(400, "Unknown or non-string field: " + it.key()).dump(), "application/json");
                    addCors(res);
                    return;
                }
                changes[*field] = it.value().get<std::string>();
            }
            auto updated = repo_.update(id, changes, actorOf(req));
            if (!updated) {
                res.status = 404;
                res.set_content(err(404, "Task not found").dump(), "application/json");
            } else {
                res.set_content(ok(updated->toJson()).dump(), "application/json");
            }
            addCors(res);
        } catch (const std::exception& e) {
            fail(res, e);
        }
    });

    // --- DELETE TASK ---
    server_.Delete(R"(/v1/tasks/([^/]+))", [this, ok, err, actorOf, addCors, fail](const httplib::Request& req, httplib::Response& res) {
        std::string id = req.matches[1];
        try {
            if (repo_.remove(id, actorOf(req))) {
                res.set_content(ok(json{{"id", id}, {"deleted", true}}).dump(), "application/json");
            } else {
                res.status = 404;
                res.set_content(err(404, "Task not found").dump(), "application/json");
            }
            addCors(res);
        } catch (const std::exception& e) {
            fail(res, e);
        }
    });

    // --- HISTORY ---
    server_.Get(R"(/v1/tasks/([^/]+)/history)", [this, ok, addCors, fail, historyJson](const httplib::Request& req, httplib::Response& res) {
        std::string id = req.matches[1];
        try {
            auto entries = repo_.history(id);
            res.set_content(ok(json{{"id", id}, {"entries", historyJson(entries)}}).dump(), "application/json");
            addCors(res);
        } catch (const std::exception& e) {
            fail(res, e);
        }
    });
}
