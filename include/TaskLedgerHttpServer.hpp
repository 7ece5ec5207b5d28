#pragma once

#include <string>
#include <chrono>
#include "httplib.h"
#include "TaskRepository.hpp"
#include <nlohmann/json.hpp>

class TaskLedgerHttpServer {
public:
    TaskLedgerHttpServer(std::string host, int port, std::string dataDir = "data");
    void run();

private:
    void setupRoutes();

    std::string host_;
    int port_;
    httplib::Server server_;
    taskledger::TaskRepository repo_;
    std::string dataDir_;
    std::chrono::steady_clock::time_point startTime_;
};
