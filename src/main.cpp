#include "apisim/SimulatorServer.h"
#include "apisim/common/Config.h"
#include "apisim/common/Logger.h"
#include "apisim/common/SimulatorConfig.h"
#include "apisim/monitor/SimulatorMetrics.h"
#include "apisim/network/EventLoop.h"

#include <getopt.h>
#include <unistd.h>

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace {

apisim::network::EventLoop* g_loop = nullptr;

void HandleStopSignal(int) {
    if (g_loop) {
        g_loop->Quit();
        g_loop->WakeUp();
    }
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace apisim;

    std::string configFile = "../config/apisim.conf";
    bool checkOnly = false;
    int ch;
    while ((ch = getopt(argc, argv, "c:hC")) != -1) {
        switch (ch) {
            case 'c':
                configFile = optarg;
                break;
            case 'C':
                checkOnly = true;
                break;
            case 'h':
            default:
                printf("Usage: %s [-c config_file] [-C]\n", argv[0]);
                printf("  -C  check config and exit\n");
                return 0;
        }
    }

    auto& conf = common::Config::Instance();
    if (!conf.Load(configFile)) {
        LOG_WARN << "Failed to load config " << configFile << ", using defaults and environment";
    }
    common::Logger::Instance().SetLevel(
        common::Logger::ParseLevel(conf.GetString("global", "log_level", "INFO")));

    auto simConfig = common::SimulatorConfig::FromIni(conf);
    if (!simConfig) {
        LOG_ERROR << "Invalid configuration";
        return 1;
    }
    if (checkOnly) {
        printf("OK\n");
        return 0;
    }

    // Poller::NewDefaultPoller reads this flag; epoll is the default.
    ::unsetenv("APISIM_USE_URING");
    if (simConfig->ioModel == "uring") {
#if APISIM_WITH_URING
        ::setenv("APISIM_USE_URING", "1", 1);
#else
        LOG_WARN << "io_model=uring requested but built without liburing, using epoll";
#endif
    } else if (simConfig->ioModel != "epoll") {
        LOG_WARN << "Unknown io_model " << simConfig->ioModel << ", using epoll";
    }

    std::signal(SIGPIPE, SIG_IGN);

    network::EventLoop loop;
    monitor::SimulatorMetrics metrics;
    SimulatorServer server(&loop, *simConfig, &metrics);
    if (!server.Start()) {
        LOG_ERROR << "Simulator failed to start";
        return 1;
    }

    g_loop = &loop;
    std::signal(SIGINT, HandleStopSignal);
    std::signal(SIGTERM, HandleStopSignal);

    loop.Loop();

    g_loop = nullptr;
    server.Stop();
    LOG_INFO << "Simulator stopped";
    return 0;
}
