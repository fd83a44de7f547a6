#include "core/Config.h"
#include "core/Logger.h"
#include "core/Scheduler.h"
#include "engine/FlowEngine.h"
#include "hal/HardwareManager.h"
#include "nodes/BuiltinNodes.h"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <csignal>
#include <cstdio>
#include <fstream>
#include <functional>
#include <map>
#include <string>

using namespace labflow;

namespace {

volatile std::sig_atomic_t interrupted = 0;

void onSignal(int)
{
    interrupted = 1;
}

bool readLayout(const std::string& path, nlohmann::json& layout, std::string& error)
{
    std::ifstream in(path);
    if (!in)
    {
        error = "cannot open " + path;
        return false;
    }
    layout = nlohmann::json::parse(in, nullptr, false);
    if (layout.is_discarded())
    {
        error = path + " is not valid JSON";
        return false;
    }
    return true;
}

// Runs the realtime loop until pred() holds or the timeout passes.
bool waitFor(Scheduler& scheduler, double timeout, const std::function<bool()>& pred)
{
    double deadline = scheduler.now() + timeout;
    while (!pred() && scheduler.now() < deadline && !interrupted)
        scheduler.runFor(0.01);
    return pred();
}

} // namespace

int main(int argc, char** argv)
{
    std::string layoutPath;
    std::string configPath = Config::defaultPath();
    std::string logLevel;
    double duration = 0.0;
    bool mock = false;
    bool validateOnly = false;

    CLI::App app{"labflow - run a lab experiment flow"};
    try
    {
        app.add_option("layout", layoutPath, "Experiment layout file (JSON)")
            ->required()
            ->check(CLI::ExistingFile);
        app.add_option("-c,--config", configPath, "Configuration file");
        app.add_option("-d,--duration", duration, "Stop after this many seconds (0 waits for the flow to end)")
            ->check(CLI::NonNegativeNumber);
        app.add_option("-l,--log-level", logLevel, "off, warn, info, debug or trace")
            ->check(CLI::IsMember({"off", "warn", "info", "debug", "trace"}));
        app.add_flag("--mock", mock, "Replace every board with a simulated one");
        app.add_flag("--validate", validateOnly, "Check the flow and exit");
        app.parse(argc, argv);
    }
    catch (const CLI::ParseError& e)
    {
        return app.exit(e);
    }

    Config config;
    std::string error;
    if (!config.load(configPath, error))
    {
        std::fprintf(stderr, "labflow: %s\n", error.c_str());
        return 1;
    }
    Logger::setLevel(config.logging.level);
    if (!logLevel.empty())
    {
        LogLevel level;
        if (Logger::parseLevel(logLevel.c_str(), level))
            Logger::setLevel(level);
    }

    nlohmann::json layout;
    if (!readLayout(layoutPath, layout, error))
    {
        std::fprintf(stderr, "labflow: %s\n", error.c_str());
        return 1;
    }

    Scheduler scheduler(ClockMode::realtime);

    // Declared before the engine so that it outlives it.
    HardwareManager hardware(scheduler, config);
    hardware.setForceMockBoards(mock);

    NodeRegistry registry;
    registerBuiltinNodes(registry);
    FlowEngine engine(scheduler, std::move(registry), config);
    engine.setHardwareManager(&hardware);

    if (!engine.loadLayout(layout, error))
    {
        std::fprintf(stderr, "labflow: %s\n", error.c_str());
        return 1;
    }

    bool hasErrors = false;
    for (const auto& issue : engine.validate())
    {
        if (issue.severity == IssueSeverity::error)
            hasErrors = true;
        std::fprintf(stderr, "%s: %s\n", toString(issue.severity), issue.message.c_str());
    }
    if (validateOnly)
    {
        std::printf("%d nodes, %d connections, %s\n", engine.nodeCount(), engine.connectionCount(),
                    hasErrors ? "invalid" : "valid");
        return hasErrors ? 1 : 0;
    }
    if (hasErrors)
        return 1;

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    bool connected = false;
    hardware.connectAll([&](const std::map<std::string, bool>& results)
    {
        for (const auto& result : results)
        {
            if (!result.second)
                std::fprintf(stderr, "labflow: board %s did not connect\n", result.first.c_str());
        }
        connected = true;
    });
    if (!waitFor(scheduler, config.timing.boardReadyTimeout + 1.0, [&] { return connected; }))
        LF_WARN("labflow: boards still connecting, continuing");

    bool initialized = false;
    hardware.initializeAllDevices([&](const std::map<std::string, bool>& results)
    {
        for (const auto& result : results)
        {
            if (!result.second)
                std::fprintf(stderr, "labflow: device %s failed to initialize\n", result.first.c_str());
        }
        initialized = true;
    });
    if (!waitFor(scheduler, config.timing.boardReadyTimeout, [&] { return initialized; }))
        LF_WARN("labflow: device initialization did not finish, starting anyway");

    std::string completedBy;
    engine.addFlowCompleteObserver([&](const std::string& nodeId)
    {
        completedBy = nodeId;
        scheduler.stop();
    });

    if (duration > 0.0)
    {
        scheduler.callAfter(duration, [&]
        {
            LF_INFO("labflow: duration of %.3f s reached", duration);
            scheduler.stop();
        });
    }

    std::function<void()> watchSignals = [&]
    {
        if (interrupted)
        {
            LF_INFO("labflow: interrupted");
            scheduler.stop();
            return;
        }
        scheduler.callAfter(0.1, watchSignals);
    };
    scheduler.callAfter(0.1, watchSignals);

    // Started from inside the loop so a flow that ends immediately still stops it.
    scheduler.post([&] { engine.start(); });
    scheduler.run();

    engine.stop();
    hardware.shutdown();

    if (!completedBy.empty())
        std::printf("flow completed at %s\n", completedBy.c_str());
    else if (interrupted)
        std::printf("flow interrupted\n");
    else
        std::printf("flow stopped\n");
    return interrupted ? 130 : 0;
}
