#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// Utils
#include "utils/ConfigLoader.hpp"
#include "utils/Logger.hpp"

// Pipeline
#include "pipeline/EngineSettings.hpp"
#include "pipeline/Orchestrator.hpp"

// Persistence
#include "stats/FileStatsStore.hpp"

// -------------------------
// CLI
// -------------------------
struct CliOptions
{
    std::string configFile = "config/stattrackd.conf";
    bool verbose = false;
    bool help = false;
};

static CliOptions parseArgs(int argc, char *argv[])
{
    CliOptions opts;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];

        if (arg == "--config" || arg == "-c")
        {
            if (++i < argc)
                opts.configFile = argv[i];
        }
        else if (arg == "--verbose" || arg == "-v")
        {
            opts.verbose = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            opts.help = true;
        }
    }

    return opts;
}

static void printUsage(const char *progName)
{
    std::cout
        << "Usage: " << progName << " [OPTIONS]\n\n"
        << "OPTIONS:\n"
        << "  -c, --config FILE        Config file (default: config/stattrackd.conf)\n"
        << "  -v, --verbose            Debug logging\n"
        << "  -h, --help               Show this help\n\n";
}

namespace
{
    std::atomic<bool> g_shutdown{false};
}

static void handleSignal(int)
{
    g_shutdown.store(true);
}

int main(int argc, char *argv[])
{
    const auto opts = parseArgs(argc, argv);
    if (opts.help)
    {
        printUsage(argv[0]);
        return 0;
    }

    auto &logger = StatTrack::Utils::getLogger();

    StatTrack::Utils::ConfigLoader config;
    if (!config.loadFromFile(opts.configFile))
    {
        logger.error("Cannot open config file: " + opts.configFile);
        printUsage(argv[0]);
        return 1;
    }

    StatTrack::Pipeline::EngineSettings settings;
    try
    {
        settings = StatTrack::Pipeline::EngineSettings::fromConfig(config);
    }
    catch (const std::exception &ex)
    {
        logger.error(std::string("Invalid configuration: ") + ex.what());
        return 1;
    }

    logger.setLevel(opts.verbose ? StatTrack::Utils::LogLevel::DEBUG : settings.logLevel);
    if (!settings.logFile.empty() && !logger.openFile(settings.logFile))
    {
        logger.warn("Cannot open log file " + settings.logFile + ", logging to console only");
    }

    const auto targets = StatTrack::Pipeline::loadServerTargets(config);
    if (targets.empty())
    {
        logger.error("No servers configured (expected server.0.name, server.0.log_path, ...)");
        return 1;
    }

    logger.info("Starting stattrackd");
    logger.info("Config: " + opts.configFile);
    logger.info("State dir: " + settings.stateDir);

    std::unique_ptr<StatTrack::Stats::FileStatsStore> store;
    try
    {
        store = std::make_unique<StatTrack::Stats::FileStatsStore>(settings.statsJournalPath());
    }
    catch (const StatTrack::Stats::StoreError &ex)
    {
        logger.critical(std::string("Cannot open stats journal: ") + ex.what());
        return 1;
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    StatTrack::Pipeline::Orchestrator orchestrator(settings, *store);
    if (orchestrator.start(targets) == 0)
    {
        logger.error("No enabled servers to track");
        return 1;
    }

    while (!g_shutdown.load())
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    logger.info("Signal received, shutting down");
    const auto summaries = orchestrator.stop();
    for (const auto &summary : summaries)
    {
        logger.info(StatTrack::Pipeline::describe(summary));
    }

    if (!store->flush())
    {
        logger.critical("Final flush of the stats journal failed");
        return 2;
    }

    logger.info("Done. Journal: " + settings.statsJournalPath());
    return 0;
}
