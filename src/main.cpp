#include "config.hpp"
#include "logging.hpp"
#include "dispatcher.hpp"

#include <atomic>
#include <csignal>
#include <cstdio>
#include <string>
#include <getopt.h>

static Config config;
static std::atomic<bool> running{true};
static std::atomic<bool> clearCacheRequested{false};
static std::atomic<bool> restoreLevelRequested{false};
static std::atomic<int> increaseLevelRequested{0};

void usage(const std::string& prog)
{
    printf("Usage: %s [options] <config_file>\n", prog.c_str());
    printf("\n");
    printf("Local DNS service resolving queries over DNS-over-HTTPS.\n");
    printf("\n");
    printf("Options:\n");
    printf("  -h        Print this help and exit\n");
    printf("  -v        Increase logging level, can be repeated\n");
    printf("\n");
    printf("Signals:\n");
    printf("  SIGUSR1   Restore logging level from config file\n");
    printf("  SIGUSR2   Increase logging level\n");
    printf("  SIGHUP    Clear DNS cache\n");
    printf("\n");
}

static void increaseLogLevel()
{
    switch (Log::getLogLevel()) {
    case Log::Level::Error:
        Log::setLogLevel(Log::Level::Info);
        break;
    case Log::Level::Info:
        Log::setLogLevel(Log::Level::Verbose);
        break;
    case Log::Level::Verbose:
    case Log::Level::Debug:
    default:
        Log::setLogLevel(Log::Level::Debug);
        break;
    }
}

/**
 * Applies requests posted by signal handlers, logging takes a lock so it can't run in the handler.
 */
static void processSignals(Dispatcher& dispatcher)
{
    if (restoreLevelRequested.exchange(false) && Log::getLogLevel() != config.log_level) {
        Log::setLogLevel(config.log_level);
        Log::write(Log::Level::Info, "Set logging level ", Log::levelName(config.log_level));
    }
    for (auto n = increaseLevelRequested.exchange(0); n > 0; n--) {
        increaseLogLevel();
        Log::write(Log::Level::Info, "Set logging level ", Log::levelName(Log::getLogLevel()));
    }
    if (clearCacheRequested.exchange(false)) {
        dispatcher.clearCache();
    }
}

void signalHandler(int sig)
{
    switch (sig) {
    case SIGUSR1:
        restoreLevelRequested = true;
        break;
    case SIGUSR2:
        increaseLevelRequested++;
        break;
    case SIGHUP:
        clearCacheRequested = true;
        break;
    default:
        running = false;
        break;
    }
}

int main(int argc, char** argv)
{
    int verbose = 0;
    int opt;
    while ((opt = getopt(argc, argv, "hv")) != -1) {
        switch (opt) {
        case 'h':
            usage(argv[0]);
            return 0;
        case 'v':
            verbose++;
            break;
        default:
            usage(argv[0]);
            return 1;
        }
    }
    if (optind != argc - 1) {
        usage(argv[0]);
        return 1;
    }

    try {
        config.parseFile(argv[optind]);
    } catch (ConfigException& e) {
        fprintf(stderr, "ERROR: %s\n", e.what());
        return 1;
    }

    Log::init(config.syslog_id, config.syslog_facility, config.log_level);
    for (int i = 0; i < verbose; i++) {
        increaseLogLevel();
    }

    Dispatcher dispatcher(config);
    try {
        dispatcher.startListener();
    } catch (SocketException& e) {
        LOG_ERROR("Failed to start DNS listener on ", config.listen_address.first, ":", config.listen_address.second, ": ", e.what());
        fprintf(stderr, "Failed to start DNS listener: %s\n", e.what());
        return 1;
    }

    std::signal(SIGUSR1, signalHandler);
    std::signal(SIGUSR2, signalHandler);
    std::signal(SIGHUP, signalHandler);
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGPIPE, SIG_IGN);

    while (running) {
        dispatcher.run(0.1);
        processSignals(dispatcher);
    }

    LOG_INFO("Shutting down");
    dispatcher.stopListener();
    return 0;
}
