#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>

#include "gencache/cache/CacheProvider.hpp"
#include "gencache/config/ClientConfig.hpp"
#include "gencache/core/Logging.hpp"
#include "gencache/store/RedisStore.hpp"

using namespace gencache;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitUsage = 1;
constexpr int kExitMiss = 2;

std::atomic<bool> g_running{true};

void signalHandler(int) {
    g_running = false;
}

void printUsage() {
    std::cerr << "Usage: gencache_cli [--config <file>] <command> <args>\n"
              << "Commands:\n"
              << "  put <region> <id> <json>\n"
              << "  get <region> <id>\n"
              << "  remove <region> <id>\n"
              << "  clear <region>\n"
              << "  generation <region>\n"
              << "  lock <region> <id> <holdMs>\n";
}

// Удержание блокировки с возможностью прерывания сигналом
void holdFor(std::chrono::milliseconds duration) {
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (g_running && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

int runCommand(cache::CacheProvider& provider, const std::vector<std::string>& args) {
    const std::string& command = args[0];

    if (args.size() < 2) {
        printUsage();
        return kExitUsage;
    }
    auto region = provider.buildCache(args[1]);

    if (command == "put" && args.size() == 4) {
        region->put(args[2], nlohmann::json::parse(args[3]));
        return kExitOk;
    }
    if (command == "get" && args.size() == 3) {
        auto value = region->get(args[2]);
        if (!value) {
            return kExitMiss;
        }
        std::cout << value->dump() << std::endl;
        return kExitOk;
    }
    if (command == "remove" && args.size() == 3) {
        region->remove(args[2]);
        return kExitOk;
    }
    if (command == "clear" && args.size() == 2) {
        region->clear();
        return kExitOk;
    }
    if (command == "generation" && args.size() == 2) {
        std::cout << region->cacheNamespace().fetchGeneration() << std::endl;
        return kExitOk;
    }
    if (command == "lock" && args.size() == 4) {
        if (!region->lock(args[2])) {
            spdlog::error("Could not acquire lock on '{}' in region '{}'", args[2], args[1]);
            return kExitUsage;
        }
        spdlog::info("Lock on '{}' acquired, holding for {}ms", args[2], args[3]);
        holdFor(std::chrono::milliseconds(std::stoll(args[3])));
        region->unlock(args[2]);
        spdlog::info("Lock on '{}' released", args[2]);
        return kExitOk;
    }

    printUsage();
    return kExitUsage;
}

} // namespace

int main(int argc, char* argv[]) {
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);

    std::string configPath;
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return kExitOk;
        } else {
            args.push_back(arg);
        }
    }
    if (args.empty()) {
        printUsage();
        return kExitUsage;
    }

    try {
        config::ClientConfig config;
        if (!configPath.empty()) {
            config = config::loadClientConfig(configPath);
        }

        logging::initialize(config.logging);
        spdlog::set_default_logger(logging::logger());

        auto store = std::make_shared<store::RedisStore>(config.redis);
        cache::CacheProvider provider(store, config.cache);
        return runCommand(provider, args);

    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return kExitUsage;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Invalid JSON value: " << e.what() << std::endl;
        return kExitUsage;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        if (spdlog::get(logging::kLoggerName)) {
            spdlog::critical("Fatal error: {}", e.what());
        }
        return kExitUsage;
    }
}
