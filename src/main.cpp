#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/signal_set.hpp> // For graceful shutdown
#include <boost/asio/io_context.hpp>
#include <boost/asio/executor_work_guard.hpp> // For make_work_guard

#include <nlohmann/json.hpp>

#include "cache/CacheManager.hpp"
#include "cache/ExpirySweeper.hpp"
#include "config/AppConfig.hpp"
#include "core/ThreadPoolQueue.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/DummyStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "service/CatalogRepository.hpp"
#include "service/CatalogService.hpp"
#include "utils/Utils.hpp"

using json = nlohmann::json;
using namespace std;

// --- Helper Function to Initialize StatsD Client ---
std::shared_ptr<IStatsDClient> initializeStatsDClient(const AppConfig& config, std::shared_ptr<ILogger> logger_) {
    string statsd_server_endpoint;
    const char* statsd_server_value = std::getenv("STATSD_SERVER");
    if (statsd_server_value != nullptr) {
        statsd_server_endpoint = std::string(statsd_server_value);
    }
    logger_->setup("STATSD_SERVER endpoint : " + statsd_server_endpoint);

    if (statsd_server_endpoint.empty()) {
        logger_->setup("STATSD_SERVER not set. Creating DummyStatsDClient instance.");
        return DummyStatsDClient::getInstance();
    }

    try {
        logger_->debug("STATSD_SERVER endpoint found. Creating real StatsDClient instance.");
        return StatsDClient::getInstance(config, logger_, statsd_server_endpoint);
    } catch (const std::exception& e) {
        stringstream ss;
        ss << "StatsDClient failed to get created: " << e.what();
        logger_->error(ss.str());
    }

    logger_->error("Creating DummyStatsDClient instance.");
    return DummyStatsDClient::getInstance();
}

// --- One simulated request against the catalog ---
void runWorkloadRequest(CatalogService& service, int request_number) {
    const int product_id = request_number % 6 + 1; // 6 does not exist: exercises the uncached miss
    switch (request_number % 10) {
        case 0:
        case 1:
        case 2:
            service.getProduct(product_id);
            break;
        case 3:
            service.getAllProducts();
            break;
        case 4:
            service.getProductsByCategory(request_number % 20 < 10 ? "electronics" : "furniture");
            break;
        case 5:
            service.getUser(request_number % 5 + 1);
            break;
        case 6:
            service.findUsersByNameAndAge("alice", 30);
            break;
        case 7:
            service.getAllUsers();
            break;
        case 8:
            if (auto product = service.getProduct(product_id)) {
                product->price += 1.0;
                service.saveProduct(*product);
            }
            break;
        default:
            if (auto user = service.getUser(request_number % 4 + 1)) {
                user->age += 1;
                service.saveUser(*user);
            }
            break;
    }
}

// --- Main Function ---
int main(int argc, char** argv) {
    std::stringstream ss;
    try {
        // Process command-line arguments.
        vector<string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        optional<map<string, string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            // Use a temporary logger instance for early errors before config is loaded
            ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Failed to parse command-line arguments. Exiting.");
            return 1;
        }

        map<string, string> startupArguments = parsedArgsOpt.value(); // Use .value() as we checked for nullopt

        // Load Configuration
        AppConfig config_ = Utils::loadConfiguration(startupArguments);

        // Initialize the main logger *after* loading the config
        std::shared_ptr<ILogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        // Initialize the StatsD client using the helper function
        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config_, logger_);
        logger_->setup("IStatsDClient instance created");

        CacheManager cache_manager(config_, logger_, statsd_client);

        auto repository = std::make_shared<CatalogRepository>(
            std::chrono::milliseconds(config_.repository_latency_in_millis), logger_);
        repository->seedDemoData();
        CatalogService catalog_service(repository, cache_manager, logger_);

        // --- Boost.Asio io_context for the expiry sweeper and signal handling ---
        boost::asio::io_context ioc;
        auto work_guard = boost::asio::make_work_guard(ioc); // Keep ioc.run() from returning if no work

        std::shared_ptr<ExpirySweeper> sweeper;
        if (config_.expiry_sweep_interval_in_millis > 0) {
            sweeper = std::make_shared<ExpirySweeper>(ioc, cache_manager,
                std::chrono::milliseconds(config_.expiry_sweep_interval_in_millis), logger_);
            sweeper->start();
        } else {
            logger_->setup("Expiry sweeper disabled, expired entries are dropped on read only.");
        }

        std::atomic<bool> stop_requested{false};
        net::signal_set signals(ioc, SIGINT, SIGTERM);
        signals.async_wait(
            [&stop_requested, logger_](const boost::system::error_code& ec, int signal_number) {
                if (ec == net::error::operation_aborted) {
                    return;
                }
                logger_->setup("Signal " + std::to_string(signal_number) + " received. Stopping workload...");
                stop_requested = true;
            });

        std::thread ioc_thread([&ioc, logger_]() {
            logger_->debug("Boost.Asio I/O thread started.");
            try {
                ioc.run();
            } catch (const std::exception& e) {
                logger_->error("Exception in Boost.Asio I/O thread: " + std::string(e.what()));
            }
            logger_->debug("Boost.Asio I/O thread exiting.");
        });

        // --- Demo workload ---
        const auto workload_start = std::chrono::steady_clock::now();
        {
            ThreadPoolQueue pool(static_cast<size_t>(std::max(1, config_.workload_threads)), logger_, statsd_client);
            for (int i = 0; i < config_.workload_requests && !stop_requested; ++i) {
                pool.enqueue([&catalog_service, &stop_requested, i]() {
                    if (stop_requested) {
                        return;
                    }
                    runWorkloadRequest(catalog_service, i);
                });
            }
            pool.shutdown(); // Drains the queue
        }
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - workload_start);

        ss << "Workload finished in " << elapsed.count() << " ms, "
           << repository->queryCount() << " repository queries for "
           << config_.workload_requests << " requests";
        logger_->setup(ss.str());
        logger_->setup("Cache statistics:\n" + cache_manager.statsJson().dump(4));

        // --- Shutdown ---
        if (sweeper) {
            sweeper->stop();
        }
        cache_manager.shutdown();
        work_guard.reset();
        ioc.stop();
        if (ioc_thread.joinable()) {
            ioc_thread.join();
        }
        logger_->setup("Boost.Asio I/O thread joined. Exiting.");
        return 0;
    } catch (const std::exception& e) {
        ss.str("");
        ss.clear();
        ss << "Unhandled exception: " << e.what();
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error(ss.str());
        return 1;
    } catch (...) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Unknown error occurred. Exiting.");
        return 1;
    }
}
