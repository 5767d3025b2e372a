#include "taskproc/adapter_factory.hpp"
#include "taskproc/errors.hpp"
#include "taskproc/logging.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace {

std::atomic<bool> g_stop_requested{false};

void signal_handler(int) {
    g_stop_requested = true;
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  --queue NAME        Queue to consume (default: TASK_QUEUE_NAME)\n"
              << "  --concurrency N     Execution slots (default: TASK_WORKER_CONCURRENCY)\n"
              << "  --debug             Debug logging\n"
              << "  --help              Show this help message\n"
              << "\n"
              << "Environment variables:\n"
              << "  TASK_BACKEND              postgres | memory (default: postgres)\n"
              << "  TASK_BROKER_URL           Broker connection string\n"
              << "  TASK_BACKEND_URL          Result store connection string (default: broker)\n"
              << "  TASK_QUEUE_NAME           Default queue (default: default)\n"
              << "  TASK_MAX_RETRIES          Retries per task (default: 3)\n"
              << "  TASK_RETRY_BACKOFF_UNIT_MS Backoff unit in ms (default: 1000)\n"
              << "  TASK_WORKER_CONCURRENCY   Execution slots (default: 4)\n"
              << "  TASK_TRANSPORT_OPTIONS    JSON object passed to the broker\n"
              << "  LOG_LEVEL                 trace | debug | info | warn | error\n"
              << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    taskproc::setup_logging();

    taskproc::ConsumerOptions consumer_options;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--queue" && i + 1 < argc) {
            consumer_options.queues.push_back(argv[++i]);
        } else if (arg == "--concurrency" && i + 1 < argc) {
            consumer_options.concurrency = std::atoi(argv[++i]);
        } else if (arg == "--debug") {
            spdlog::set_level(spdlog::level::debug);
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        auto config = taskproc::TaskProcessorConfig::from_env();

        spdlog::info("Starting taskproc worker");
        spdlog::info("   - Backend: {}", taskproc::backend_type_name(config.backend));
        spdlog::info("   - Queue: {}", config.queue_name);
        spdlog::info("   - Max retries: {}", config.max_retries);
        spdlog::info("   - Concurrency: {}", config.worker_concurrency());

        auto adapter = taskproc::make_task_adapter(config);

        adapter->register_task_handle([](const nlohmann::json& args, const nlohmann::json&) {
            if (args.size() != 2 || !args[0].is_number() || !args[1].is_number()) {
                throw std::invalid_argument("add expects two numbers");
            }
            return nlohmann::json(args[0].get<double>() + args[1].get<double>());
        }, "add");

        adapter->register_task_handle([](const nlohmann::json& args, const nlohmann::json& kwargs) {
            return nlohmann::json{{"args", args}, {"kwargs", kwargs}};
        }, "echo");

        adapter->start_consumer(consumer_options);

        while (!g_stop_requested) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        spdlog::info("Stop requested, shutting down gracefully...");
        if (!adapter->stop_consumer(std::chrono::seconds(30))) {
            spdlog::warn("Consumer did not stop in time");
            return 1;
        }
    } catch (const taskproc::ConfigurationError& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 2;
    } catch (const std::exception& e) {
        spdlog::error("Worker error: {}", e.what());
        return 1;
    }

    spdlog::info("Worker stopped");
    return 0;
}
