#include "app_service.hpp"
#include "../logging/logger.hpp"
#include "../logging/log_helper.hpp"
#include <iostream>

namespace app_service {

std::atomic<AppService*> AppService::g_instance{nullptr};

AppService::AppService(const std::string& service_name)
    : service_name_(service_name) {
    statistics_.reset();
}

AppService::~AppService() {
    stop();
    restore_signal_handlers();
}

bool AppService::initialize(int argc, char** argv) {
    if (initialized_.load()) {
        return true;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_file_ = argv[++i];
        } else if (arg == "--stats-interval" && i + 1 < argc) {
            try {
                stats_interval_seconds_ = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid --stats-interval value: " << argv[i] << std::endl;
                return false;
            }
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return false;
        } else if (!handle_argument(arg, i, argc, argv)) {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage();
            return false;
        }
    }

    if (config_file_.empty()) {
        config_file_ = config::get_config_file_path(service_name_);
    }

    config_manager_ = std::make_unique<config::ProcessConfigManager>();
    if (!config_manager_->load_config(config_file_)) {
        std::cerr << "Failed to load configuration from " << config_file_ << std::endl;
        return false;
    }
    if (!config_manager_->validate_config()) {
        for (const auto& error : config_manager_->get_validation_errors()) {
            std::cerr << "Configuration error: " << error << std::endl;
        }
        return false;
    }

    logging::initialize_logging(config_manager_->get_log_file(),
                                logging::LogManager::parse_level(config_manager_->get_log_level(),
                                                                 logging::LogLevel::INFO));

    print_startup_banner();
    LOG_INFO_COMP("APP_SERVICE", "Config file: " + config_file_);

    setup_signal_handlers();

    if (!configure_service()) {
        LOG_ERROR_COMP("APP_SERVICE", "Service configuration failed");
        return false;
    }

    initialized_.store(true);
    LOG_INFO_COMP("APP_SERVICE", "Service initialized successfully");
    return true;
}

void AppService::start() {
    if (!initialized_.load()) {
        LOG_ERROR_COMP("APP_SERVICE", "Service not initialized");
        return;
    }

    if (running_.load()) {
        LOG_INFO_COMP("APP_SERVICE", "Service already running");
        return;
    }

    stop_requested_.store(false);
    running_.store(true);
    statistics_.start_time = std::chrono::system_clock::now();

    if (!start_service()) {
        LOG_ERROR_COMP("APP_SERVICE", "Failed to start service");
        stop();
        return;
    }

    if (stats_interval_seconds_ > 0) {
        stats_running_.store(true);
        stats_thread_ = std::thread(&AppService::stats_reporting_loop, this);
    }

    LOG_INFO_COMP("APP_SERVICE", "Service started successfully");

    // Main loop: the service does its work on its own threads
    while (running_.load() && !stop_requested_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        auto now = std::chrono::system_clock::now();
        auto uptime = std::chrono::duration_cast<std::chrono::seconds>(now - statistics_.start_time);
        statistics_.uptime_seconds.store(static_cast<uint64_t>(uptime.count()));

        if (dump_stats_requested_.exchange(false)) {
            print_service_stats();
        }
    }

    stop();
}

void AppService::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO_COMP("APP_SERVICE", "Stopping service...");

    stats_running_.store(false);
    if (stats_thread_.joinable()) {
        stats_thread_.join();
    }

    stop_service();

    print_shutdown_banner();
    logging::cleanup_logging();
}

void AppService::setup_signal_handlers() {
    g_instance.store(this);

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGUSR1, signal_handler);
    signal(SIGPIPE, SIG_IGN);
}

void AppService::restore_signal_handlers() {
    AppService* expected = this;
    if (g_instance.compare_exchange_strong(expected, nullptr)) {
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        signal(SIGUSR1, SIG_DFL);
    }
}

void AppService::stats_reporting_loop() {
    auto next_report = std::chrono::steady_clock::now() + std::chrono::seconds(stats_interval_seconds_);
    while (stats_running_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        if (std::chrono::steady_clock::now() < next_report) {
            continue;
        }
        next_report += std::chrono::seconds(stats_interval_seconds_);
        if (running_.load()) {
            print_service_stats();
        }
    }
}

// Only touches atomics; logging happens on the main loop
void AppService::signal_handler(int signal) {
    AppService* instance = g_instance.load();
    if (!instance) {
        return;
    }

    switch (signal) {
        case SIGINT:
        case SIGTERM:
            instance->stop_requested_.store(true);
            break;
        case SIGUSR1:
            instance->dump_stats_requested_.store(true);
            break;
        default:
            break;
    }
}

void AppService::print_usage() {
    std::cout << "Usage: " << service_name_ << " [options]\n"
              << "Options:\n"
              << "  --config <file>             Configuration file path\n"
              << "  --stats-interval <seconds>  Statistics reporting interval (0 disables)\n"
              << "  --help                      Show this help message\n";
    print_service_usage();
}

void AppService::print_startup_banner() {
    LOG_INFO_COMP("APP_SERVICE", "=========================================");
    LOG_INFO_COMP("APP_SERVICE", "  " + service_name_ + " starting");
    LOG_INFO_COMP("APP_SERVICE", "=========================================");
}

void AppService::print_shutdown_banner() {
    LOG_INFO_COMP("APP_SERVICE", "=========================================");
    LOG_INFO_COMP("APP_SERVICE", "  " + service_name_ + " stopped");
    LOG_INFO_COMP("APP_SERVICE", "=========================================");
}

} // namespace app_service
