#pragma once
#include <memory>
#include <string>
#include <atomic>
#include <functional>
#include <thread>
#include <chrono>
#include <signal.h>
#include <vector>
#include "../config/process_config_manager.hpp"

namespace app_service {

/**
 * Application Service Base Class
 *
 * Base class for the chat client executables:
 * - Process lifecycle and command line parsing
 * - Signal handling (SIGINT, SIGTERM, SIGUSR1)
 * - Configuration and logging setup
 * - Periodic statistics reporting
 */
class AppService {
public:
    AppService(const std::string& service_name);
    virtual ~AppService();

    // Process lifecycle
    bool initialize(int argc, char** argv);
    void start();
    void stop();

    // Asks the main loop to exit; safe from any thread and from signal handlers
    void request_stop() { stop_requested_.store(true); }

    bool is_running() const { return running_.load(); }

    // Configuration
    void set_config_file(const std::string& config_file) { config_file_ = config_file; }
    void set_stats_interval(int seconds) { stats_interval_seconds_ = seconds; }

    // Statistics
    struct Statistics {
        std::atomic<uint64_t> messages_sent{0};
        std::atomic<uint64_t> events_received{0};
        std::atomic<uint64_t> errors_count{0};
        std::atomic<uint64_t> reconnects{0};
        std::atomic<uint64_t> uptime_seconds{0};

        std::chrono::system_clock::time_point start_time;

        void reset() {
            messages_sent.store(0);
            events_received.store(0);
            errors_count.store(0);
            reconnects.store(0);
            uptime_seconds.store(0);
            start_time = std::chrono::system_clock::now();
        }
    };

    const Statistics& get_statistics() const { return statistics_; }
    void reset_statistics() { statistics_.reset(); }

protected:
    virtual bool configure_service() = 0;
    virtual bool start_service() = 0;
    virtual void stop_service() = 0;
    virtual void print_service_stats() = 0;

    // Service specific flags; return true if the argument (and its value) was consumed
    virtual bool handle_argument(const std::string& arg, int& index, int argc, char** argv) {
        (void)arg; (void)index; (void)argc; (void)argv;
        return false;
    }
    virtual void print_service_usage() {}

    void increment_sent_count() { statistics_.messages_sent.fetch_add(1); }
    void increment_event_count() { statistics_.events_received.fetch_add(1); }
    void increment_error_count() { statistics_.errors_count.fetch_add(1); }
    void increment_reconnect_count() { statistics_.reconnects.fetch_add(1); }

    config::ProcessConfigManager* get_config_manager() { return config_manager_.get(); }
    const std::string& get_service_name() const { return service_name_; }
    const std::string& get_config_file() const { return config_file_; }

private:
    std::string service_name_;
    std::string config_file_;
    int stats_interval_seconds_{0};

    std::atomic<bool> running_{false};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> dump_stats_requested_{false};

    std::unique_ptr<config::ProcessConfigManager> config_manager_;
    std::thread stats_thread_;
    std::atomic<bool> stats_running_{false};

    Statistics statistics_;

    void setup_signal_handlers();
    void restore_signal_handlers();
    void stats_reporting_loop();
    void print_usage();
    void print_startup_banner();
    void print_shutdown_banner();

    static std::atomic<AppService*> g_instance;
    static void signal_handler(int signal);
};

} // namespace app_service
