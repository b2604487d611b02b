#include "logger.hpp"

namespace logging {

void initialize_logging(const std::string& log_file, LogLevel min_level) {
    LogManager::get_instance().initialize(log_file, min_level);
    Logger("LOGGING").info("Logging system initialized" +
                           (log_file.empty() ? std::string() : " (file: " + log_file + ")"));
}

void cleanup_logging() {
    LogManager::get_instance().shutdown();
}

} // namespace logging
