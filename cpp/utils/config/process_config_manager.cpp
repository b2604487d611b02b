#include "process_config_manager.hpp"
#include "../logging/log_helper.hpp"
#include <stdexcept>

namespace config {

ProcessConfigManager::ProcessConfigManager() = default;

bool ProcessConfigManager::load_config(const std::string& config_file) {
    try {
        std::string content = read_file(config_file);
        return load_config_from_string(content);
    } catch (const std::exception& e) {
        LOG_ERROR_COMP("CONFIG", "Error loading config file " + config_file + ": " + e.what());
        return false;
    }
}

bool ProcessConfigManager::load_config_from_string(const std::string& config_content) {
    config_data_.clear();
    validation_errors_.clear();
    
    std::istringstream stream(config_content);
    std::string line;
    std::string current_section;
    
    while (std::getline(stream, line)) {
        line = trim(line);
        
        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }
        
        if (is_section_line(line)) {
            current_section = extract_section_name(line);
            config_data_[current_section] = std::map<std::string, ConfigValue>();
        } else if (is_key_value_line(line)) {
            if (current_section.empty()) {
                validation_errors_.push_back("Key-value pair found outside of section: " + line);
                continue;
            }
            
            auto [key, value] = extract_key_value(line);
            config_data_[current_section][key] = ConfigValue(value);
        }
    }
    
    return validation_errors_.empty();
}


ConfigValue ProcessConfigManager::get_value(const std::string& section, const std::string& key) const {
    auto section_it = config_data_.find(section);
    if (section_it == config_data_.end()) {
        return ConfigValue("");
    }
    
    auto key_it = section_it->second.find(key);
    if (key_it == section_it->second.end()) {
        return ConfigValue("");
    }
    
    return key_it->second;
}

ConfigValue ProcessConfigManager::get_value(const std::string& section, const std::string& key, const ConfigValue& default_value) const {
    auto section_it = config_data_.find(section);
    if (section_it == config_data_.end()) {
        return default_value;
    }
    
    auto key_it = section_it->second.find(key);
    if (key_it == section_it->second.end()) {
        return default_value;
    }
    
    return key_it->second;
}

std::string ProcessConfigManager::get_string(const std::string& section, const std::string& key, const std::string& default_value) const {
    return get_value(section, key, ConfigValue(default_value)).as_string();
}

int ProcessConfigManager::get_int(const std::string& section, const std::string& key, int default_value) const {
    try {
        return get_value(section, key, ConfigValue(default_value)).as_int();
    } catch (const std::exception&) {
        LOG_WARN_COMP("CONFIG", "Invalid integer for [" + section + "] " + key + ", using default");
        return default_value;
    }
}

double ProcessConfigManager::get_double(const std::string& section, const std::string& key, double default_value) const {
    try {
        return get_value(section, key, ConfigValue(default_value)).as_double();
    } catch (const std::exception&) {
        LOG_WARN_COMP("CONFIG", "Invalid number for [" + section + "] " + key + ", using default");
        return default_value;
    }
}

bool ProcessConfigManager::get_bool(const std::string& section, const std::string& key, bool default_value) const {
    return get_value(section, key, ConfigValue(default_value)).as_bool();
}

std::vector<std::string> ProcessConfigManager::get_keys(const std::string& section) const {
    std::vector<std::string> keys;
    auto section_it = config_data_.find(section);
    if (section_it != config_data_.end()) {
        for (const auto& [key, _] : section_it->second) {
            keys.push_back(key);
        }
    }
    return keys;
}

bool ProcessConfigManager::has_section(const std::string& section) const {
    return config_data_.find(section) != config_data_.end();
}

bool ProcessConfigManager::validate_config() const {
    // Note: validation_errors_ is mutable for const methods
    validation_errors_.clear();

    // Collect every problem so the user can fix the file in one pass
    for (const auto& [section, keys] : config_data_) {
        if (!validate_section(section)) {
            continue;
        }

        for (const auto& [key, value] : keys) {
            validate_key_value(section, key, value);
        }
    }

    return validation_errors_.empty();
}

std::vector<std::string> ProcessConfigManager::get_validation_errors() const {
    return validation_errors_;
}

std::string ProcessConfigManager::get_log_file() const {
    return get_string("logging", "file", "");
}

std::string ProcessConfigManager::get_log_level() const {
    return get_string("logging", "level", "INFO");
}

std::string ProcessConfigManager::get_server_uri() const {
    return get_string("server", "uri", "ws://localhost:8000/api/v1/ws/chat");
}

std::string ProcessConfigManager::get_user_id() const {
    return get_string("server", "user_id", "User");
}

std::string ProcessConfigManager::trim(const std::string& str) const {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string ProcessConfigManager::to_lower(const std::string& str) const {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

bool ProcessConfigManager::is_section_line(const std::string& line) const {
    return line.length() >= 3 && line[0] == '[' && line[line.length() - 1] == ']';
}

bool ProcessConfigManager::is_key_value_line(const std::string& line) const {
    return line.find('=') != std::string::npos;
}

std::string ProcessConfigManager::extract_section_name(const std::string& line) const {
    return trim(line.substr(1, line.length() - 2));
}

std::pair<std::string, std::string> ProcessConfigManager::extract_key_value(const std::string& line) const {
    size_t eq_pos = line.find('=');
    std::string key = trim(line.substr(0, eq_pos));
    std::string value = trim(line.substr(eq_pos + 1));
    return {key, value};
}

bool ProcessConfigManager::validate_section(const std::string& section) const {
    if (section.empty()) {
        validation_errors_.push_back("Empty section name");
        return false;
    }
    return true;
}

bool ProcessConfigManager::validate_key_value(const std::string& section, const std::string& key, const ConfigValue& value) const {
    if (key.empty()) {
        validation_errors_.push_back("Empty key in section [" + section + "]");
        return false;
    }

    // Durations and counts must be non-negative integers
    bool numeric = (section == "websocket" && key != "profile" && key != "infinite_reconnect" &&
                    key != "expect_status_message") ||
                   (section == "audio" && key == "sample_rate") ||
                   (section == "livekit" && key == "ttl_seconds") ||
                   (section == "agent" && key == "max_tokens");
    if (numeric) {
        const std::string text = value.as_string();
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
            validation_errors_.push_back("Expected non-negative integer for [" + section + "] " + key + ": " + text);
            return false;
        }
    }

    if (section == "websocket" && key == "profile") {
        const std::string profile = to_lower(value.as_string());
        if (profile != "mobile" && profile != "stable") {
            validation_errors_.push_back("Unknown websocket profile: " + value.as_string());
            return false;
        }
    }
    return true;
}

std::string ProcessConfigManager::read_file(const std::string& filename) const {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }
    
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

std::string get_config_file_path(const std::string& process_type) {
    return "config/" + process_type + ".ini";
}

} // namespace config
