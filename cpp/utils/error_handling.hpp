#pragma once

/**
 * Standardized error handling utilities
 *
 * Result<T> for operations that report failure as a value, and wrappers that
 * keep subscriber and adapter callbacks from unwinding into background threads.
 */

#include <string>
#include <exception>
#include <stdexcept>
#include <functional>
#include <optional>
#include "logging/log_helper.hpp"

namespace error_handling {

/**
 * Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result success(T value) {
        Result result;
        result.value_ = std::move(value);
        result.success_ = true;
        return result;
    }

    static Result error(const std::string& error_message) {
        Result result;
        result.error_message_ = error_message;
        result.success_ = false;
        return result;
    }

    bool is_success() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const {
        if (!success_) {
            throw std::runtime_error("Attempted to get value from error Result: " + error_message_);
        }
        return value_.value();
    }

    T& value() {
        if (!success_) {
            throw std::runtime_error("Attempted to get value from error Result: " + error_message_);
        }
        return value_.value();
    }

    const std::string& error() const {
        if (success_) {
            throw std::runtime_error("Attempted to get error from success Result");
        }
        return error_message_;
    }

    explicit operator bool() const { return success_; }
    const T& operator*() const { return value(); }
    T& operator*() { return value(); }

private:
    std::optional<T> value_;
    std::string error_message_;
    bool success_{false};
};

/**
 * Execute a void function with exception handling and logging
 *
 * @return true if successful, false otherwise
 */
template<typename Func>
bool safe_execute_void(Func&& func, const std::string& component_name, const std::string& operation_name) {
    try {
        func();
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR_COMP(component_name, operation_name + " failed: " + std::string(e.what()));
        return false;
    } catch (...) {
        LOG_ERROR_COMP(component_name, operation_name + " failed with unknown exception");
        return false;
    }
}

/**
 * Execute a callback with exception handling
 * Prevents subscriber exceptions from escaping into transport or playback threads
 */
template<typename Callback, typename... Args>
void safe_callback(Callback&& callback, const std::string& component_name,
                   const std::string& operation_name, Args&&... args) {
    if (!callback) {
        return;
    }

    try {
        callback(std::forward<Args>(args)...);
    } catch (const std::exception& e) {
        LOG_ERROR_COMP(component_name, "Exception in " + operation_name + " callback: " + std::string(e.what()));
    } catch (...) {
        LOG_ERROR_COMP(component_name, "Unknown exception in " + operation_name + " callback");
    }
}

} // namespace error_handling
