#pragma once

#include <string>
#include <exception>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace trayhost {

using json = nlohmann::json;

// Error types as constants
namespace ErrorType {
    constexpr const char* OS_ERROR = "os_error";
    constexpr const char* ICON_LOADING_FAILED = "icon_loading_failed";
    constexpr const char* INVALID_CONFIG = "invalid_config";
    constexpr const char* UNSUPPORTED_OPERATION = "unsupported_operation";
    constexpr const char* FILE_ERROR = "file_error";
    constexpr const char* INTERNAL_ERROR = "internal_error";
}

// Base exception class for all tray errors
class TrayException : public std::exception {
public:
    TrayException(const std::string& message, const std::string& type = ErrorType::INTERNAL_ERROR)
        : message_(message), type_(type) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    const std::string& type() const { return type_; }

    virtual json to_json() const {
        return {
            {"error", {
                {"message", message_},
                {"type", type_}
            }}
        };
    }

protected:
    std::string message_;
    std::string type_;
};

// A native window, subclass, menu or icon could not be created
class OsErrorException : public TrayException {
public:
    OsErrorException(const std::string& operation, uint32_t error_code = 0)
        : TrayException(operation + " failed" +
                        (error_code ? " (error " + std::to_string(error_code) + ")" : ""),
                        ErrorType::OS_ERROR),
          operation_(operation), error_code_(error_code) {}

    const std::string& operation() const { return operation_; }
    uint32_t error_code() const { return error_code_; }

    json to_json() const override {
        auto j = TrayException::to_json();
        j["error"]["operation"] = operation_;
        if (error_code_ > 0) {
            j["error"]["error_code"] = error_code_;
        }
        return j;
    }

private:
    std::string operation_;
    uint32_t error_code_;
};

class IconLoadingException : public TrayException {
public:
    IconLoadingException(const std::string& details)
        : TrayException("Icon loading failed: " + details, ErrorType::ICON_LOADING_FAILED) {}
};

class InvalidConfigException : public TrayException {
public:
    InvalidConfigException(const std::string& message)
        : TrayException("Invalid configuration: " + message, ErrorType::INVALID_CONFIG) {}
};

class UnsupportedOperationException : public TrayException {
public:
    UnsupportedOperationException(const std::string& operation, const std::string& platform = "")
        : TrayException(operation + " not supported" + (platform.empty() ? "" : " on " + platform),
                        ErrorType::UNSUPPORTED_OPERATION) {}
};

class FileException : public TrayException {
public:
    FileException(const std::string& path, const std::string& reason)
        : TrayException("Cannot read '" + path + "': " + reason, ErrorType::FILE_ERROR),
          path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace trayhost
