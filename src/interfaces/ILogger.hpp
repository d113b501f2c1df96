#pragma once

#include <string>

#include "../config/LogUtils.hpp"

class ILogger {
public:
    virtual ~ILogger() noexcept = default;
    virtual void info(const std::string& message) = 0;    
    virtual void debug(const std::string& message) = 0;
    virtual void warn(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
    virtual void setup(const std::string& message) = 0;
    virtual LogUtils::LogLevel getLogLevel() const = 0;

    // Guard for messages that are expensive to build
    bool isDebugEnabled() const { return getLogLevel() <= LogUtils::LogLevel::DEBUG; }
};
