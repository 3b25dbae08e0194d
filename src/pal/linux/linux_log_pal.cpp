// WatchParty - Watch-party signaling and process supervision core
// Linux Log PAL Implementation

#include "watchparty/pal/linux/linux_log_pal.hpp"

#if defined(__linux__)

#include <syslog.h>

#include <algorithm>
#include <cstdio>

namespace watchparty {
namespace pal {
namespace linux {

// =============================================================================
// Constructor / Destructor
// =============================================================================

LinuxLogPAL::LinuxLogPAL(std::string ident, bool echoToStderr)
    : ident_(std::move(ident))
    , echoToStderr_(echoToStderr)
{
    // openlog keeps the pointer, ident_ outlives the syslog session
    openlog(ident_.c_str(), LOG_PID | LOG_NDELAY, LOG_USER);
    syslogOpened_ = true;
}

LinuxLogPAL::~LinuxLogPAL() {
    flush();

    if (syslogOpened_) {
        closelog();
        syslogOpened_ = false;
    }
}

// =============================================================================
// Logging Operations
// =============================================================================

void LinuxLogPAL::log(
    LogLevel level,
    const std::string& message,
    const std::string& category,
    const LogContext& context
) {
    if (level == LogLevel::Off ||
        static_cast<uint32_t>(level) < static_cast<uint32_t>(minLevel_.load())) {
        return;
    }

    logToPlatform(level, message, category);

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        sink->write(level, message, category, context);
    }
}

void LinuxLogPAL::logToPlatform(
    LogLevel level,
    const std::string& message,
    const std::string& category
) {
    if (syslogEnabled_.load()) {
        syslog(toSyslogPriority(level), "[%s] %s", category.c_str(), message.c_str());
    }

    if (echoToStderr_.load()) {
        fprintf(stderr, "[%s] [%s] %s\n", logLevelName(level), category.c_str(), message.c_str());
    }
}

int LinuxLogPAL::toSyslogPriority(LogLevel level) const {
    switch (level) {
        case LogLevel::Trace:
        case LogLevel::Debug:
            return LOG_DEBUG;
        case LogLevel::Info:
            return LOG_INFO;
        case LogLevel::Warning:
            return LOG_WARNING;
        case LogLevel::Error:
            return LOG_ERR;
        case LogLevel::Critical:
            return LOG_CRIT;
        case LogLevel::Off:
        default:
            return LOG_DEBUG;
    }
}

// =============================================================================
// Level and Output Management
// =============================================================================

void LinuxLogPAL::setMinLevel(LogLevel level) {
    minLevel_ = level;
}

LogLevel LinuxLogPAL::getMinLevel() const {
    return minLevel_.load();
}

void LinuxLogPAL::setEchoToStderr(bool enabled) {
    echoToStderr_ = enabled;
}

void LinuxLogPAL::setSyslogEnabled(bool enabled) {
    syslogEnabled_ = enabled;
}

// =============================================================================
// Sink Management
// =============================================================================

void LinuxLogPAL::flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void LinuxLogPAL::addSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void LinuxLogPAL::removeSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) {
        return;
    }

    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(
        std::remove(sinks_.begin(), sinks_.end(), sink),
        sinks_.end()
    );
}

size_t LinuxLogPAL::sinkCount() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_.size();
}

} // namespace linux
} // namespace pal
} // namespace watchparty

#endif // defined(__linux__)
