// WatchParty - Watch-party signaling and process supervision core
// Log Rotation Component Implementation

#include "watchparty/core/log_rotation.hpp"

#include <filesystem>
#include <iostream>
#include <system_error>

namespace watchparty {
namespace core {

namespace fs = std::filesystem;

// =============================================================================
// RotationPolicy Implementation
// =============================================================================

RotationPolicy::RotationPolicy() = default;

RotationPolicy RotationPolicy::sizeBased(uint64_t maxFileSize, uint32_t maxBackupFiles) {
    RotationPolicy policy;
    policy.setRotationType(RotationType::SizeBased);
    policy.setMaxFileSize(maxFileSize);
    policy.setMaxBackupFiles(maxBackupFiles);
    return policy;
}

RotationType RotationPolicy::getRotationType() const {
    return type_;
}

void RotationPolicy::setRotationType(RotationType type) {
    type_ = type;
}

uint64_t RotationPolicy::getMaxFileSize() const {
    return maxFileSize_;
}

void RotationPolicy::setMaxFileSize(uint64_t size) {
    maxFileSize_ = size;
}

uint32_t RotationPolicy::getMaxBackupFiles() const {
    return maxBackupFiles_;
}

void RotationPolicy::setMaxBackupFiles(uint32_t count) {
    maxBackupFiles_ = count;
}

// =============================================================================
// FileSink Implementation
// =============================================================================

FileSink::FileSink(const std::string& filePath)
    : FileSink(filePath, RotationPolicy())
{
}

FileSink::FileSink(const std::string& filePath, const RotationPolicy& policy)
    : filePath_(filePath)
    , policy_(policy)
{
    openFile();
}

FileSink::~FileSink() {
    flush();
    if (file_.is_open()) {
        file_.close();
    }
}

void FileSink::write(pal::LogLevel level, const std::string& message,
                     const std::string& category, const pal::LogContext& context)
{
    (void)level;
    (void)category;
    (void)context;

    std::lock_guard<std::mutex> lock(mutex_);
    appendLocked(message);
}

void FileSink::writeLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    appendLocked(line);
    file_.flush();
}

void FileSink::appendLocked(const std::string& line) {
    if (!file_.is_open()) {
        return;
    }

    if (shouldRotate()) {
        // On failure performRotation reopens the original file; keep appending.
        (void)performRotation();
        if (!file_.is_open()) {
            return;
        }
    }

    file_ << line << "\n";
    currentSize_ += line.size() + 1;
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

std::string FileSink::getName() const {
    return "FileSink";
}

bool FileSink::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

uint64_t FileSink::getCurrentFileSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return currentSize_;
}

Result<void, LogRotationError> FileSink::forceRotation() {
    std::lock_guard<std::mutex> lock(mutex_);
    return performRotation();
}

bool FileSink::shouldRotate() const {
    switch (policy_.getRotationType()) {
        case RotationType::SizeBased:
            return policy_.getMaxFileSize() > 0 &&
                   currentSize_ >= policy_.getMaxFileSize();
        case RotationType::None:
        default:
            return false;
    }
}

Result<void, LogRotationError> FileSink::performRotation() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }

    rotateBackupFiles();

    std::error_code ec;
    if (fs::exists(filePath_, ec)) {
        fs::rename(filePath_, filePath_ + ".1", ec);
        if (ec) {
            openFile();
            return Result<void, LogRotationError>::error(
                LogRotationError(LogRotationErrorCode::RotationFailed,
                                 "Failed to rename log file: " + ec.message()));
        }
    }

    cleanupOldBackups();

    if (!openFile()) {
        return Result<void, LogRotationError>::error(
            LogRotationError(LogRotationErrorCode::FileOpenFailed,
                             "Failed to open new log file after rotation"));
    }

    return Result<void, LogRotationError>::success();
}

void FileSink::rotateBackupFiles() {
    // Move .n-1 to .n, .n-2 to .n-1, etc.
    for (int i = static_cast<int>(policy_.getMaxBackupFiles()) - 1; i >= 1; --i) {
        std::string oldName = filePath_ + "." + std::to_string(i);
        std::string newName = filePath_ + "." + std::to_string(i + 1);

        std::error_code ec;
        if (fs::exists(oldName, ec)) {
            fs::rename(oldName, newName, ec);
        }
    }
}

void FileSink::cleanupOldBackups() {
    uint32_t maxBackups = policy_.getMaxBackupFiles();

    for (uint32_t i = maxBackups + 1; i <= maxBackups + 10; ++i) {
        std::error_code ec;
        fs::remove(filePath_ + "." + std::to_string(i), ec);
    }
}

bool FileSink::openFile() {
    fs::path path(filePath_);
    std::error_code ec;
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path(), ec);
    }

    file_.open(filePath_, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        return false;
    }

    auto size = fs::file_size(filePath_, ec);
    currentSize_ = ec ? 0 : static_cast<uint64_t>(size);
    return true;
}

// =============================================================================
// ConsoleSink Implementation
// =============================================================================

ConsoleSink::ConsoleSink(bool useColors)
    : useColors_(useColors)
{
}

ConsoleSink::~ConsoleSink() = default;

void ConsoleSink::write(pal::LogLevel level, const std::string& message,
                        const std::string& category, const pal::LogContext& context)
{
    (void)category;
    (void)context;

    std::lock_guard<std::mutex> lock(mutex_);

    const char* colorCode = "";
    const char* resetCode = useColors_ ? "\033[0m" : "";

    if (useColors_) {
        switch (level) {
            case pal::LogLevel::Trace:
            case pal::LogLevel::Debug:
                colorCode = "\033[36m";  // Cyan
                break;
            case pal::LogLevel::Info:
                colorCode = "\033[32m";  // Green
                break;
            case pal::LogLevel::Warning:
                colorCode = "\033[33m";  // Yellow
                break;
            case pal::LogLevel::Error:
                colorCode = "\033[31m";  // Red
                break;
            case pal::LogLevel::Critical:
                colorCode = "\033[35m";  // Magenta
                break;
            default:
                break;
        }
    }

    std::cerr << colorCode << message << resetCode << '\n';
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
}

std::string ConsoleSink::getName() const {
    return "ConsoleSink";
}

} // namespace core
} // namespace watchparty
