// WatchParty - Watch-party signaling and process supervision core
// Log Rotation Component
//
// File output with size-based rotation into numbered backups, plus a
// console sink. Used for the main application log and for the per-relay
// output logs.

#ifndef WATCHPARTY_CORE_LOG_ROTATION_HPP
#define WATCHPARTY_CORE_LOG_ROTATION_HPP

#include "watchparty/core/result.hpp"
#include "watchparty/pal/log_pal.hpp"
#include "watchparty/pal/pal_types.hpp"

#include <cstdint>
#include <fstream>
#include <mutex>
#include <string>

namespace watchparty {
namespace core {

/**
 * @brief Rotation trigger types.
 */
enum class RotationType {
    None,       ///< No automatic rotation
    SizeBased   ///< Rotate when file exceeds size threshold
};

enum class LogRotationErrorCode {
    Success = 0,
    FileOpenFailed,
    RotationFailed,
    Unknown
};

struct LogRotationError {
    LogRotationErrorCode code;
    std::string message;

    LogRotationError(LogRotationErrorCode c = LogRotationErrorCode::Unknown,
                     std::string msg = "")
        : code(c), message(std::move(msg)) {}
};

/**
 * @brief Rotation policy for a FileSink.
 *
 * With SizeBased rotation, the active file is renamed to "<path>.1" once
 * it reaches maxFileSize; older backups shift up by one and anything
 * beyond maxBackupFiles is deleted.
 */
class RotationPolicy {
public:
    RotationPolicy();

    /**
     * @brief Size-based policy.
     * @param maxFileSize Rotation threshold in bytes
     * @param maxBackupFiles Number of numbered backups kept
     */
    static RotationPolicy sizeBased(uint64_t maxFileSize, uint32_t maxBackupFiles);

    RotationType getRotationType() const;
    void setRotationType(RotationType type);

    uint64_t getMaxFileSize() const;
    void setMaxFileSize(uint64_t size);

    uint32_t getMaxBackupFiles() const;
    void setMaxBackupFiles(uint32_t count);

private:
    RotationType type_ = RotationType::None;
    uint64_t maxFileSize_ = 0;
    uint32_t maxBackupFiles_ = 5;
};

/**
 * @brief File log sink with rotation support.
 *
 * Each write appends the message and a newline. Parent directories are
 * created on open.
 *
 * Thread Safety: all methods are thread-safe.
 */
class FileSink : public pal::ILogSink {
public:
    explicit FileSink(const std::string& filePath);
    FileSink(const std::string& filePath, const RotationPolicy& policy);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;
    FileSink(FileSink&&) = delete;
    FileSink& operator=(FileSink&&) = delete;

    // ILogSink interface
    void write(pal::LogLevel level, const std::string& message,
               const std::string& category, const pal::LogContext& context) override;
    void flush() override;
    std::string getName() const override;

    /**
     * @brief Append a raw line without going through the log pipeline.
     *
     * Used for verbatim process output.
     */
    void writeLine(const std::string& line);

    bool isOpen() const;
    uint64_t getCurrentFileSize() const;
    const std::string& getFilePath() const { return filePath_; }

    /**
     * @brief Rotate now regardless of policy thresholds.
     */
    Result<void, LogRotationError> forceRotation();

private:
    void appendLocked(const std::string& line);
    bool shouldRotate() const;
    Result<void, LogRotationError> performRotation();
    void rotateBackupFiles();
    void cleanupOldBackups();
    bool openFile();

    std::string filePath_;
    RotationPolicy policy_;
    mutable std::mutex mutex_;
    std::ofstream file_;
    uint64_t currentSize_ = 0;
};

/**
 * @brief Console (stderr) sink with optional ANSI colors per level.
 *
 * Messages are printed as received; formatting is done upstream.
 */
class ConsoleSink : public pal::ILogSink {
public:
    explicit ConsoleSink(bool useColors = true);
    ~ConsoleSink() override;

    // ILogSink interface
    void write(pal::LogLevel level, const std::string& message,
               const std::string& category, const pal::LogContext& context) override;
    void flush() override;
    std::string getName() const override;

private:
    bool useColors_;
    mutable std::mutex mutex_;
};

} // namespace core
} // namespace watchparty

#endif // WATCHPARTY_CORE_LOG_ROTATION_HPP
