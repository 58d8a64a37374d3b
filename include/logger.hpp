#ifndef SEQAUG_LOGGER_HPP
#define SEQAUG_LOGGER_HPP

#include <fstream>
#include <memory>
#include <mutex>
#include <string>

/**
 * @brief Process-wide logger for augmentation setup and failures.
 *
 * The Logger class implements a singleton so configuration loading and
 * pipeline construction share one sink. Features include:
 * - Optional file output
 * - Optional echo to stderr
 * - Error level distinction
 * - Timestamp recording
 *
 * Logging starts disabled; nothing is written until startLogging() or
 * enableConsole() is called.
 */
class Logger {
  private:
    std::ofstream log_file;      ///< Output file stream for logging
    std::string log_file_path;   ///< Path to the current log file
    bool logging_enabled;        ///< Whether messages are written at all
    bool console_enabled;        ///< Whether messages are echoed to stderr
    mutable std::mutex write_mutex; ///< Guards the sink and flags across threads

    /// Singleton instance
    static std::unique_ptr<Logger> instance;

    Logger();

  public:
    /**
     * @brief Gets the singleton logger instance.
     * @return Reference to the global logger
     */
    static Logger& getInstance();

    /**
     * @brief Starts logging to a file.
     *
     * Opens the file (truncating it) and enables logging. Parent
     * directories are created when missing.
     *
     * @param file_path Path to log file (default: "seqaug.log")
     * @throws std::runtime_error if file cannot be opened
     */
    void startLogging(const std::string& file_path = "seqaug.log");

    /**
     * @brief Stops logging and closes the log file.
     */
    void stopLogging();

    /**
     * @brief Logs a message with optional error level.
     * @param message Text to log
     * @param is_error Whether to mark as error (default: false)
     */
    void log(const std::string& message, bool is_error = false);

    /**
     * @brief Echoes messages to stderr, with or without a log file.
     */
    void enableConsole(bool enabled = true);

    bool isLoggingEnabled() const;

    /**
     * @brief Path of the open log file, empty when logging only to stderr.
     */
    std::string logFilePath() const;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    ~Logger();
};

#endif // SEQAUG_LOGGER_HPP
