#include "../include/logger.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <stdexcept>

std::unique_ptr<Logger> Logger::instance = nullptr;

Logger::Logger() : logging_enabled(false), console_enabled(false) {}

Logger::~Logger() {
    stopLogging();
}

Logger& Logger::getInstance() {
    if (!instance) {
        instance = std::unique_ptr<Logger>(new Logger());
    }
    return *instance;
}

namespace {

std::string current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::string timestamp(std::ctime(&time));
    return timestamp.substr(0, timestamp.length() - 1); // Remove trailing newline
}

} // namespace

void Logger::startLogging(const std::string& file_path) {
    stopLogging();

    std::filesystem::path path(file_path);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::lock_guard<std::mutex> lock(write_mutex);
    log_file.open(file_path, std::ios::out | std::ios::trunc);
    if (!log_file.is_open()) {
        throw std::runtime_error("Failed to open log file: " + file_path);
    }
    log_file_path = file_path;
    logging_enabled = true;

    log_file << "=== Logging started at " << current_timestamp() << " ===" << std::endl;
}

void Logger::stopLogging() {
    std::lock_guard<std::mutex> lock(write_mutex);
    if (log_file.is_open()) {
        log_file << "=== Logging stopped at " << current_timestamp() << " ===" << std::endl;
        log_file.close();
    }
    log_file_path.clear();
    logging_enabled = console_enabled;
}

void Logger::enableConsole(bool enabled) {
    std::lock_guard<std::mutex> lock(write_mutex);
    console_enabled = enabled;
    logging_enabled = enabled || log_file.is_open();
}

bool Logger::isLoggingEnabled() const {
    std::lock_guard<std::mutex> lock(write_mutex);
    return logging_enabled;
}

std::string Logger::logFilePath() const {
    std::lock_guard<std::mutex> lock(write_mutex);
    return log_file_path;
}

void Logger::log(const std::string& message, bool is_error) {
    std::lock_guard<std::mutex> lock(write_mutex);
    if (!logging_enabled) {
        return;
    }

    const std::string line =
        "[" + current_timestamp() + "] " + (is_error ? "ERROR: " : "INFO: ") + message;
    if (log_file.is_open()) {
        log_file << line << std::endl;
    }
    if (console_enabled) {
        std::cerr << line << std::endl;
    }
}
