#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Raised when an augmentation is given invalid bounds.
 *
 * Covers min > max, negative bounds, probabilities outside [0, 1] and
 * *_max bounds that exceed the sequence length of the batch being augmented.
 */
class ConfigurationError : public std::invalid_argument {
  public:
    explicit ConfigurationError(const std::string& message)
        : std::invalid_argument("Configuration error: " + message) {}
};

/**
 * @brief Raised when a batch does not have the shape an operation expects.
 */
class ShapeError : public std::runtime_error {
  public:
    explicit ShapeError(const std::string& message)
        : std::runtime_error("Shape error: " + message) {}
};
