#pragma once

#include <stdexcept>
#include <string>

namespace rangeshift {

class RangeshiftError : public std::runtime_error {
public:
    explicit RangeshiftError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public RangeshiftError {
public:
    explicit ConfigError(const std::string& message)
        : RangeshiftError("Config error: " + message) {}
};

class ValidationError : public RangeshiftError {
public:
    explicit ValidationError(const std::string& message)
        : RangeshiftError("Validation error: " + message) {}
};

class IOError : public RangeshiftError {
public:
    explicit IOError(const std::string& message)
        : RangeshiftError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

// Band, year-order or grid mismatch. Never coerced, never retried.
class ShapeError : public RangeshiftError {
public:
    explicit ShapeError(const std::string& message)
        : RangeshiftError("Shape error: " + message) {}
};

class InsufficientDataError : public RangeshiftError {
public:
    explicit InsufficientDataError(const std::string& message)
        : RangeshiftError("Insufficient data: " + message) {}
};

// Contract violation such as classifying without a fitted model.
class ModelStateError : public RangeshiftError {
public:
    explicit ModelStateError(const std::string& message)
        : RangeshiftError("Model state error: " + message) {}
};

class PipelineError : public RangeshiftError {
public:
    explicit PipelineError(const std::string& message)
        : RangeshiftError("Pipeline error: " + message) {}
};

} // namespace rangeshift
