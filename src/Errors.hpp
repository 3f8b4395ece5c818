#pragma once
#include <stdexcept>
#include <string>

namespace Leontief {

class LeontiefError : public std::runtime_error {
public:
    explicit LeontiefError(const std::string& message) : std::runtime_error(message) {}
};

// Row labels of the table do not line up with its flow columns, or the
// table has the wrong shape. Construction aborts.
class DataIntegrityError : public LeontiefError {
public:
    explicit DataIntegrityError(const std::string& message)
        : LeontiefError("Data integrity error: " + message) {}
};

// (I - A) cannot be inverted.
class SingularMatrixError : public LeontiefError {
public:
    explicit SingularMatrixError(const std::string& message)
        : LeontiefError("Singular matrix: " + message) {}
};

class InvalidShockTypeError : public LeontiefError {
public:
    explicit InvalidShockTypeError(const std::string& type)
        : LeontiefError("Unknown shock type " + type) {}
};

class InvalidSampleSizeError : public LeontiefError {
public:
    explicit InvalidSampleSizeError(const std::string& message)
        : LeontiefError("Invalid sample size: " + message) {}
};

class InvalidShockSizeError : public LeontiefError {
public:
    explicit InvalidShockSizeError(const std::string& message)
        : LeontiefError("Invalid shock size: " + message) {}
};

class ConfigError : public LeontiefError {
public:
    explicit ConfigError(const std::string& message)
        : LeontiefError("Config error: " + message) {}
};

class IoError : public LeontiefError {
public:
    explicit IoError(const std::string& message)
        : LeontiefError("IO error: " + message) {}
};

} // namespace Leontief
