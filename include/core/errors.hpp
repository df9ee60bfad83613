#pragma once
#include <stdexcept>
#include <string>

namespace core {

// Series that cannot be analysed at all (unordered timestamps, broken bars).
class InvalidSeries : public std::runtime_error {
public:
    explicit InvalidSeries(const std::string& what) : std::runtime_error(what) {}
};

// Malformed or out-of-range configuration value.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// JSON document that does not describe an analysis result.
class ResultFormatError : public std::runtime_error {
public:
    explicit ResultFormatError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace core
