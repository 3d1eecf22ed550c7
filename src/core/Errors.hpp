/**
 * @file Errors.hpp
 * @brief Exception taxonomy shared by all pingsweep modules.
 *
 * Per-target problems (invalid identifiers, failed probes) are carried as data
 * and never thrown. The exceptions below cover conditions that stop a whole
 * operation: a missing source, an unusable configuration, a broken store.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace pingsweep::core {

/**
 * @brief Base class for all pingsweep errors.
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A target source (file, inventory query, log directory) does not exist.
 */
class SourceNotFoundError : public Error {
public:
    explicit SourceNotFoundError(const std::string& location)
        : Error("Source not found: " + location), location_(location) {}

    const std::string& location() const noexcept { return location_; }

private:
    std::string location_;
};

/**
 * @brief A target source exists but yields no candidate entries.
 */
class EmptySourceError : public Error {
public:
    explicit EmptySourceError(const std::string& location)
        : Error("Source is empty: " + location), location_(location) {}

    const std::string& location() const noexcept { return location_; }

private:
    std::string location_;
};

/**
 * @brief Configuration file or command-line values are unusable.
 */
class ConfigError : public Error {
public:
    using Error::Error;
};

/**
 * @brief A five-field recurrence rule could not be parsed.
 */
class CronParseError : public Error {
public:
    using Error::Error;
};

/**
 * @brief The external result store rejected a write.
 */
class PersistenceError : public Error {
public:
    using Error::Error;
};

} // namespace pingsweep::core
