/**
 * @file Target.hpp
 * @brief Probe targets and the loader's output types.
 *
 * A Target is a single IP literal or hostname that will receive one
 * reachability probe. Targets only live for the duration of a run.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pingsweep::core {

/**
 * @brief One identifier subject to a reachability probe.
 */
struct Target {
    std::string identifier;             ///< Normalized IP literal or hostname
    std::optional<std::string> label;   ///< Free-form classification tag
    std::optional<std::string> jobName; ///< Job that loaded this target, if any

    bool operator==(const Target& other) const = default;
};

/**
 * @brief A candidate identifier rejected before probing.
 */
struct InvalidTarget {
    std::string candidate;  ///< The identifier token that failed validation
    std::string rawLine;    ///< Source line (or row) it came from, comments stripped
    std::size_t lineNumber{0}; ///< 1-based line or row number in the source

    bool operator==(const InvalidTarget& other) const = default;
};

/**
 * @brief Raw (identifier, label) pair produced by a target source.
 *
 * Sources do not validate or deduplicate; the TargetLoader does both.
 */
struct TargetEntry {
    std::string candidate;
    std::optional<std::string> label;
    std::string rawLine;
    std::size_t lineNumber{0};
};

/**
 * @brief Result of loading a target source.
 */
struct TargetList {
    std::vector<Target> targets;        ///< Valid, unique targets in first-seen order
    std::vector<InvalidTarget> invalid; ///< Rejected candidates in source order
    std::size_t duplicatesDropped{0};   ///< Entries discarded by deduplication

    [[nodiscard]] bool empty() const { return targets.empty(); }
};

/**
 * @brief Normalizes an identifier for comparison (trimmed, ASCII lower-case).
 * @param identifier Raw identifier text.
 * @return Normalized identifier.
 */
std::string normalizeIdentifier(const std::string& identifier);

/**
 * @brief Checks whether a string is an IPv4 or IPv6 literal.
 */
bool isIpLiteral(const std::string& identifier);

/**
 * @brief Checks permissive hostname syntax.
 *
 * Letters, digits, '-' and '.', non-empty dot-separated labels of at most 63
 * characters that do not start or end with '-', 253 characters overall. A name
 * whose last label is numeric must be a valid IPv4 literal instead.
 */
bool isValidHostname(const std::string& identifier);

/**
 * @brief Returns true if the identifier is an IP literal or a valid hostname.
 */
bool isValidTargetIdentifier(const std::string& identifier);

} // namespace pingsweep::core
