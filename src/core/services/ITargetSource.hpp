/**
 * @file ITargetSource.hpp
 * @brief Interface for anything that yields candidate targets.
 */

#pragma once

#include "core/types/Target.hpp"

#include <string>
#include <vector>

namespace pingsweep::core {

/**
 * @brief Produces raw (identifier, label) entries for the TargetLoader.
 *
 * Sources neither validate nor deduplicate. A missing source throws
 * SourceNotFoundError; a source without any entry throws EmptySourceError.
 */
class ITargetSource {
public:
    virtual ~ITargetSource() = default;

    virtual std::vector<TargetEntry> read() = 0;

    /**
     * @brief Location of the source for log and error messages.
     */
    virtual std::string describe() const = 0;
};

} // namespace pingsweep::core
