#pragma once

#include "core/services/ITargetSource.hpp"
#include "core/types/Target.hpp"

#include <optional>
#include <string>
#include <vector>

namespace pingsweep::infra {

/**
 * @brief Turns raw source entries into a validated, deduplicated target list.
 *
 * Identifiers are normalized (trimmed, lower-cased) before comparison. The
 * first occurrence of an identifier wins; later duplicates are dropped
 * silently. Candidates that are neither IP literals nor valid hostnames are
 * moved to the invalid set together with their source line.
 */
class TargetLoader {
public:
    /**
     * @brief Constructs a loader.
     * @param jobName Job name stamped on every loaded target, if any.
     */
    explicit TargetLoader(std::optional<std::string> jobName = std::nullopt);

    /**
     * @brief Reads a source and normalizes its entries.
     * @throws core::SourceNotFoundError, core::EmptySourceError from the source.
     */
    core::TargetList load(core::ITargetSource& source) const;

    /**
     * @brief Normalizes, deduplicates and validates already-read entries.
     */
    core::TargetList normalize(const std::vector<core::TargetEntry>& entries) const;

private:
    std::optional<std::string> jobName_;
};

} // namespace pingsweep::infra
