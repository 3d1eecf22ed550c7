#include "infrastructure/targets/TargetLoader.hpp"

#include <spdlog/spdlog.h>

#include <unordered_set>

namespace pingsweep::infra {

TargetLoader::TargetLoader(std::optional<std::string> jobName) : jobName_(std::move(jobName)) {}

core::TargetList TargetLoader::load(core::ITargetSource& source) const {
    auto entries = source.read();
    auto list = normalize(entries);

    spdlog::info("Loaded {} targets from {} ({} invalid, {} duplicates dropped)",
                 list.targets.size(), source.describe(), list.invalid.size(),
                 list.duplicatesDropped);
    return list;
}

core::TargetList TargetLoader::normalize(const std::vector<core::TargetEntry>& entries) const {
    core::TargetList list;
    std::unordered_set<std::string> seen;

    for (const auto& entry : entries) {
        auto identifier = core::normalizeIdentifier(entry.candidate);

        if (!core::isValidTargetIdentifier(identifier)) {
            spdlog::debug("Rejecting invalid target '{}' on line {}", entry.candidate,
                          entry.lineNumber);
            list.invalid.push_back(core::InvalidTarget{
                .candidate = entry.candidate,
                .rawLine = entry.rawLine,
                .lineNumber = entry.lineNumber,
            });
            continue;
        }

        if (!seen.insert(identifier).second) {
            ++list.duplicatesDropped;
            continue;
        }

        list.targets.push_back(core::Target{
            .identifier = std::move(identifier),
            .label = entry.label,
            .jobName = jobName_,
        });
    }

    return list;
}

} // namespace pingsweep::infra
