#include "core/types/Job.hpp"

namespace pingsweep::core {

std::string TargetSourceSpec::describe() const {
    if (targetFile) {
        return "file '" + *targetFile + "'";
    }
    if (query) {
        return "query '" + *query + "'";
    }
    return "default query";
}

bool JobDefinition::isValid() const {
    if (name.empty()) return false;
    if (source.targetFile && source.query) return false;
    if (source.targetFile && source.targetFile->empty()) return false;
    if (source.query && source.query->empty()) return false;
    return parameters.isValid();
}

} // namespace pingsweep::core
