#include "core/types/HistoryRecord.hpp"

namespace pingsweep::core {

Classification HistoryRecord::classification() const {
    if (total > 0 && successes == total) {
        return Classification::Always;
    }
    if (total > 0 && successes == 0) {
        return Classification::Never;
    }
    return Classification::Sometimes;
}

std::optional<double> HistoryRecord::successRate() const {
    if (classification() != Classification::Sometimes || total == 0) {
        return std::nullopt;
    }
    return 100.0 * static_cast<double>(successes) / static_cast<double>(total);
}

std::string classificationToString(Classification classification) {
    switch (classification) {
    case Classification::Always:
        return "Always";
    case Classification::Never:
        return "Never";
    case Classification::Sometimes:
        return "Sometimes";
    }
    return "Sometimes";
}

} // namespace pingsweep::core
