#include "tile_timeline/batch_report.hpp"

namespace tile_timeline {

std::string_view to_string(StepStatus status) noexcept {
    switch (status) {
        case StepStatus::Succeeded:
            return "succeeded";
        case StepStatus::Skipped:
            return "skipped";
        case StepStatus::Failed:
            return "failed";
    }
    return "unknown";
}

}  // namespace tile_timeline
