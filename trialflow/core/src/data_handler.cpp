#include <trialflow/core/data_handler.hpp>

namespace trialflow::core {

const char* to_string(DataType type) noexcept {
    switch (type) {
        case DataType::SessionInfo: return "session_info";
        case DataType::Trials:      return "trials";
        case DataType::Trackers:    return "trackers";
        case DataType::Other:       return "other";
    }
    return "other";
}

} // namespace trialflow::core
