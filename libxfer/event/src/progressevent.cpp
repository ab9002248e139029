#include "progressevent.hpp"

namespace xfer::event
{
const char *to_string(ProgressEventType event_type)
{
    switch (event_type)
    {
        case ProgressEventType::BYTE_TRANSFER: return "BYTE_TRANSFER";
        case ProgressEventType::STARTED: return "STARTED";
        case ProgressEventType::COMPLETED: return "COMPLETED";
        case ProgressEventType::FAILED: return "FAILED";
        case ProgressEventType::CANCELED: return "CANCELED";
        case ProgressEventType::RESET: return "RESET";
        case ProgressEventType::PART_STARTED: return "PART_STARTED";
        case ProgressEventType::PART_COMPLETED: return "PART_COMPLETED";
        case ProgressEventType::PART_FAILED: return "PART_FAILED";
        default: return "INVALID_EVENT_TYPE";
    }
}
}  // namespace xfer::event
