#ifndef XFER_EVENT_PROGRESSEVENT_HPP_
#define XFER_EVENT_PROGRESSEVENT_HPP_

#include <ostream>

namespace xfer::event
{
enum class ProgressEventType : int
{
    BYTE_TRANSFER  = 0,
    STARTED        = 1,
    COMPLETED      = 2,
    FAILED         = 4,
    CANCELED       = 8,
    RESET          = 16,
    PART_STARTED   = 1024,
    PART_COMPLETED = 2048,
    PART_FAILED    = 4096
};

struct ProgressEvent
{
    ProgressEventType event_type        = ProgressEventType::BYTE_TRANSFER;
    long long         bytes_transferred = 0;
};

const char *to_string(ProgressEventType event_type);

inline std::ostream &operator<<(std::ostream &os, ProgressEventType event_type)
{
    return os << to_string(event_type);
}

inline bool operator==(const ProgressEvent &lhs, const ProgressEvent &rhs)
{
    return lhs.event_type == rhs.event_type && lhs.bytes_transferred == rhs.bytes_transferred;
}
}  // namespace xfer::event

#endif  // XFER_EVENT_PROGRESSEVENT_HPP_
