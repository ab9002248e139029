#include "legacyprogresslistener.hpp"

#include <utility>

namespace xfer::event
{
LegacyProgressListenerAdapter::LegacyProgressListenerAdapter(
    std::shared_ptr<LegacyProgressListener> listener)
    : listener_ {std::move(listener)}
{
}

const std::shared_ptr<LegacyProgressListener> &
LegacyProgressListenerAdapter::wrapped_listener() const
{
    return listener_;
}

void LegacyProgressListenerAdapter::progress_changed(const ProgressEvent &event)
{
    if (listener_)
    {
        listener_->progress_changed(to_legacy_progress_event(event));
    }
}

LegacyProgressEvent to_legacy_progress_event(const ProgressEvent &event)
{
    return LegacyProgressEvent {static_cast<int>(event.event_type), event.bytes_transferred};
}
}  // namespace xfer::event
