#include "progresseventdispatcher.hpp"

#include <utility>

#include <glog/logging.h>

#include "progresslistener.hpp"

namespace xfer::event
{
ProgressEventDispatcher::ProgressEventDispatcher(std::shared_ptr<ProgressListener> listener,
    std::shared_ptr<utils::Executer> executer, bool log_events)
    : listener_ {std::move(listener)}
    , serial_executer_ {executer}
    , enabled_ {listener_ && executer}
    , log_events_ {log_events}
{
    if (listener_ && !executer)
    {
        LOG(WARNING) << "No executer for progress events, they will not be delivered";
    }
}

void ProgressEventDispatcher::fire(const ProgressEvent &event)
{
    if (!enabled_)
    {
        return;
    }

    if (log_events_)
    {
        LOG(INFO) << "Dispatching " << event.event_type << " progress event ("
                  << event.bytes_transferred << " bytes)";
    }

    serial_executer_.add_job([listener = listener_, event] { listener->progress_changed(event); });
}

void ProgressEventDispatcher::wait_for_pending_events()
{
    if (!enabled_)
    {
        return;
    }
    serial_executer_.process_all_jobs();
}

std::shared_ptr<ProgressListener> ProgressEventDispatcher::listener() const
{
    return listener_;
}
}  // namespace xfer::event
