#include "progresslistenerchain.hpp"

#include <exception>
#include <utility>

#include <glog/logging.h>

namespace xfer::event
{
ProgressListenerChain::ProgressListenerChain(ProgressEventFilter filter)
    : filter_ {std::move(filter)}
{
}

bool ProgressListenerChain::add_progress_listener(const std::shared_ptr<ProgressListener> &listener)
{
    return listeners_.add(listener);
}

bool ProgressListenerChain::remove_progress_listener(
    const std::shared_ptr<ProgressListener> &listener)
{
    return listeners_.remove(listener);
}

size_t ProgressListenerChain::listener_count() const
{
    return listeners_.size();
}

void ProgressListenerChain::progress_changed(const ProgressEvent &event)
{
    std::optional<ProgressEvent> filtered_event {event};
    if (filter_)
    {
        filtered_event = filter_(event);
        if (!filtered_event)
        {
            return;
        }
    }

    listeners_.for_each([&](ProgressListener &listener) {
        try
        {
            listener.progress_changed(*filtered_event);
        }
        catch (const std::exception &e)
        {
            LOG(ERROR) << "Progress listener failed on " << filtered_event->event_type
                       << " event: " << e.what();
        }
        catch (...)
        {
            LOG(ERROR) << "Progress listener failed on " << filtered_event->event_type
                       << " event with an exception of unknown type";
        }
    });
}
}  // namespace xfer::event
