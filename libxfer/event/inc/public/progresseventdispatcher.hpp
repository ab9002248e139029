#ifndef XFER_EVENT_PROGRESSEVENTDISPATCHER_HPP_
#define XFER_EVENT_PROGRESSEVENTDISPATCHER_HPP_

#include <memory>

#include "progressevent.hpp"
#include "serialexecuter.hpp"

namespace xfer::event
{
// Forward declarations
class ProgressListener;

// Events fired through the same dispatcher reach the listener in firing order
class ProgressEventDispatcher
{
public:
    ProgressEventDispatcher(std::shared_ptr<ProgressListener> listener,
        std::shared_ptr<utils::Executer> executer, bool log_events = false);

    void fire(const ProgressEvent &event);

    // Blocks until every event fired so far has been delivered
    void wait_for_pending_events();

    [[nodiscard]] std::shared_ptr<ProgressListener> listener() const;

private:
    const std::shared_ptr<ProgressListener> listener_;
    utils::SerialExecuter                   serial_executer_;
    const bool                              enabled_;
    const bool                              log_events_;
};
}  // namespace xfer::event

#endif  // XFER_EVENT_PROGRESSEVENTDISPATCHER_HPP_
