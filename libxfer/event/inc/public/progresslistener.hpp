#ifndef XFER_EVENT_PROGRESSLISTENER_HPP_
#define XFER_EVENT_PROGRESSLISTENER_HPP_

#include "progressevent.hpp"

namespace xfer::event
{
class ProgressListener
{
public:
    virtual ~ProgressListener() = default;

    virtual void progress_changed(const ProgressEvent &event) = 0;
};
}  // namespace xfer::event

#endif  // XFER_EVENT_PROGRESSLISTENER_HPP_
