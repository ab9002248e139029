#ifndef XFER_EVENT_LEGACYPROGRESSLISTENER_HPP_
#define XFER_EVENT_LEGACYPROGRESSLISTENER_HPP_

#include <memory>

#include "progresslistener.hpp"

namespace xfer::event
{
struct LegacyProgressEvent
{
    int       event_code        = 0;
    long long bytes_transferred = 0;
};

class LegacyProgressListener
{
public:
    virtual ~LegacyProgressListener() = default;

    virtual void progress_changed(const LegacyProgressEvent &event) = 0;
};

// Presents a LegacyProgressListener as a ProgressListener
class LegacyProgressListenerAdapter : public ProgressListener
{
public:
    explicit LegacyProgressListenerAdapter(std::shared_ptr<LegacyProgressListener> listener);

    [[nodiscard]] const std::shared_ptr<LegacyProgressListener> &wrapped_listener() const;

public:  // from ProgressListener
    void progress_changed(const ProgressEvent &event) override;

private:
    const std::shared_ptr<LegacyProgressListener> listener_;
};

LegacyProgressEvent to_legacy_progress_event(const ProgressEvent &event);
}  // namespace xfer::event

#endif  // XFER_EVENT_LEGACYPROGRESSLISTENER_HPP_
