#ifndef XFER_EVENT_PROGRESSLISTENERCHAIN_HPP_
#define XFER_EVENT_PROGRESSLISTENERCHAIN_HPP_

#include <functional>
#include <memory>
#include <optional>

#include "listenergroup.hpp"
#include "progresslistener.hpp"

namespace xfer::event
{
// A throwing listener is logged and skipped
class ProgressListenerChain : public ProgressListener
{
public:
    // Returns the event to deliver, possibly rewritten, or std::nullopt to drop it
    using ProgressEventFilter = std::function<std::optional<ProgressEvent>(const ProgressEvent &)>;

    explicit ProgressListenerChain(ProgressEventFilter filter = nullptr);

    bool                 add_progress_listener(const std::shared_ptr<ProgressListener> &listener);
    bool                 remove_progress_listener(const std::shared_ptr<ProgressListener> &listener);
    [[nodiscard]] size_t listener_count() const;

public:  // from ProgressListener
    void progress_changed(const ProgressEvent &event) override;

private:
    const ProgressEventFilter               filter_;
    utils::ListenerGroup<ProgressListener> listeners_;
};
}  // namespace xfer::event

#endif  // XFER_EVENT_PROGRESSLISTENERCHAIN_HPP_
