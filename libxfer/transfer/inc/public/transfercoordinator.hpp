#ifndef XFER_TRANSFER_TRANSFERCOORDINATOR_HPP_
#define XFER_TRANSFER_TRANSFERCOORDINATOR_HPP_

#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "listenergroup.hpp"
#include "progressevent.hpp"
#include "progresseventdispatcher.hpp"
#include "progresslistenerchain.hpp"
#include "transfer.hpp"
#include "transferconfiguration.hpp"
#include "transferprogress.hpp"
#include "transferstatechangelistener.hpp"
#include "xferapidefs.h"

namespace xfer::transfer
{
// Forward declarations
class TransferMonitor;

class XFER_API TransferCoordinator : public Transfer
{
public:
    explicit TransferCoordinator(TransferConfiguration configuration);
    TransferCoordinator(const TransferCoordinator &) = delete;
    TransferCoordinator &operator=(const TransferCoordinator &) = delete;
    ~TransferCoordinator() override;

    // From Transfer
    [[nodiscard]] bool                    is_done() const override;
    [[nodiscard]] TransferState           state() const override;
    [[nodiscard]] const std::string &     description() const override;
    [[nodiscard]] const TransferProgress &progress() const override;
    void                                  wait_for_completion() override;
    std::exception_ptr                    wait_for_exception() override;
    bool add_progress_listener(const std::shared_ptr<event::ProgressListener> &listener) override;
    bool remove_progress_listener(
        const std::shared_ptr<event::ProgressListener> &listener) override;
    bool add_legacy_progress_listener(
        const std::shared_ptr<event::LegacyProgressListener> &listener) override;
    bool remove_legacy_progress_listener(
        const std::shared_ptr<event::LegacyProgressListener> &listener) override;
    bool add_state_change_listener(
        const std::shared_ptr<TransferStateChangeListener> &listener) override;
    bool remove_state_change_listener(
        const std::shared_ptr<TransferStateChangeListener> &listener) override;

    // Returns false if the state was not changed. Called from a state change listener, the new
    // state is stored at once but announced only after the running notification pass.
    bool set_state(TransferState new_state);
    void notify_state_change_listeners(TransferState state);

    void set_monitor(std::shared_ptr<TransferMonitor> monitor);
    [[nodiscard]] std::shared_ptr<TransferMonitor> monitor() const;

    void add_bytes_transferred(long long byte_count);
    void set_total_bytes_to_transfer(long long total_bytes);
    void fire_progress_event(event::ProgressEventType event_type, long long byte_count = 0);

    // Blocks until every progress event fired so far reached the progress listeners
    void wait_for_progress_events();

private:
    void deliver_pending_notifications();

    const std::string                                    description_;
    TransferProgress                                     progress_;
    std::atomic<TransferState>                           state_;
    const std::shared_ptr<event::ProgressListenerChain>  progress_listener_chain_;
    event::ProgressEventDispatcher                       progress_event_dispatcher_;
    utils::ListenerGroup<TransferStateChangeListener>    state_change_listeners_;
    std::multimap<event::LegacyProgressListener *, std::shared_ptr<event::ProgressListener>>
                                     legacy_listener_adapters_;
    std::shared_ptr<TransferMonitor> monitor_;
    const bool                       log_state_transitions_;
    std::recursive_mutex             state_change_mutex_;
    std::deque<TransferState>        pending_notifications_;
    bool                             notifying_;
    mutable std::mutex               mutex_;
};
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_TRANSFERCOORDINATOR_HPP_
