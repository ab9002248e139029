#ifndef XFER_TRANSFER_TRANSFER_HPP_
#define XFER_TRANSFER_TRANSFER_HPP_

#include <exception>
#include <memory>
#include <string>

#include "transferstate.hpp"
#include "xferapidefs.h"

namespace xfer::event
{
// Forward declarations
class ProgressListener;
class LegacyProgressListener;
}  // namespace xfer::event

namespace xfer::transfer
{
// Forward declarations
class TransferProgress;
class TransferStateChangeListener;

// A single upload or download, as seen by the code that started it
class XFER_API Transfer
{
public:
    virtual ~Transfer() = default;

    // True once the transfer completed, failed or was canceled
    [[nodiscard]] virtual bool                    is_done() const     = 0;
    [[nodiscard]] virtual TransferState           state() const       = 0;
    [[nodiscard]] virtual const std::string &     description() const = 0;
    [[nodiscard]] virtual const TransferProgress &progress() const    = 0;

    // Rethrows the failure as errors::ClientException
    virtual void wait_for_completion() = 0;

    // Returns nullptr if the transfer succeeded
    virtual std::exception_ptr wait_for_exception() = 0;

    virtual bool add_progress_listener(const std::shared_ptr<event::ProgressListener> &listener) = 0;
    virtual bool remove_progress_listener(
        const std::shared_ptr<event::ProgressListener> &listener) = 0;
    virtual bool add_legacy_progress_listener(
        const std::shared_ptr<event::LegacyProgressListener> &listener) = 0;
    virtual bool remove_legacy_progress_listener(
        const std::shared_ptr<event::LegacyProgressListener> &listener) = 0;
    virtual bool add_state_change_listener(
        const std::shared_ptr<TransferStateChangeListener> &listener) = 0;
    virtual bool remove_state_change_listener(
        const std::shared_ptr<TransferStateChangeListener> &listener) = 0;
};
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_TRANSFER_HPP_
