#ifndef XFER_API_TRANSFERCONTEXT_HPP_
#define XFER_API_TRANSFERCONTEXT_HPP_

#include <memory>
#include <string>

#include "xferapidefs.h"

namespace xfer::config
{
// Forward declarations
class ConfigLoader;
}  // namespace xfer::config

namespace xfer::transfer
{
// Forward declarations
class TransferCoordinator;
class TransferStateChangeListener;
}  // namespace xfer::transfer

namespace xfer
{
// Forward declarations
class TransferContextImpl;

// Coordinators share the context's progress callback threads and may outlive the context. The
// threads are joined when their last owner (context or coordinator) is destroyed, which must
// therefore not happen inside a progress listener.
class XFER_API TransferContext
{
public:
    explicit TransferContext(const std::string &config_file_path);
    explicit TransferContext(const config::ConfigLoader &config_loader);
    TransferContext(TransferContext &&other) noexcept;
    TransferContext &operator=(TransferContext &&rhs) noexcept;
    ~TransferContext();

    [[nodiscard]] std::shared_ptr<transfer::TransferCoordinator> create_transfer(
        const std::string &                                    description,
        std::shared_ptr<transfer::TransferStateChangeListener> state_change_listener = nullptr);

    // Blocks until every progress event fired so far, by any transfer, has been delivered
    void flush_progress_events();

    [[nodiscard]] size_t progress_callback_thread_count() const;

private:
    std::unique_ptr<TransferContextImpl> impl_;
};
}  // namespace xfer

#endif  // XFER_API_TRANSFERCONTEXT_HPP_
