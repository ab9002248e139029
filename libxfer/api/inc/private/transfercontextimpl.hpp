#ifndef XFER_API_TRANSFERCONTEXTIMPL_HPP_
#define XFER_API_TRANSFERCONTEXTIMPL_HPP_

#include <memory>
#include <string>

#include "config.hpp"

namespace xfer::transfer
{
// Forward declarations
class TransferCoordinator;
class TransferStateChangeListener;
}  // namespace xfer::transfer

namespace xfer::utils
{
// Forward declarations
class ThreadPool;
}  // namespace xfer::utils

namespace xfer
{
class TransferContextImpl
{
public:
    explicit TransferContextImpl(const config::ConfigLoader &config_loader);
    ~TransferContextImpl();

    std::shared_ptr<transfer::TransferCoordinator> create_transfer(const std::string &description,
        std::shared_ptr<transfer::TransferStateChangeListener> state_change_listener);
    void                 flush_progress_events();
    [[nodiscard]] size_t progress_callback_thread_count() const;

    static constexpr long long max_progress_callback_threads = 64;

private:
    const config::Config              cfg_;
    std::shared_ptr<utils::ThreadPool> progress_callback_pool_;
};
}  // namespace xfer

#endif  // XFER_API_TRANSFERCONTEXTIMPL_HPP_
