#ifndef XFER_TRANSFER_TRANSFERPROGRESS_HPP_
#define XFER_TRANSFER_TRANSFERPROGRESS_HPP_

#include <mutex>

#include "xferapidefs.h"

namespace xfer::transfer
{
// Readers always see a (bytes transferred, total) pair that existed at some point
class XFER_API TransferProgress
{
public:
    static constexpr long long unknown_total = -1;

    TransferProgress();
    TransferProgress(const TransferProgress &) = delete;
    TransferProgress &operator=(const TransferProgress &) = delete;

    void add_bytes_transferred(long long byte_count);

    // May be called again once the real size is known, e.g. after the response headers arrived
    void set_total_bytes_to_transfer(long long total_bytes);

    [[nodiscard]] long long bytes_transferred() const;

    // Returns unknown_total if the size of the transfer is not known yet
    [[nodiscard]] long long total_bytes_to_transfer() const;

    // 0 when the total is unknown or zero
    [[nodiscard]] double percent_transferred() const;

private:
    long long          bytes_transferred_;
    long long          total_bytes_to_transfer_;
    mutable std::mutex mutex_;
};
}  // namespace xfer::transfer

#endif  // XFER_TRANSFER_TRANSFERPROGRESS_HPP_
