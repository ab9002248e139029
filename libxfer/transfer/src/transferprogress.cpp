#include "transferprogress.hpp"

namespace xfer::transfer
{
TransferProgress::TransferProgress()
    : bytes_transferred_ {0}
    , total_bytes_to_transfer_ {unknown_total}
{
}

void TransferProgress::add_bytes_transferred(long long byte_count)
{
    std::lock_guard lock {mutex_};
    bytes_transferred_ += byte_count;
}

void TransferProgress::set_total_bytes_to_transfer(long long total_bytes)
{
    std::lock_guard lock {mutex_};
    total_bytes_to_transfer_ = total_bytes;
}

long long TransferProgress::bytes_transferred() const
{
    std::lock_guard lock {mutex_};
    return bytes_transferred_;
}

long long TransferProgress::total_bytes_to_transfer() const
{
    std::lock_guard lock {mutex_};
    return total_bytes_to_transfer_;
}

double TransferProgress::percent_transferred() const
{
    std::lock_guard lock {mutex_};
    if (bytes_transferred_ < 0 || total_bytes_to_transfer_ <= 0)
    {
        return 0;
    }
    return double(bytes_transferred_) / double(total_bytes_to_transfer_) * 100;
}
}  // namespace xfer::transfer
