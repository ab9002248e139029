#ifndef XFER_UTILS_LISTENERGROUP_HPP_
#define XFER_UTILS_LISTENERGROUP_HPP_

#include <algorithm>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace xfer::utils
{
// Notifies over a snapshot, so listeners may (un)register listeners from their callbacks
template<typename T>
class ListenerGroup
{
public:
    using Listener          = T;
    using SharedPtrListener = std::shared_ptr<Listener>;

    bool add(const SharedPtrListener &listener)
    {
        if (!listener)
        {
            return false;
        }

        std::lock_guard lock {mutex_};
        listeners_.push_back(listener);
        return true;
    }

    // Removes the first occurrence of the listener
    bool remove(const SharedPtrListener &listener)
    {
        std::lock_guard lock {mutex_};
        auto            it = std::find(listeners_.begin(), listeners_.end(), listener);
        if (it == listeners_.end())
        {
            return false;
        }
        listeners_.erase(it);
        return true;
    }

    [[nodiscard]] size_t size() const
    {
        std::lock_guard lock {mutex_};
        return listeners_.size();
    }

    [[nodiscard]] bool empty() const
    {
        return size() == 0;
    }

    [[nodiscard]] std::vector<SharedPtrListener> snapshot() const
    {
        std::lock_guard lock {mutex_};
        return listeners_;
    }

    template<typename F>
    void for_each(F &&func) const
    {
        for (auto &listener : snapshot())
        {
            func(*listener);
        }
    }

    template<typename M, typename... Args>
    void notify(M method, Args &&... args) const
    {
        for_each([&](Listener &listener) { (listener.*method)(args...); });
    }

private:
    std::vector<SharedPtrListener> listeners_;
    mutable std::mutex             mutex_;
};
}  // namespace xfer::utils

#endif  // XFER_UTILS_LISTENERGROUP_HPP_
