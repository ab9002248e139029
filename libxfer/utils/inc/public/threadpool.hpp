#ifndef XFER_UTILS_THREADPOOL_HPP_
#define XFER_UTILS_THREADPOOL_HPP_

#include <condition_variable>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>

#include "executer.hpp"

namespace xfer::utils
{
// Fixed set of worker threads taking jobs first come, first served. The destructor lets the
// workers finish every queued job, so it must not run on one of them.
class ThreadPool : public Executer
{
public:
    explicit ThreadPool(size_t thread_count);
    ThreadPool(const ThreadPool &) = delete;
    ThreadPool &operator=(const ThreadPool &) = delete;
    ~ThreadPool() override;

    void add_job(Job &&job) override;
    void process_all_jobs() override;

    [[nodiscard]] size_t thread_count() const;

private:
    void run_jobs();
    void stop_workers();

    std::vector<std::thread> workers_;
    std::deque<Job>          queued_jobs_;
    size_t                   unfinished_jobs_;
    bool                     stopping_;
    std::mutex               mutex_;
    std::condition_variable  cv_job_queued_;
    std::condition_variable  cv_all_finished_;
};
}  // namespace xfer::utils

#endif  // XFER_UTILS_THREADPOOL_HPP_
