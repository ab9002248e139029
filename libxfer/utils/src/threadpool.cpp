#include "threadpool.hpp"

#include <exception>
#include <system_error>
#include <utility>

#include <glog/logging.h>

namespace xfer::utils
{
ThreadPool::ThreadPool(size_t thread_count)
    : unfinished_jobs_ {0}
    , stopping_ {false}
{
    if (thread_count == 0)
    {
        thread_count = 1;
    }

    workers_.reserve(thread_count);
    try
    {
        while (workers_.size() != thread_count)
        {
            workers_.emplace_back(&ThreadPool::run_jobs, this);
        }
    }
    catch (const std::system_error &e)
    {
        LOG(ERROR) << "Cannot start worker thread " << workers_.size() + 1 << " of "
                   << thread_count << ": " << e.what();
        stop_workers();
        throw;
    }
}

ThreadPool::~ThreadPool()
{
    stop_workers();
}

void ThreadPool::add_job(Job &&job)
{
    {
        std::lock_guard lock {mutex_};
        queued_jobs_.push_back(std::move(job));
        ++unfinished_jobs_;
    }
    cv_job_queued_.notify_one();
}

void ThreadPool::process_all_jobs()
{
    std::unique_lock lock {mutex_};
    cv_all_finished_.wait(lock, [this] { return unfinished_jobs_ == 0; });
}

size_t ThreadPool::thread_count() const
{
    return workers_.size();
}

void ThreadPool::stop_workers()
{
    {
        std::lock_guard lock {mutex_};
        stopping_ = true;
    }
    cv_job_queued_.notify_all();

    for (auto &worker : workers_)
    {
        worker.join();
    }
}

void ThreadPool::run_jobs()
{
    for (;;)
    {
        Job job;
        {
            std::unique_lock lock {mutex_};
            cv_job_queued_.wait(lock, [this] { return stopping_ || !queued_jobs_.empty(); });
            if (queued_jobs_.empty())
            {
                return;
            }
            job = std::move(queued_jobs_.front());
            queued_jobs_.pop_front();
        }

        try
        {
            job();
        }
        catch (const std::exception &e)
        {
            LOG(ERROR) << "Job terminated with an exception: " << e.what();
        }
        catch (...)
        {
            LOG(ERROR) << "Job terminated with an exception of unknown type";
        }

        bool all_finished;
        {
            std::lock_guard lock {mutex_};
            all_finished = --unfinished_jobs_ == 0;
        }
        if (all_finished)
        {
            cv_all_finished_.notify_all();
        }
    }
}
}  // namespace xfer::utils
