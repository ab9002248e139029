#include "serialexecuter.hpp"

#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <utility>

#include <glog/logging.h>

namespace xfer::utils
{
// Outlives the SerialExecuter while a drain job still holds it
struct SerialExecuter::Queue
{
    std::deque<Job>         jobs;
    bool                    draining = false;
    std::mutex              mutex;
    std::condition_variable cv_idle;
};

SerialExecuter::SerialExecuter(std::shared_ptr<Executer> executer)
    : executer_ {std::move(executer)}
    , queue_ {std::make_shared<Queue>()}
{
}

SerialExecuter::~SerialExecuter() = default;

void SerialExecuter::add_job(Job &&job)
{
    {
        std::lock_guard lock {queue_->mutex};
        queue_->jobs.push_back(std::move(job));
        if (queue_->draining)
        {
            return;
        }
        queue_->draining = true;
    }

    executer_->add_job([queue = queue_] { drain(queue); });
}

void SerialExecuter::process_all_jobs()
{
    std::unique_lock lock {queue_->mutex};
    queue_->cv_idle.wait(lock, [this] { return !queue_->draining; });
}

void SerialExecuter::drain(const std::shared_ptr<Queue> &queue)
{
    for (;;)
    {
        Job job;
        {
            std::lock_guard lock {queue->mutex};
            if (queue->jobs.empty())
            {
                queue->draining = false;
                break;
            }
            job = std::move(queue->jobs.front());
            queue->jobs.pop_front();
        }

        try
        {
            job();
        }
        catch (const std::exception &e)
        {
            LOG(ERROR) << "Serial job terminated with an exception: " << e.what();
        }
        catch (...)
        {
            LOG(ERROR) << "Serial job terminated with an exception of unknown type";
        }
    }
    queue->cv_idle.notify_all();
}
}  // namespace xfer::utils
