#ifndef XFER_UTILS_EXECUTER_HPP_
#define XFER_UTILS_EXECUTER_HPP_

#include <functional>

namespace xfer::utils
{
// Runs callbacks off the calling thread
class Executer
{
public:
    using Job = std::function<void()>;

    virtual ~Executer() = default;

    virtual void add_job(Job &&job) = 0;
    // Blocks until every job added so far has finished
    virtual void process_all_jobs() = 0;
};
}  // namespace xfer::utils

#endif  // XFER_UTILS_EXECUTER_HPP_
