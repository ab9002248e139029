#ifndef XFER_UTILS_SERIALEXECUTER_HPP_
#define XFER_UTILS_SERIALEXECUTER_HPP_

#include <memory>

#include "executer.hpp"

namespace xfer::utils
{
// Runs its jobs on the backing executer one at a time, in the order they were added
class SerialExecuter : public Executer
{
public:
    explicit SerialExecuter(std::shared_ptr<Executer> executer);
    SerialExecuter(const SerialExecuter &) = delete;
    SerialExecuter &operator=(const SerialExecuter &) = delete;
    ~SerialExecuter() override;

    void add_job(Job &&job) override;
    void process_all_jobs() override;

private:
    struct Queue;

    static void drain(const std::shared_ptr<Queue> &queue);

    const std::shared_ptr<Executer> executer_;
    const std::shared_ptr<Queue>    queue_;
};
}  // namespace xfer::utils

#endif  // XFER_UTILS_SERIALEXECUTER_HPP_
