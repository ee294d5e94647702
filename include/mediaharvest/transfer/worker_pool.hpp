#pragma once

#include "mediaharvest/transfer/download_task.hpp"
#include <functional>
#include <vector>

namespace mediaharvest::transfer {

using TaskProcessor = std::function<TaskResult(const DownloadTask&)>;
using ResultCallback = std::function<void(const TaskResult&)>;

// Runs tasks on a fixed number of threads and returns every result, in
// completion order. A task that throws becomes a FAILED result.
class WorkerPool {
public:
    WorkerPool(size_t worker_count, TaskProcessor processor);
    
    std::vector<TaskResult> run(const std::vector<DownloadTask>& tasks,
                                const ResultCallback& on_result = nullptr);
    
    size_t worker_count() const { return worker_count_; }

private:
    size_t worker_count_;
    TaskProcessor processor_;
};

} // namespace mediaharvest::transfer
