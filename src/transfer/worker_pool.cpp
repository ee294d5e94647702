#include "mediaharvest/transfer/worker_pool.hpp"
#include "mediaharvest/core/logger.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <mutex>

namespace mediaharvest::transfer {

WorkerPool::WorkerPool(size_t worker_count, TaskProcessor processor)
    : worker_count_(worker_count == 0 ? 1 : worker_count)
    , processor_(std::move(processor)) {
}

std::vector<TaskResult> WorkerPool::run(const std::vector<DownloadTask>& tasks,
                                        const ResultCallback& on_result) {
    std::vector<TaskResult> results;
    results.reserve(tasks.size());
    std::mutex results_mutex;
    
    LOG_DEBUG("Running {} task(s) on {} worker(s)", tasks.size(), worker_count_);
    
    boost::asio::thread_pool pool(worker_count_);
    for (const auto& task : tasks) {
        boost::asio::post(pool, [this, &task, &results, &results_mutex, &on_result]() {
            TaskResult result;
            try {
                result = processor_(task);
            } catch (const std::exception& e) {
                result = TaskResult();
                result.url = task.url;
                result.outcome = TaskOutcome::FAILED;
                result.error = core::Result(core::ErrorCode::ABORTED, e.what());
                LOG_ERROR("Worker task for {} threw: {}", task.url, e.what());
            }
            
            std::lock_guard<std::mutex> lock(results_mutex);
            if (on_result) {
                try {
                    on_result(result);
                } catch (const std::exception& e) {
                    LOG_WARN("Result callback threw: {}", e.what());
                }
            }
            results.push_back(std::move(result));
        });
    }
    pool.join();
    
    return results;
}

} // namespace mediaharvest::transfer
