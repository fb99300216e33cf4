#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "file_transfer.hpp"
#include "log.hpp"
#include "result_aggregator.hpp"

// Fixed pool of transfer threads. run_all() hands one directory's files to the
// pool and blocks until every one of them has finished; a failure does not
// cancel the rest of the batch.
class TaskDispatcher {
public:
  using Worker = std::function<TransferOutcome(const FileTransferTask&)>;

  // Throws std::invalid_argument for zero workers. When a thread cannot be
  // started (std::system_error, std::bad_alloc) the threads already running
  // are joined before the exception propagates.
  explicit TaskDispatcher(std::size_t worker_count, std::shared_ptr<Logger> logger = nullptr);
  ~TaskDispatcher();

  TaskDispatcher(const TaskDispatcher&) = delete;
  TaskDispatcher& operator=(const TaskDispatcher&) = delete;

  // Must only be called from one coordinating thread at a time.
  bool run_all(const std::vector<FileTransferTask>& tasks,
               const Worker& worker,
               ResultAggregator& results);
  bool run_all(const std::vector<FileTransferTask>& tasks, const Worker& worker);

  std::size_t worker_count() const { return threads_.size(); }

private:
  void worker_loop();
  void shutdown();

  std::shared_ptr<Logger> logger_;
  std::vector<std::thread> threads_;

  std::mutex mutex_;
  std::condition_variable work_cv_;
  std::condition_variable done_cv_;
  std::deque<std::function<void()>> jobs_;
  std::size_t pending_ = 0;
  bool stopping_ = false;
};

// One-shot form: spins up a pool of worker_count threads for this batch only.
bool run_all(const std::vector<FileTransferTask>& tasks,
             std::size_t worker_count,
             const TaskDispatcher::Worker& worker);
