#include "task_dispatcher.hpp"

#include <stdexcept>
#include <utility>

TaskDispatcher::TaskDispatcher(std::size_t worker_count, std::shared_ptr<Logger> logger)
  : logger_(std::move(logger)) {
  if(worker_count == 0) {
    throw std::invalid_argument("TaskDispatcher needs at least one worker");
  }
  threads_.reserve(worker_count);
  try {
    for(std::size_t i = 0; i < worker_count; ++i) {
      threads_.emplace_back(&TaskDispatcher::worker_loop, this);
    }
  } catch(const std::exception& e) {
    // The destructor does not run for a half-built pool; stop what started.
    const std::size_t started = threads_.size();
    shutdown();
    log_error(logger_.get(), "Unable to start transfer worker {} of {}: {}",
              started + 1, worker_count, e.what());
    throw;
  }
}

TaskDispatcher::~TaskDispatcher() {
  shutdown();
}

void TaskDispatcher::shutdown() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stopping_ = true;
  }
  work_cv_.notify_all();
  for(auto& thread : threads_) {
    if(thread.joinable()) thread.join();
  }
}

void TaskDispatcher::worker_loop() {
  while(true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this]{ return stopping_ || !jobs_.empty(); });
      if(stopping_ && jobs_.empty()) return;
      job = std::move(jobs_.front());
      jobs_.pop_front();
    }
    job();
    {
      std::lock_guard<std::mutex> lock(mutex_);
      --pending_;
      if(pending_ == 0) done_cv_.notify_all();
    }
  }
}

bool TaskDispatcher::run_all(const std::vector<FileTransferTask>& tasks,
                             const Worker& worker,
                             ResultAggregator& results) {
  if(tasks.empty()) return true;
  if(!worker) {
    throw std::invalid_argument("TaskDispatcher::run_all called without a worker");
  }

  ResultAggregator batch;
  log_debug(logger_.get(), "Submitting {} files to {} workers", tasks.size(), threads_.size());
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for(const auto& task : tasks) {
      jobs_.emplace_back([&worker, &task, &batch, this]{
        TransferOutcome outcome;
        try {
          outcome = worker(task);
        } catch(const std::exception& e) {
          outcome = TransferOutcome::failure(e.what());
          log_error(logger_.get(), "Transfer worker threw for '{}': {}", task.relative_display_path, e.what());
        } catch(...) {
          outcome = TransferOutcome::failure("unknown error");
          log_error(logger_.get(), "Transfer worker threw a non-standard exception for '{}'",
                    task.relative_display_path);
        }
        batch.record(task, outcome);
      });
      ++pending_;
    }
  }
  work_cv_.notify_all();

  {
    std::unique_lock<std::mutex> lock(mutex_);
    done_cv_.wait(lock, [this]{ return pending_ == 0; });
  }

  bool ok = batch.all_succeeded();
  results.merge(batch);
  return ok;
}

bool TaskDispatcher::run_all(const std::vector<FileTransferTask>& tasks, const Worker& worker) {
  ResultAggregator ignored;
  return run_all(tasks, worker, ignored);
}

bool run_all(const std::vector<FileTransferTask>& tasks,
             std::size_t worker_count,
             const TaskDispatcher::Worker& worker) {
  TaskDispatcher dispatcher(worker_count);
  return dispatcher.run_all(tasks, worker);
}
