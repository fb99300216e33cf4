#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

#include "file_transfer.hpp"

struct TransferFailure {
  std::string relative_display_path;
  std::string error_detail;
};

// Thread-safe reduction of per-file outcomes into one success flag.
class ResultAggregator {
public:
  void record(const FileTransferTask& task, const TransferOutcome& outcome);
  void merge(const ResultAggregator& other);
  void reset();

  bool all_succeeded() const;
  std::size_t succeeded() const;
  std::size_t failed() const;
  std::vector<TransferFailure> failures() const;

private:
  mutable std::mutex m_;
  std::size_t succeeded_ = 0;
  std::vector<TransferFailure> failures_;
};
