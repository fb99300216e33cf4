#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "file_transfer.hpp"
#include "log.hpp"
#include "result_aggregator.hpp"
#include "run_configuration.hpp"
#include "task_dispatcher.hpp"

// Conditions that stop a run before or at the root: missing source root,
// uncreatable destination root, unreadable root listing, or a transfer
// pool that cannot be started.
class FlattenError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Walks a source tree, collapsing chains of single-child directories into
// one compound name ("A++B++C") and transferring every file into the
// resulting tree. The files of one directory are transferred in parallel;
// directories are visited one at a time and the walk stops at the first
// directory whose transfers fail.
//
// Two sibling directories that sanitize to the same name share one
// destination directory; files with equal names overwrite each other
// (last write wins). A warning is logged when this happens.
class FlattenEngine {
public:
  using TransferFunction = TaskDispatcher::Worker;

  struct Stats {
    std::size_t files_transferred = 0;
    std::size_t files_failed = 0;
    std::size_t directories_created = 0;
    std::size_t directories_collapsed = 0;
    std::size_t directories_skipped = 0;
    std::vector<TransferFailure> failures;
  };

  // An empty transfer function selects FileTransferWorker.
  explicit FlattenEngine(RunConfiguration config,
                         std::shared_ptr<Logger> logger = nullptr,
                         TransferFunction transfer = {});

  FlattenEngine(const FlattenEngine&) = delete;
  FlattenEngine& operator=(const FlattenEngine&) = delete;

  // Returns true when every file transfer succeeded. Throws FlattenError for
  // the fatal root conditions.
  bool run(const std::filesystem::path& source_root,
           const std::filesystem::path& destination_root);

  Stats stats() const;
  const RunConfiguration& config() const { return config_; }
  std::shared_ptr<Logger> logger() const { return logger_; }

private:
  struct Listing {
    std::vector<std::filesystem::path> dirs;
    std::vector<std::filesystem::path> files;
  };

  bool flatten(const std::filesystem::path& source,
               const std::filesystem::path& destination_parent,
               const std::string& accumulated_name);
  std::optional<Listing> list_children(const std::filesystem::path& dir) const;
  bool materialize_directory(const std::filesystem::path& target);
  std::string relative_to_destination(const std::filesystem::path& path) const;

  RunConfiguration config_;
  std::shared_ptr<Logger> logger_;
  std::unique_ptr<FileTransferWorker> default_worker_;
  TransferFunction transfer_;

  std::unique_ptr<TaskDispatcher> dispatcher_;
  ResultAggregator results_;
  std::filesystem::path source_root_;
  std::filesystem::path destination_root_;
  std::set<std::filesystem::path> materialized_;
  std::size_t directories_created_ = 0;
  std::size_t directories_collapsed_ = 0;
  std::size_t directories_skipped_ = 0;
};
