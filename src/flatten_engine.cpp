#include "flatten_engine.hpp"

#include <algorithm>
#include <system_error>
#include <utility>

#include "name_sanitizer.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

FlattenEngine::FlattenEngine(RunConfiguration config,
                             std::shared_ptr<Logger> logger,
                             TransferFunction transfer)
  : config_(std::move(config)),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("flatten")),
    transfer_(std::move(transfer)) {
  if(!transfer_) {
    default_worker_ = std::make_unique<FileTransferWorker>(config_, logger_);
    transfer_ = [worker = default_worker_.get()](const FileTransferTask& task) {
      return worker->transfer(task);
    };
  }
}

FlattenEngine::Stats FlattenEngine::stats() const {
  Stats out;
  out.files_transferred = results_.succeeded();
  out.files_failed = results_.failed();
  out.directories_created = directories_created_;
  out.directories_collapsed = directories_collapsed_;
  out.directories_skipped = directories_skipped_;
  out.failures = results_.failures();
  return out;
}

bool FlattenEngine::run(const fs::path& source_root, const fs::path& destination_root) {
  std::error_code ec;
  source_root_ = fs::absolute(source_root, ec).lexically_normal();
  if(ec || !fs::is_directory(source_root_, ec)) {
    throw FlattenError("Source directory '" + source_root_.string() + "' not found.");
  }
  if(source_root_.filename().empty()) source_root_ = source_root_.parent_path();

  destination_root_ = fs::absolute(destination_root, ec).lexically_normal();
  if(ec) {
    throw FlattenError("Invalid destination directory '" + destination_root.string() + "': " + ec.message());
  }
  if(destination_root_.filename().empty()) destination_root_ = destination_root_.parent_path();
  if(!fs::exists(destination_root_, ec)) {
    fs::create_directories(destination_root_, ec);
    if(ec) {
      throw FlattenError("Failed to create destination directory '" + destination_root_.string() +
                         "': " + ec.message());
    }
  } else if(!fs::is_directory(destination_root_, ec)) {
    throw FlattenError("Destination '" + destination_root_.string() + "' is not a directory.");
  }

  if(config_.worker_count == 0) {
    throw FlattenError("Worker count must be at least 1");
  }

  results_.reset();
  materialized_.clear();
  directories_created_ = 0;
  directories_collapsed_ = 0;
  directories_skipped_ = 0;

  try {
    dispatcher_ = std::make_unique<TaskDispatcher>(config_.worker_count, logger_);
  } catch(const std::exception& e) {
    throw FlattenError("Unable to start " + std::to_string(config_.worker_count) +
                       " transfer workers: " + e.what());
  }
  bool ok = flatten(source_root_, destination_root_, "");
  dispatcher_.reset();
  return ok;
}

std::optional<FlattenEngine::Listing> FlattenEngine::list_children(const fs::path& dir) const {
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if(ec) {
    logger_->error("Error reading contents of '{}': {}.", dir.string(), ec.message());
    return std::nullopt;
  }

  Listing listing;
  for(fs::directory_iterator end; it != end; it.increment(ec)) {
    if(ec) break;
    const auto& path = it->path();
    // Never descend into our own output when it lives inside the source tree.
    if(path == destination_root_) continue;
    std::error_code type_ec;
    if(it->is_directory(type_ec)) {
      listing.dirs.push_back(path);
    } else if(it->is_regular_file(type_ec)) {
      listing.files.push_back(path);
    } else {
      logger_->debug("Ignoring '{}': not a regular file or directory", path.string());
    }
  }
  if(ec) {
    logger_->error("Error reading contents of '{}': {}.", dir.string(), ec.message());
    return std::nullopt;
  }

  std::sort(listing.dirs.begin(), listing.dirs.end());
  std::sort(listing.files.begin(), listing.files.end());
  return listing;
}

std::string FlattenEngine::relative_to_destination(const fs::path& path) const {
  return display_path(path, destination_root_);
}

bool FlattenEngine::materialize_directory(const fs::path& target) {
  std::error_code ec;
  if(fs::exists(target, ec)) {
    if(!fs::is_directory(target, ec)) {
      logger_->error("Error creating directory '{}': a file with that name exists.", target.string());
      return false;
    }
    if(materialized_.count(target)) {
      logger_->warn("Directory '{}' was already produced by another source directory; merging into it",
                    relative_to_destination(target));
    }
    materialized_.insert(target);
    return true;
  }

  logger_->info("  Creating directory: '{}'", relative_to_destination(target));
  fs::create_directories(target, ec);
  if(ec) {
    logger_->error("Error creating directory '{}': {}.", target.string(), ec.message());
    return false;
  }
  ++directories_created_;
  materialized_.insert(target);
  return true;
}

bool FlattenEngine::flatten(const fs::path& source,
                            const fs::path& destination_parent,
                            const std::string& accumulated_name) {
  const bool is_root = accumulated_name.empty() && source == source_root_;
  logger_->info("Processing Source Directory: '{}'", source.string());

  auto listing = list_children(source);
  if(!listing) {
    if(is_root) {
      throw FlattenError("Unable to list source directory '" + source.string() + "'");
    }
    return false;
  }

  const std::string base_name = source.filename().string();
  const std::string& current_name = accumulated_name.empty() ? base_name : accumulated_name;

  // The root is never named, so it never starts a collapse chain.
  if(!is_root && listing->dirs.size() == 1 && listing->files.empty()) {
    const auto& single_child = listing->dirs.front();
    std::string next_name = sanitize_name(current_name, config_.rules, logger_.get()) +
                            config_.separator + single_child.filename().string();
    logger_->verbose("Flattening: '{}' -> '{}'. New name: '{}'",
                     base_name, single_child.filename().string(), next_name);
    ++directories_collapsed_;
    return flatten(single_child, destination_parent, next_name);
  }

  fs::path target = destination_parent;
  if(!is_root) {
    std::string final_name = sanitize_name(current_name, config_.rules, logger_.get());
    if(final_name.empty()) {
      logger_->warn("Calculated final directory name is empty for source '{}' after sanitization. Skipping.",
                    source.string());
      ++directories_skipped_;
      return true;
    }
    target = destination_parent / final_name;
    if(!materialize_directory(target)) return false;
  }

  if(!listing->files.empty()) {
    std::vector<FileTransferTask> tasks;
    tasks.reserve(listing->files.size());
    for(const auto& file : listing->files) {
      FileTransferTask task;
      task.source_path = file;
      task.destination_path = target / file.filename();
      task.relative_display_path = relative_to_destination(task.destination_path);
      tasks.push_back(std::move(task));
    }
    logger_->verbose("Submitting {} files from '{}' for processing...", tasks.size(), source.string());
    if(!dispatcher_->run_all(tasks, transfer_, results_)) {
      logger_->error("Transfers failed in '{}'; skipping its subdirectories and remaining siblings",
                     source.string());
      return false;
    }
  }

  for(const auto& dir : listing->dirs) {
    if(!flatten(dir, target, "")) return false;
  }
  return true;
}
