#include "file_transfer.hpp"

#include <array>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include "utils.hpp"

namespace fs = std::filesystem;

void copy_file_metadata(const fs::path& source, const fs::path& destination) {
  auto perms = fs::status(source).permissions();
  fs::permissions(destination, perms, fs::perm_options::replace);
  fs::last_write_time(destination, fs::last_write_time(source));
}

FileTransferWorker::FileTransferWorker(const RunConfiguration& config, std::shared_ptr<Logger> logger)
  : config_(config), logger_(std::move(logger)) {}

TransferOutcome FileTransferWorker::operator()(const FileTransferTask& task) const {
  return transfer(task);
}

TransferOutcome FileTransferWorker::transfer(const FileTransferTask& task) const {
  const char* action = transfer_action_name(config_.action);
  TransferOutcome outcome;
  try {
    outcome = (config_.action == TransferAction::Copy) ? copy(task) : move(task);
  } catch(const fs::filesystem_error& e) {
    outcome = TransferOutcome::failure(e.what());
  } catch(const std::exception& e) {
    outcome = TransferOutcome::failure(e.what());
  }

  if(!outcome.success) {
    log_error(logger_.get(), "Error during {}{} for file '{}' to '{}': {}",
              action, config_.verify_hash ? "/verify" : "",
              task.source_path.string(), task.destination_path.string(),
              outcome.error_detail.value_or("unknown error"));
    return outcome;
  }
  log_verbose(logger_.get(), "  Processed: '{}'", task.relative_display_path);
  return outcome;
}

TransferOutcome FileTransferWorker::copy(const FileTransferTask& task) const {
  auto file_name = task.source_path.filename().string();
  log_debug(logger_.get(), "Copying '{}'...", file_name);
  if(!config_.verify_hash) {
    copy_preserving_metadata(task.source_path, task.destination_path);
    return TransferOutcome::ok();
  }
  auto source_hash = copy_and_hash(task.source_path, task.destination_path);
  log_debug(logger_.get(), "Verifying hash for copied '{}'...", file_name);
  return verify_destination(task, source_hash);
}

TransferOutcome FileTransferWorker::move(const FileTransferTask& task) const {
  auto file_name = task.source_path.filename().string();
  log_debug(logger_.get(), "Moving '{}'...", file_name);

  std::string source_hash;
  if(config_.verify_hash) {
    log_debug(logger_.get(), "Pre-calculating source hash for '{}' before move...", file_name);
    auto hash = hash_file(task.source_path);
    if(!hash) {
      return TransferOutcome::failure("Unable to hash source file '" + task.source_path.string() + "'");
    }
    source_hash = *hash;
  }

  std::error_code ec;
  fs::rename(task.source_path, task.destination_path, ec);
  if(ec == std::errc::cross_device_link) {
    log_debug(logger_.get(), "Rename across filesystems for '{}', copying instead", file_name);
    copy_preserving_metadata(task.source_path, task.destination_path);
    fs::remove(task.source_path);
  } else if(ec) {
    return TransferOutcome::failure("Unable to move '" + task.source_path.string() +
                                    "' to '" + task.destination_path.string() + "': " + ec.message());
  }

  if(!config_.verify_hash) return TransferOutcome::ok();
  log_debug(logger_.get(), "Verifying hash for moved '{}'...", file_name);
  return verify_destination(task, source_hash);
}

TransferOutcome FileTransferWorker::verify_destination(const FileTransferTask& task,
                                                       const std::string& source_hash) const {
  auto destination_hash = hash_file(task.destination_path);
  if(!destination_hash) {
    return TransferOutcome::failure("Unable to hash destination file '" +
                                    task.destination_path.string() + "'");
  }
  if(*destination_hash != source_hash) {
    return TransferOutcome::failure("Hash mismatch for " + std::string(transfer_action_name(config_.action)) +
                                    " file '" + task.relative_display_path + "' (source " + source_hash +
                                    ", destination " + *destination_hash + ")");
  }
  return TransferOutcome::ok();
}

std::optional<std::string> FileTransferWorker::hash_file(const fs::path& file) const {
  return compute_file_hash(file);
}

std::string FileTransferWorker::copy_and_hash(const fs::path& source, const fs::path& destination) const {
  std::ifstream in(source, std::ios::binary);
  if(!in) {
    throw std::runtime_error("Unable to open source file '" + source.string() + "'");
  }
  std::ofstream out(destination, std::ios::binary | std::ios::trunc);
  if(!out) {
    throw std::runtime_error("Unable to open destination file '" + destination.string() + "'");
  }

  Sha256Stream hasher;
  std::array<char, kHashBufferSize> buffer{};
  while(in) {
    in.read(buffer.data(), buffer.size());
    std::streamsize read = in.gcount();
    if(read <= 0) break;
    if(!hasher.update(buffer.data(), static_cast<std::size_t>(read))) {
      throw std::runtime_error("SHA-256 update failed for '" + source.string() + "'");
    }
    out.write(buffer.data(), read);
    if(!out) {
      throw std::runtime_error("Write failed for '" + destination.string() + "'");
    }
  }
  if(in.bad()) {
    throw std::runtime_error("Read failed for '" + source.string() + "'");
  }
  out.close();
  if(!out) {
    throw std::runtime_error("Unable to finish writing '" + destination.string() + "'");
  }
  copy_file_metadata(source, destination);

  auto digest = hasher.finish_hex();
  if(!digest) {
    throw std::runtime_error("SHA-256 finalisation failed for '" + source.string() + "'");
  }
  return *digest;
}

void FileTransferWorker::copy_preserving_metadata(const fs::path& source, const fs::path& destination) const {
  fs::copy_file(source, destination, fs::copy_options::overwrite_existing);
  copy_file_metadata(source, destination);
}
