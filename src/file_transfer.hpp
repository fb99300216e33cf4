#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "log.hpp"
#include "run_configuration.hpp"

struct FileTransferTask {
  std::filesystem::path source_path;
  std::filesystem::path destination_path;
  std::string relative_display_path;
};

struct TransferOutcome {
  bool success = false;
  std::optional<std::string> error_detail;

  static TransferOutcome ok() { return TransferOutcome{true, std::nullopt}; }
  static TransferOutcome failure(std::string detail) {
    return TransferOutcome{false, std::move(detail)};
  }
};

// Copies or moves a single file, optionally verifying it with SHA-256.
// Every error ends up in the returned TransferOutcome; nothing is thrown.
// On a hash mismatch the destination file is kept as it was written.
class FileTransferWorker {
public:
  FileTransferWorker(const RunConfiguration& config, std::shared_ptr<Logger> logger = nullptr);
  virtual ~FileTransferWorker() = default;

  TransferOutcome operator()(const FileTransferTask& task) const;
  TransferOutcome transfer(const FileTransferTask& task) const;

protected:
  virtual std::optional<std::string> hash_file(const std::filesystem::path& file) const;

private:
  TransferOutcome copy(const FileTransferTask& task) const;
  TransferOutcome move(const FileTransferTask& task) const;
  TransferOutcome verify_destination(const FileTransferTask& task,
                                     const std::string& source_hash) const;

  // Streams source to destination, hashing the bytes on the way through.
  std::string copy_and_hash(const std::filesystem::path& source,
                            const std::filesystem::path& destination) const;
  void copy_preserving_metadata(const std::filesystem::path& source,
                                const std::filesystem::path& destination) const;

  const RunConfiguration& config_;
  std::shared_ptr<Logger> logger_;
};

// Permissions and modification time, like a metadata-preserving copy.
void copy_file_metadata(const std::filesystem::path& source,
                        const std::filesystem::path& destination);
