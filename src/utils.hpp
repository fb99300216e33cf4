#pragma once
#include <openssl/sha.h>

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::string sha256_hex(const std::string &data);

// Incremental SHA-256 over a byte stream.
class Sha256Stream {
public:
    Sha256Stream();

    bool update(const char* data, std::size_t length);
    std::optional<std::string> finish_hex();

private:
    SHA256_CTX ctx_;
    bool ok_ = false;
    bool finished_ = false;
};

constexpr std::size_t kHashBufferSize = 8192;

std::optional<std::string> compute_file_hash(const std::filesystem::path& file);

// Relative path for display, falls back to the path itself when not below base.
std::string display_path(const std::filesystem::path& path, const std::filesystem::path& base);

// max(1, 75% of the hardware threads)
unsigned default_worker_count();
