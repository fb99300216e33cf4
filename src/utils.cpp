#include "utils.hpp"
#include <algorithm>
#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <thread>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::string sha256_hex(const std::string &data){
    Sha256Stream stream;
    stream.update(data.data(), data.size());
    return stream.finish_hex().value_or("");
}

Sha256Stream::Sha256Stream(){
    ok_ = SHA256_Init(&ctx_) == 1;
}

bool Sha256Stream::update(const char* data, std::size_t length){
    if(!ok_ || finished_) return false;
    if(length == 0) return true;
    ok_ = SHA256_Update(&ctx_, reinterpret_cast<const unsigned char*>(data), length) == 1;
    return ok_;
}

std::optional<std::string> Sha256Stream::finish_hex(){
    if(!ok_ || finished_) return std::nullopt;
    finished_ = true;
    unsigned char digest[SHA256_DIGEST_LENGTH];
    if(SHA256_Final(digest, &ctx_) != 1) return std::nullopt;
    return hex_from_bytes(std::vector<unsigned char>(digest, digest + SHA256_DIGEST_LENGTH));
}

std::optional<std::string> compute_file_hash(const std::filesystem::path& file){
    std::ifstream in(file, std::ios::binary);
    if(!in) return std::nullopt;

    Sha256Stream stream;
    std::array<char, kHashBufferSize> buffer{};
    while(in) {
        in.read(buffer.data(), buffer.size());
        std::streamsize read = in.gcount();
        if(read > 0 && !stream.update(buffer.data(), static_cast<std::size_t>(read))) {
            return std::nullopt;
        }
    }
    if(in.bad()) return std::nullopt;
    return stream.finish_hex();
}

std::string display_path(const std::filesystem::path& path, const std::filesystem::path& base){
    std::error_code ec;
    auto rel = std::filesystem::relative(path, base, ec);
    if(ec || rel.empty()) return path.string();
    return rel.string();
}

unsigned default_worker_count(){
    unsigned cores = std::thread::hardware_concurrency();
    return std::max(1u, static_cast<unsigned>(cores * 0.75));
}
