#pragma once

#include <string>
#include <filesystem>
#include <array>
#include <openssl/sha.h>
#include <fstream>

namespace layerstore {

inline std::string to_hex(const unsigned char* data, size_t len) {
    static const char* hex = "0123456789abcdef";
    std::string hexout;
    hexout.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        hexout.push_back(hex[(data[i] >> 4) & 0x0F]);
        hexout.push_back(hex[data[i] & 0x0F]);
    }
    return hexout;
}

// Incremental SHA-256. finalHex() may be called once; returns "" on failure.
class Sha256 {
public:
    Sha256() { ok_ = SHA256_Init(&ctx_) == 1; }

    void update(const void* data, size_t len) {
        if (!ok_ || len == 0) return;
        if (SHA256_Update(&ctx_, data, len) != 1) ok_ = false;
    }

    std::string finalHex() {
        if (!ok_) return "";
        std::array<unsigned char, SHA256_DIGEST_LENGTH> hash{};
        ok_ = false;
        if (SHA256_Final(hash.data(), &ctx_) != 1) return "";
        return to_hex(hash.data(), hash.size());
    }

private:
    SHA256_CTX ctx_;
    bool ok_{false};
};

inline std::string sha256_text(const std::string& text) {
    Sha256 hasher;
    hasher.update(text.data(), text.size());
    return hasher.finalHex();
}

inline std::string sha256_file(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return "";
    Sha256 hasher;
    std::array<char, 8192> buf{};
    while (file) {
        file.read(buf.data(), buf.size());
        std::streamsize n = file.gcount();
        if (n > 0) {
            hasher.update(buf.data(), static_cast<size_t>(n));
        }
    }
    if (file.bad()) return "";
    return hasher.finalHex();
}

}  // namespace layerstore
