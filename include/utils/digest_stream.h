// digest_stream.h - hash bytes while another reader consumes them
#pragma once

#include <array>
#include <cstddef>
#include <streambuf>
#include <string>

#include "utils/sha256.h"

namespace layerstore {

// Stream buffer that forwards reads from a source buffer and feeds every byte
// it hands out into a SHA-256 accumulator (a "tee" on the read side).
//
//   std::ifstream file(path, std::ios::binary);
//   DigestingStreambuf tee(file.rdbuf());
//   std::istream in(&tee);
//   auto doc = nlohmann::json::parse(in);
//   std::string digest = tee.finish();
//
// finish() drains whatever the consumer left unread, so the digest always
// covers the complete source. Call it only after the consumer succeeded.
class DigestingStreambuf : public std::streambuf {
public:
    explicit DigestingStreambuf(std::streambuf* source);

    DigestingStreambuf(const DigestingStreambuf&) = delete;
    DigestingStreambuf& operator=(const DigestingStreambuf&) = delete;

    // Lowercase hex digest of every byte of the source. "" on failure or
    // when called twice.
    std::string finish();

    size_t bytesRead() const { return bytes_read_; }

protected:
    int_type underflow() override;

private:
    std::streamsize fill();

    std::streambuf* source_;
    std::array<char, 8192> buffer_{};
    Sha256 hasher_;
    size_t bytes_read_{0};
    bool finished_{false};
};

}  // namespace layerstore
