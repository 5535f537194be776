#include "utils/digest_stream.h"

namespace layerstore {

DigestingStreambuf::DigestingStreambuf(std::streambuf* source) : source_(source) {
    setg(buffer_.data(), buffer_.data(), buffer_.data());
}

std::streamsize DigestingStreambuf::fill() {
    if (!source_ || finished_) return 0;
    std::streamsize n = source_->sgetn(buffer_.data(), static_cast<std::streamsize>(buffer_.size()));
    if (n <= 0) return 0;
    hasher_.update(buffer_.data(), static_cast<size_t>(n));
    bytes_read_ += static_cast<size_t>(n);
    return n;
}

DigestingStreambuf::int_type DigestingStreambuf::underflow() {
    if (gptr() < egptr()) {
        return traits_type::to_int_type(*gptr());
    }
    std::streamsize n = fill();
    if (n == 0) {
        return traits_type::eof();
    }
    setg(buffer_.data(), buffer_.data(), buffer_.data() + n);
    return traits_type::to_int_type(*gptr());
}

std::string DigestingStreambuf::finish() {
    if (finished_) return "";
    // bytes already buffered were hashed when they were fetched
    setg(buffer_.data(), buffer_.data(), buffer_.data());
    while (fill() > 0) {
    }
    finished_ = true;
    return hasher_.finalHex();
}

}  // namespace layerstore
