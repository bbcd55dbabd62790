/**
 * @file byte_stream.cpp
 * @brief Memory and iostream adapters for ByteSink/ByteSource.
 */

#include "byte_stream.hpp"
#include <algorithm>
#include <stdexcept>

// ============================================================================
//  Memory Adapters
// ============================================================================

size_t MemorySink::write(const uint8_t* data, size_t len) {
    buffer_.insert(buffer_.end(), data, data + len);
    return len;
}

size_t MemorySource::read(uint8_t* buffer, size_t len) {
    size_t n = std::min(len, buffer_.size() - pos_);
    std::copy_n(buffer_.begin() + pos_, n, buffer);
    pos_ += n;
    return n;
}

// ============================================================================
//  iostream Adapters
// ============================================================================

size_t OstreamSink::write(const uint8_t* data, size_t len) {
    out_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(len));
    if (!out_) {
        throw std::runtime_error("OstreamSink: write failed");
    }
    return len;
}

size_t IstreamSource::read(uint8_t* buffer, size_t len) {
    if (len == 0 || in_.eof()) {
        return 0;
    }

    in_.read(reinterpret_cast<char*>(buffer), static_cast<std::streamsize>(len));
    size_t n = static_cast<size_t>(in_.gcount());

    // A short read sets failbit together with eofbit; that is the normal end
    if (in_.bad() || (in_.fail() && !in_.eof())) {
        throw std::runtime_error("IstreamSource: read failed");
    }
    return n;
}
