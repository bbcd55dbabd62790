#include "base91_stream.hpp"
#include "b91_debug.hpp"
#include "base91_errors.hpp"
#include <algorithm>
#include <stdexcept>

// ============================================================================
//  Base91StreamEncoder
// ============================================================================

Base91StreamEncoder::Base91StreamEncoder(ByteSink& sink)
    : sink_(sink), packer_(pending_), closed_(false),
      bytes_consumed_(0), symbols_written_(0) {
    pending_.reserve(2);
}

size_t Base91StreamEncoder::write(const uint8_t* data, size_t len) {
    if (error_) {
        std::rethrow_exception(error_);
    }
    if (closed_) {
        throw std::logic_error("Base91StreamEncoder: write after close");
    }
    if (len == 0) {
        return 0;
    }

    // The whole chunk is reported as consumed, even if the sink fails midway
    bytes_consumed_ += len;

    try {
        for (size_t i = 0; i < len; ++i) {
            packer_.write_byte(data[i]);
            if (!pending_.empty()) {
                drain();
            }
        }
    } catch (...) {
        error_ = std::current_exception();
        B91_DEBUG_LOG("stream encoder: sink failed after " << symbols_written_
                      << " symbols");
        throw;
    }
    return len;
}

void Base91StreamEncoder::close() {
    if (error_) {
        std::rethrow_exception(error_);
    }
    if (closed_) {
        return;
    }

    B91_DEBUG_LOG("stream encoder: close with " << packer_.pending_bits()
                  << " pending bits");
    packer_.flush();
    closed_ = true;

    try {
        drain();
    } catch (...) {
        error_ = std::current_exception();
        throw;
    }
}

void Base91StreamEncoder::drain() {
    if (pending_.empty()) {
        return;
    }
    size_t n = sink_.write(pending_.data(), pending_.size());
    if (n < pending_.size()) {
        throw std::runtime_error("Base91StreamEncoder: short write");
    }
    symbols_written_ += n;
    pending_.clear();
}

// ============================================================================
//  Base91StreamDecoder
// ============================================================================

Base91StreamDecoder::Base91StreamDecoder(ByteSource& source, size_t chunk_size)
    : source_(source), pos_(0), unpacker_(decoded_), source_done_(false) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk_size must be >= 1");
    }
    chunk_.resize(chunk_size);
    // A chunk decodes to at most ceil(chunk * 14 / 16) bytes, +1 for the
    // bits and half-pair carried in from the previous chunk
    decoded_.reserve((chunk_size * 14 + 15) / 16 + 1);
}

size_t Base91StreamDecoder::read(uint8_t* buffer, size_t len) {
    if (error_) {
        std::rethrow_exception(error_);
    }
    if (len == 0) {
        return 0;
    }

    // A refill can decode nothing (e.g. a single symbol waiting for its
    // partner), so keep pulling until there is output or the source ends
    while (pos_ >= decoded_.size()) {
        if (source_done_) {
            return 0;
        }
        refill();
    }

    size_t n = std::min(len, decoded_.size() - pos_);
    std::copy_n(decoded_.begin() + pos_, n, buffer);
    pos_ += n;
    return n;
}

void Base91StreamDecoder::refill() {
    decoded_.clear();
    pos_ = 0;

    size_t rn = source_.read(chunk_.data(), chunk_.size());
    if (rn == 0) {
        unpacker_.flush();
        source_done_ = true;
        B91_DEBUG_LOG("stream decoder: end of source after "
                      << unpacker_.position() << " symbols");
        return;
    }

    try {
        unpacker_.read_symbols(chunk_.data(), rn);
    } catch (const CorruptInputError& e) {
        decoded_.clear();
        error_ = std::current_exception();
        B91_DEBUG_LOG("stream decoder: " << e.what());
        throw;
    }
    B91_DEBUG_LOG("stream decoder: " << rn << " symbols -> "
                  << decoded_.size() << " bytes");
}

// ============================================================================
//  Pipes
// ============================================================================

uint64_t encode_stream(ByteSource& source, ByteSink& sink) {
    std::vector<uint8_t> buffer(B91Format::PIPE_BUFFER_SIZE);
    Base91StreamEncoder encoder(sink);

    for (;;) {
        size_t n = source.read(buffer.data(), buffer.size());
        if (n == 0) {
            break;
        }
        encoder.write(buffer.data(), n);
    }
    encoder.close();
    return encoder.symbols_written();
}

uint64_t decode_stream(ByteSource& source, ByteSink& sink) {
    std::vector<uint8_t> buffer(B91Format::PIPE_BUFFER_SIZE);
    Base91StreamDecoder decoder(source);

    uint64_t total = 0;
    for (;;) {
        size_t n = decoder.read(buffer.data(), buffer.size());
        if (n == 0) {
            break;
        }
        if (sink.write(buffer.data(), n) < n) {
            throw std::runtime_error("decode_stream: short write");
        }
        total += n;
    }
    return total;
}
