#ifndef BYTE_STREAM_HPP
#define BYTE_STREAM_HPP

/**
 * @file byte_stream.hpp
 * @brief Byte sink/source interfaces used by the streaming codecs.
 * * The stream encoder only needs "write these bytes" and the stream decoder
 * only needs "fill this buffer". Both are injected by reference; the caller
 * keeps ownership and must keep them alive while the codec is in use.
 * * Errors from a sink or source are reported by throwing. The codecs never
 * catch them for retry.
 */

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <vector>

/**
 * @brief Destination for encoded or decoded bytes.
 */
class ByteSink {
public:
    virtual ~ByteSink() = default;

    /**
     * @brief Write bytes.
     * @return size_t Number of bytes accepted. Anything below len is treated
     * as a failure by the codecs.
     */
    virtual size_t write(const uint8_t* data, size_t len) = 0;
};

/**
 * @brief Origin of bytes to encode or decode.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    /**
     * @brief Read up to len bytes into buffer.
     * @return size_t Number of bytes read. 0 (for len > 0) means end of stream.
     */
    virtual size_t read(uint8_t* buffer, size_t len) = 0;
};

/**
 * @brief Sink appending to a caller-owned vector.
 */
class MemorySink : public ByteSink {
public:
    explicit MemorySink(std::vector<uint8_t>& target_buffer) : buffer_(target_buffer) {}

    size_t write(const uint8_t* data, size_t len) override;

private:
    std::vector<uint8_t>& buffer_;
};

/**
 * @brief Source serving a caller-owned vector front to back.
 */
class MemorySource : public ByteSource {
public:
    explicit MemorySource(const std::vector<uint8_t>& source_buffer)
        : buffer_(source_buffer), pos_(0) {}

    size_t read(uint8_t* buffer, size_t len) override;

    bool eof() const { return pos_ >= buffer_.size(); }

private:
    const std::vector<uint8_t>& buffer_;
    size_t pos_;
};

/**
 * @brief Sink over a std::ostream (file, stringstream, std::cout...).
 * @throw std::runtime_error From write() if the stream enters a failed state.
 */
class OstreamSink : public ByteSink {
public:
    explicit OstreamSink(std::ostream& out) : out_(out) {}

    size_t write(const uint8_t* data, size_t len) override;

private:
    std::ostream& out_;
};

/**
 * @brief Source over a std::istream.
 * @throw std::runtime_error From read() on a stream error other than end-of-file.
 */
class IstreamSource : public ByteSource {
public:
    explicit IstreamSource(std::istream& in) : in_(in) {}

    size_t read(uint8_t* buffer, size_t len) override;

private:
    std::istream& in_;
};

#endif // BYTE_STREAM_HPP
