#ifndef BASE91_STREAM_HPP
#define BASE91_STREAM_HPP

/**
 * @file base91_stream.hpp
 * @brief Incremental basE91 encoding and decoding over byte sinks/sources.
 *
 * The stream codecs wrap the same BitPacker/BitUnpacker cores as Base91Codec.
 * Feeding a stream encoder any partition of an input, then closing it, writes
 * exactly Base91Codec::encode() of the whole input. Reading a stream decoder
 * with any sequence of buffer sizes yields exactly Base91Codec::decode().
 *
 * Memory use does not depend on stream length: the encoder keeps at most two
 * pending symbols, the decoder one source chunk and its decoded bytes.
 *
 * Instances are single-threaded. Nothing is locked.
 */

#include "b91_format.hpp"
#include "bit_packer.hpp"
#include "byte_stream.hpp"
#include <cstddef>
#include <cstdint>
#include <exception>
#include <vector>

/**
 * @brief Write-side streaming encoder.
 * * Every write() pushes its bytes through the packer immediately and hands
 * each completed symbol pair to the sink before returning. close() writes the
 * trailing symbols. The destructor does NOT close: a sink may throw, so the
 * caller must call close() explicitly.
 * * Failure handling: if the sink throws (or accepts fewer bytes than
 * offered) the exception reaches the caller of write()/close() as-is. The
 * failed chunk still counts as consumed in bytes_consumed(), although symbols
 * queued after the failure are never written. The encoder is unusable after
 * a failure: later calls rethrow the same exception.
 */
class Base91StreamEncoder {
public:
    /**
     * @brief Construct a new Base91StreamEncoder object.
     * * @param sink Destination for symbols. Must outlive the encoder.
     */
    explicit Base91StreamEncoder(ByteSink& sink);

    Base91StreamEncoder(const Base91StreamEncoder&) = delete;
    Base91StreamEncoder& operator=(const Base91StreamEncoder&) = delete;

    /**
     * @brief Encode a chunk.
     * * @return size_t Always len.
     * @throw std::logic_error If the encoder was closed.
     * @throw Whatever the sink throws, or std::runtime_error on a short write.
     */
    size_t write(const uint8_t* data, size_t len);

    size_t write(const std::vector<uint8_t>& data) { return write(data.data(), data.size()); }

    /**
     * @brief Flush the trailing symbols. Closing twice is a no-op.
     */
    void close();

    bool is_closed() const { return closed_; }

    /// Input bytes accepted by write(), including a chunk whose write failed.
    uint64_t bytes_consumed() const { return bytes_consumed_; }

    /// Symbols the sink has acknowledged.
    uint64_t symbols_written() const { return symbols_written_; }

private:
    void drain();

    ByteSink& sink_;
    std::vector<uint8_t> pending_;   ///< Symbols not yet handed to the sink (0-2).
    BitPacker packer_;               ///< Appends into pending_.
    bool closed_;
    std::exception_ptr error_;       ///< First failure, rethrown by later calls.
    uint64_t bytes_consumed_;
    uint64_t symbols_written_;
};

/**
 * @brief Read-side streaming decoder.
 * * read() returns buffered decoded bytes first. When the buffer is empty it
 * pulls one chunk of symbols from the source, decodes all of it and serves
 * the result over as many read() calls as needed. The unpacker state carries
 * across chunks, so a symbol pair split between two source reads is handled.
 * * An exhausted source (read() returning 0) ends the stream: the unpaired
 * trailing symbol, if any, becomes one last byte, then read() returns 0.
 * * Errors: a byte outside the alphabet throws CorruptInputError with its
 * offset from the start of the stream, and the decoded bytes of that chunk
 * are dropped. The decoder is unusable afterwards. Source exceptions pass
 * through untouched.
 */
class Base91StreamDecoder {
public:
    /**
     * @brief Construct a new Base91StreamDecoder object.
     * * @param source Origin of the symbols. Must outlive the decoder.
     * @param chunk_size Bytes requested from the source per refill.
     * @throw std::invalid_argument If chunk_size is 0.
     */
    explicit Base91StreamDecoder(ByteSource& source,
                                 size_t chunk_size = B91Format::DEFAULT_READ_CHUNK);

    Base91StreamDecoder(const Base91StreamDecoder&) = delete;
    Base91StreamDecoder& operator=(const Base91StreamDecoder&) = delete;

    /**
     * @brief Read decoded bytes.
     * * @return size_t Bytes copied to buffer. 0 means end of stream (or len == 0).
     */
    size_t read(uint8_t* buffer, size_t len);

    /// True once the source is exhausted and every decoded byte was returned.
    bool eof() const { return source_done_ && pos_ >= decoded_.size(); }

private:
    void refill();

    ByteSource& source_;
    std::vector<uint8_t> chunk_;     ///< Raw symbols, allocated once.
    std::vector<uint8_t> decoded_;   ///< Decoded bytes of the current chunk.
    size_t pos_;                     ///< Next unreturned byte in decoded_.
    BitUnpacker unpacker_;           ///< Appends into decoded_.
    bool source_done_;
    std::exception_ptr error_;
};

/**
 * @brief Encode everything a source yields into a sink.
 * @return uint64_t Number of symbols written.
 */
uint64_t encode_stream(ByteSource& source, ByteSink& sink);

/**
 * @brief Decode everything a source yields into a sink.
 * @return uint64_t Number of bytes written.
 * @throw CorruptInputError On a byte outside the alphabet.
 */
uint64_t decode_stream(ByteSource& source, ByteSink& sink);

#endif // BASE91_STREAM_HPP
