#ifndef BASE91_CODEC_HPP
#define BASE91_CODEC_HPP

/**
 * @file base91_codec.hpp
 * @brief One-shot basE91 encoder/decoder over in-memory buffers.
 *
 * basE91 (http://base91.sourceforge.net) stores binary data in 91 printable
 * ASCII characters, using 13 or 14 input bits per pair of output characters.
 * Overhead is between 14% and 23%, compared with 33% for base64.
 *
 * The one-shot codec runs a BitPacker/BitUnpacker over a fully materialized
 * buffer. The streaming classes in base91_stream.hpp use the same cores, so
 * both paths produce byte-identical output.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/**
 * @brief basE91 codec (Memory Mode)
 * * Stateless: every call starts from an empty accumulator, so one instance
 * can be reused for any number of unrelated buffers.
 * * Errors: decode() throws CorruptInputError at the first byte outside the
 * alphabet. encode() accepts any input.
 */
class Base91Codec {
public:
    /**
     * @brief Encode a block of bytes.
     * @param data Raw input. May be empty.
     * @return std::vector<uint8_t> The encoded symbols (empty for empty input).
     */
    std::vector<uint8_t> encode(const std::vector<uint8_t>& data) const;

    /**
     * @brief Encode a string's bytes and return the symbols as a string.
     */
    std::string encode(const std::string& data) const;

    /**
     * @brief Decode a block of symbols.
     * @param encoded The basE91 text. May be empty.
     * @return std::vector<uint8_t> The decoded bytes.
     * @throw CorruptInputError If a byte is not part of the alphabet.
     */
    std::vector<uint8_t> decode(const std::vector<uint8_t>& encoded) const;

    std::string decode(const std::string& encoded) const;

    /**
     * @brief Upper bound on the encoded length of n input bytes.
     * * Worst case is 13 bits per two symbols.
     */
    static size_t encoded_len(size_t n);

    /**
     * @brief Decoded length of n symbols when every pair carries 14 bits.
     * * Used to size buffers. An unpaired trailing symbol adds one byte that
     * this bound can miss (e.g. n = 1).
     */
    static size_t decoded_len(size_t n);

private:
    void encode_into(const uint8_t* data, size_t len, std::vector<uint8_t>& out) const;
    void decode_into(const uint8_t* data, size_t len, std::vector<uint8_t>& out) const;
};

#endif // BASE91_CODEC_HPP
