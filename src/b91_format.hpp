#ifndef B91_FORMAT_HPP
#define B91_FORMAT_HPP

/**
 * @file b91_format.hpp
 * @brief basE91 wire format definitions
 * 
 * basE91 maps binary data onto 91 printable ASCII characters. Input bits are
 * grouped 13 or 14 at a time (least significant bit first) and each group is
 * written as two base-91 digits, low digit first.
 * 
 * Group size rule:
 * - Take the low 13 bits of the accumulator. If that value is above 88 it is
 *   emitted as a 13-bit group.
 * - Otherwise one more bit is taken. A 14-bit value whose low 13 bits are at
 *   most 88 is at most 8192 + 88 = 8280 = 91 * 91 - 1, so two digits always
 *   suffice.
 * 
 * The alphabet is a fixed external contract. Changing it breaks every
 * previously encoded payload.
 */

#include <cstdint>
#include <cstddef>

/**
 * @brief basE91 format constants
 * 
 * This namespace contains the alphabet, the bit-grouping constants and the
 * default buffer sizes shared by the one-shot and streaming codecs.
 */

namespace B91Format {
    // 91 printable ASCII characters (no space, apostrophe, hyphen, backslash)
    static constexpr char ALPHABET[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789"
        "!#$%&()*+,./:;<=>?@[]^_`{|}~\"";

    // Radix of the encoding
    static constexpr uint32_t RADIX = 91;

    // Reverse table marker for bytes outside the alphabet
    static constexpr uint8_t INVALID_SYMBOL = 0xFF;

    // Masks for the two group widths
    static constexpr uint32_t MASK_13 = 0x1FFF;
    static constexpr uint32_t MASK_14 = 0x3FFF;

    // A 13-bit window above this value is emitted as a 13-bit group
    static constexpr uint32_t GROUP_THRESHOLD = 88;

    // Bytes requested from the upstream source per stream decoder refill
    static constexpr size_t DEFAULT_READ_CHUNK = 1024;

    // Working buffer for encode_stream()/decode_stream()
    static constexpr size_t PIPE_BUFFER_SIZE = 64 * 1024;
}

#endif // B91_FORMAT_HPP
