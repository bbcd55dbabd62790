#ifndef BIT_PACKER_HPP
#define BIT_PACKER_HPP

/**
 * @file bit_packer.hpp
 * @brief basE91 bit packing and unpacking over memory buffers.
 * * This file defines the BitPacker and BitUnpacker classes, which turn bytes
 * into basE91 symbols and back, appending their output to a caller-owned
 * std::vector<uint8_t>.
 * * Key Features:
 * - Incremental: state is a small bit accumulator (plus a pending half-pair
 *   when decoding), so input can arrive in arbitrarily small pieces.
 * - LSB First: input bytes are appended above the bits already queued.
 * - Exceptions: BitUnpacker throws CorruptInputError on bytes outside the
 *   alphabet.
 */

#include "base91_alphabet.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

/**
 * @brief Packs bytes into basE91 symbols.
 * * Each byte adds 8 bits to the accumulator. As soon as more than 13 bits
 * are queued, a 13- or 14-bit group is taken off the bottom and written as
 * two symbols. At most 13 bits stay queued between calls.
 */
class BitPacker {
public:
    /**
     * @brief Construct a new Bit Packer object.
     * * @param target_buffer Reference to the output vector. Symbols are
     * appended to existing content. The caller retains ownership of this vector.
     */
    explicit BitPacker(std::vector<uint8_t>& target_buffer);

    /**
     * @brief Queue one byte, emitting a symbol pair if a group completes.
     * * @param byte The input byte.
     */
    void write_byte(uint8_t byte);

    /**
     * @brief Queue a run of bytes.
     */
    void write_bytes(const uint8_t* data, size_t len);

    /**
     * @brief Emits the symbols for any queued bits and resets the accumulator.
     * * One symbol is written when the remainder fits in a single digit
     * (at most 7 bits and a value of at most 90), two otherwise. Calling
     * flush() with nothing queued writes nothing.
     */
    void flush();

    /// Number of bits currently queued (0-13 between calls).
    int pending_bits() const { return num_bits_; }

private:
    void emit_pair(uint32_t value);

    std::vector<uint8_t>& buffer_;   ///< Reference to the user-owned output vector.
    const Base91Alphabet& alphabet_;
    uint32_t queue_;                 ///< Bit accumulator.
    int num_bits_;                   ///< Valid low bits in queue_.
};

/**
 * @brief Unpacks basE91 symbols into bytes.
 * * Symbols are consumed in pairs. The first symbol of a pair is held until
 * its partner arrives; the pair's value decides (by the same threshold the
 * packer uses) whether it carries 13 or 14 bits. Whole bytes are written as
 * soon as they are available.
 */
class BitUnpacker {
public:
    /**
     * @brief Construct a new Bit Unpacker object.
     * * @param target_buffer Reference to the output vector. Decoded bytes are
     * appended to existing content.
     */
    explicit BitUnpacker(std::vector<uint8_t>& target_buffer);

    /**
     * @brief Consume one symbol.
     * * @param symbol The encoded character.
     * @throw CorruptInputError If the symbol is not part of the alphabet. The
     * reported position is the number of symbols consumed before it.
     */
    void read_symbol(uint8_t symbol);

    /**
     * @brief Consume a run of symbols, stopping at the first invalid one.
     * @throw CorruptInputError See read_symbol().
     */
    void read_symbols(const uint8_t* data, size_t len);

    /**
     * @brief Writes the byte held by an unpaired trailing symbol, if any, and
     * resets the accumulator. The symbol counter is kept.
     */
    void flush();

    /// True when a first symbol is waiting for its partner.
    bool has_pending() const { return pending_.has_value(); }

    /// Number of symbols consumed so far.
    uint64_t position() const { return position_; }

private:
    std::vector<uint8_t>& buffer_;
    const Base91Alphabet& alphabet_;
    uint32_t queue_;
    int num_bits_;
    std::optional<uint32_t> pending_; ///< First symbol of an incomplete pair.
    uint64_t position_;
};

#endif // BIT_PACKER_HPP
