#ifndef BASE91_ALPHABET_HPP
#define BASE91_ALPHABET_HPP

/**
 * @file base91_alphabet.hpp
 * @brief Symbol tables for basE91.
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

/**
 * @brief Bidirectional mapping between symbol values (0..90) and characters.
 * 
 * The forward table holds the 91 symbols in value order. The reverse table
 * has one entry per possible input byte and marks every byte that is not a
 * symbol as B91Format::INVALID_SYMBOL; callers only ever see that marker as
 * an empty optional.
 * 
 * There is exactly one instance, built on first use and never modified.
 */
class Base91Alphabet {
public:
    /**
     * @brief Get the standard alphabet.
     * @return const Base91Alphabet& Shared immutable instance.
     */
    static const Base91Alphabet& standard();

    /**
     * @brief Character for a symbol value.
     * @param value Symbol value, must be below 91 (unchecked).
     */
    uint8_t symbol(uint32_t value) const { return encode_map_[value]; }

    /**
     * @brief Symbol value for an input byte.
     * @return std::optional<uint8_t> The value, or empty if the byte is not
     * part of the alphabet.
     */
    std::optional<uint8_t> value_of(uint8_t byte) const;

    bool contains(uint8_t byte) const { return value_of(byte).has_value(); }

    static constexpr size_t size() { return 91; }

    Base91Alphabet(const Base91Alphabet&) = delete;
    Base91Alphabet& operator=(const Base91Alphabet&) = delete;

private:
    Base91Alphabet();

    std::array<uint8_t, 91> encode_map_;  ///< value -> character
    std::array<uint8_t, 256> decode_map_; ///< character -> value or INVALID_SYMBOL
};

#endif // BASE91_ALPHABET_HPP
