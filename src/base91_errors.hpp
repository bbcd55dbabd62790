#ifndef BASE91_ERRORS_HPP
#define BASE91_ERRORS_HPP

/**
 * @file base91_errors.hpp
 * @brief Exceptions raised by the base91 decoders.
 */

#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @brief Raised when a decoder meets a byte outside the basE91 alphabet.
 * 
 * The position is the zero-based offset of the offending byte in the input
 * consumed by the decoder (for the stream decoder, counted from the start of
 * the stream, not from the start of the current chunk).
 */
class CorruptInputError : public std::runtime_error {
public:
    explicit CorruptInputError(uint64_t position)
        : std::runtime_error("base91: illegal data at input byte " + std::to_string(position)),
          position_(position) {}

    uint64_t position() const noexcept { return position_; }

private:
    uint64_t position_;
};

#endif // BASE91_ERRORS_HPP
