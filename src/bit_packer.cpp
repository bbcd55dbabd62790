/**
 * @file bit_packer.cpp
 * @brief Implementation of the basE91 bit packer and unpacker.
 */

#include "bit_packer.hpp"
#include "b91_format.hpp"
#include "base91_errors.hpp"

// ============================================================================
//  BitPacker Implementation
// ============================================================================

BitPacker::BitPacker(std::vector<uint8_t>& target_buffer)
    : buffer_(target_buffer), alphabet_(Base91Alphabet::standard()),
      queue_(0), num_bits_(0) {
}

void BitPacker::write_byte(uint8_t byte) {
    queue_ |= static_cast<uint32_t>(byte) << num_bits_;
    num_bits_ += 8;

    // num_bits_ never exceeds 21 here, so a single extraction brings it back
    // to 13 or less
    if (num_bits_ > 13) {
        uint32_t value = queue_ & B91Format::MASK_13;
        if (value > B91Format::GROUP_THRESHOLD) {
            queue_ >>= 13;
            num_bits_ -= 13;
        } else {
            // Low 13 bits are small enough to take a 14th bit
            value = queue_ & B91Format::MASK_14;
            queue_ >>= 14;
            num_bits_ -= 14;
        }
        emit_pair(value);
    }
}

void BitPacker::write_bytes(const uint8_t* data, size_t len) {
    for (size_t i = 0; i < len; ++i) {
        write_byte(data[i]);
    }
}

void BitPacker::flush() {
    if (num_bits_ > 0) {
        buffer_.push_back(alphabet_.symbol(queue_ % B91Format::RADIX));
        if (num_bits_ > 7 || queue_ > 90) {
            buffer_.push_back(alphabet_.symbol(queue_ / B91Format::RADIX));
        }
    }
    queue_ = 0;
    num_bits_ = 0;
}

void BitPacker::emit_pair(uint32_t value) {
    // Low digit first
    buffer_.push_back(alphabet_.symbol(value % B91Format::RADIX));
    buffer_.push_back(alphabet_.symbol(value / B91Format::RADIX));
}

// ============================================================================
//  BitUnpacker Implementation
// ============================================================================

BitUnpacker::BitUnpacker(std::vector<uint8_t>& target_buffer)
    : buffer_(target_buffer), alphabet_(Base91Alphabet::standard()),
      queue_(0), num_bits_(0), position_(0) {
}

void BitUnpacker::read_symbol(uint8_t symbol) {
    std::optional<uint8_t> digit = alphabet_.value_of(symbol);
    if (!digit) {
        throw CorruptInputError(position_);
    }
    position_++;

    if (!pending_) {
        pending_ = *digit;
        return;
    }

    uint32_t value = *pending_ + static_cast<uint32_t>(*digit) * B91Format::RADIX;
    pending_.reset();

    queue_ |= value << num_bits_;
    // Mirror of the packer's group size decision
    if ((value & B91Format::MASK_13) > B91Format::GROUP_THRESHOLD) {
        num_bits_ += 13;
    } else {
        num_bits_ += 14;
    }

    do {
        buffer_.push_back(static_cast<uint8_t>(queue_ & 0xFF));
        queue_ >>= 8;
        num_bits_ -= 8;
    } while (num_bits_ > 7);
}

void BitUnpacker::read_symbols(const uint8_t* data, size_t len) {
    for (size_t i = 0; i < len; ++i) {
        read_symbol(data[i]);
    }
}

void BitUnpacker::flush() {
    if (pending_) {
        buffer_.push_back(static_cast<uint8_t>((queue_ | (*pending_ << num_bits_)) & 0xFF));
        pending_.reset();
    }
    queue_ = 0;
    num_bits_ = 0;
}
