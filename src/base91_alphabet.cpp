#include "base91_alphabet.hpp"
#include "b91_format.hpp"

static_assert(sizeof(B91Format::ALPHABET) == B91Format::RADIX + 1,
              "alphabet must hold exactly 91 symbols");

Base91Alphabet::Base91Alphabet() {
    decode_map_.fill(B91Format::INVALID_SYMBOL);
    for (size_t i = 0; i < encode_map_.size(); ++i) {
        uint8_t c = static_cast<uint8_t>(B91Format::ALPHABET[i]);
        encode_map_[i] = c;
        decode_map_[c] = static_cast<uint8_t>(i);
    }
}

const Base91Alphabet& Base91Alphabet::standard() {
    // Thread-safe one-time construction (C++11 magic statics)
    static const Base91Alphabet instance;
    return instance;
}

std::optional<uint8_t> Base91Alphabet::value_of(uint8_t byte) const {
    uint8_t v = decode_map_[byte];
    if (v == B91Format::INVALID_SYMBOL) {
        return std::nullopt;
    }
    return v;
}
