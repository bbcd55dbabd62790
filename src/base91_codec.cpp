#include "base91_codec.hpp"
#include "bit_packer.hpp"

// ============================================================================
//  ENCODE (Memory to Memory)
// ============================================================================

std::vector<uint8_t> Base91Codec::encode(const std::vector<uint8_t> &data) const {
  if (data.empty()) {
    return {};
  }

  std::vector<uint8_t> output_buffer;
  encode_into(data.data(), data.size(), output_buffer);
  return output_buffer;
}

std::string Base91Codec::encode(const std::string &data) const {
  if (data.empty()) {
    return {};
  }

  std::vector<uint8_t> output_buffer;
  encode_into(reinterpret_cast<const uint8_t *>(data.data()), data.size(),
              output_buffer);
  return std::string(output_buffer.begin(), output_buffer.end());
}

void Base91Codec::encode_into(const uint8_t *data, size_t len,
                              std::vector<uint8_t> &out) const {
  // Reserve the worst case so the packer never reallocates
  out.reserve(out.size() + encoded_len(len));

  BitPacker packer(out);
  packer.write_bytes(data, len);
  packer.flush();
}

// ============================================================================
//  DECODE (Memory to Memory)
// ============================================================================

std::vector<uint8_t> Base91Codec::decode(const std::vector<uint8_t> &encoded) const {
  if (encoded.empty()) {
    return {};
  }

  std::vector<uint8_t> output_buffer;
  decode_into(encoded.data(), encoded.size(), output_buffer);
  return output_buffer;
}

std::string Base91Codec::decode(const std::string &encoded) const {
  if (encoded.empty()) {
    return {};
  }

  std::vector<uint8_t> output_buffer;
  decode_into(reinterpret_cast<const uint8_t *>(encoded.data()), encoded.size(),
              output_buffer);
  return std::string(output_buffer.begin(), output_buffer.end());
}

void Base91Codec::decode_into(const uint8_t *data, size_t len,
                              std::vector<uint8_t> &out) const {
  // +1 covers an unpaired trailing symbol
  out.reserve(out.size() + decoded_len(len) + 1);

  BitUnpacker unpacker(out);
  unpacker.read_symbols(data, len);
  unpacker.flush();
}

// ============================================================================
//  Length Bounds
// ============================================================================

size_t Base91Codec::encoded_len(size_t n) {
  // ceil(n * 16 / 13)
  return (n * 16 + 12) / 13;
}

size_t Base91Codec::decoded_len(size_t n) {
  // ceil(n * 14 / 16)
  return (n * 14 + 15) / 16;
}
