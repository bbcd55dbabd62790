#include "bit_packer.hpp"
#include "base91_errors.hpp"
#include <cstdint>
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace {
std::string as_string(const std::vector<uint8_t> &buffer) {
  return std::string(buffer.begin(), buffer.end());
}
} // namespace

// ============================================================================
//  BitPacker Tests
// ============================================================================

TEST(BitPackerTest, SingleByteWaitsForFlush) {
  std::vector<uint8_t> buffer;
  BitPacker packer(buffer);

  // 8 bits queued, no group complete yet
  packer.write_byte(0x2A);
  EXPECT_TRUE(buffer.empty());
  EXPECT_EQ(packer.pending_bits(), 8);

  // 8 remaining bits need two symbols
  packer.flush();
  EXPECT_EQ(as_string(buffer), "qA");
  EXPECT_EQ(packer.pending_bits(), 0);
}

TEST(BitPackerTest, ThirteenBitGroup) {
  std::vector<uint8_t> buffer;
  BitPacker packer(buffer);

  // 0x2B2A: low 13 bits are 2858 > 88, so 13 bits are taken, 3 stay queued
  packer.write_byte(0x2A);
  packer.write_byte(0x2B);
  EXPECT_EQ(as_string(buffer), "lf");
  EXPECT_EQ(packer.pending_bits(), 3);

  // 3 bits holding a value <= 90 fit in one symbol
  packer.flush();
  EXPECT_EQ(as_string(buffer), "lfB");
}

TEST(BitPackerTest, FourteenBitGroup) {
  std::vector<uint8_t> buffer;
  BitPacker packer(buffer);

  // Zero low 13 bits are <= 88, so 14 bits are taken
  packer.write_byte(0x00);
  packer.write_byte(0x00);
  EXPECT_EQ(as_string(buffer), "AA");
  EXPECT_EQ(packer.pending_bits(), 2);
}

TEST(BitPackerTest, FlushIsIdempotent) {
  std::vector<uint8_t> buffer;
  BitPacker packer(buffer);

  packer.write_byte(0x2A);
  packer.flush();
  packer.flush();
  EXPECT_EQ(as_string(buffer), "qA");
}

TEST(BitPackerTest, FlushOnEmptyWritesNothing) {
  std::vector<uint8_t> buffer;
  BitPacker packer(buffer);
  packer.flush();
  EXPECT_TRUE(buffer.empty());
}

TEST(BitPackerTest, AppendsToExistingContent) {
  std::vector<uint8_t> buffer = {'#'};
  BitPacker packer(buffer);

  const uint8_t data[] = {0x00, 0x01, 0x02, 0x03};
  packer.write_bytes(data, sizeof(data));
  packer.flush();
  EXPECT_EQ(as_string(buffer), "#:C#(A");
}

TEST(BitPackerTest, PendingBitsStayBelowFourteen) {
  std::vector<uint8_t> buffer;
  BitPacker packer(buffer);

  for (int i = 0; i < 1000; i++) {
    packer.write_byte(static_cast<uint8_t>(i * 37));
    ASSERT_LE(packer.pending_bits(), 13);
    ASSERT_GE(packer.pending_bits(), 0);
  }
}

// ============================================================================
//  BitUnpacker Tests
// ============================================================================

TEST(BitUnpackerTest, PairProducesByte) {
  std::vector<uint8_t> buffer;
  BitUnpacker unpacker(buffer);

  unpacker.read_symbol('q');
  EXPECT_TRUE(unpacker.has_pending());
  EXPECT_TRUE(buffer.empty());

  // 'q' + 'A' * 91 = 42, a 14-bit group: one whole byte, 6 bits of padding
  unpacker.read_symbol('A');
  EXPECT_FALSE(unpacker.has_pending());
  ASSERT_EQ(buffer.size(), 1u);
  EXPECT_EQ(buffer[0], 0x2A);

  unpacker.flush();
  EXPECT_EQ(buffer.size(), 1u);
}

TEST(BitUnpackerTest, TrailingSymbolFlushesOneByte) {
  std::vector<uint8_t> buffer;
  BitUnpacker unpacker(buffer);

  const std::string encoded = "lfB";
  unpacker.read_symbols(reinterpret_cast<const uint8_t *>(encoded.data()),
                        encoded.size());
  EXPECT_TRUE(unpacker.has_pending());
  ASSERT_EQ(buffer.size(), 1u);

  unpacker.flush();
  ASSERT_EQ(buffer.size(), 2u);
  EXPECT_EQ(buffer[0], 0x2A);
  EXPECT_EQ(buffer[1], 0x2B);
}

TEST(BitUnpackerTest, LoneSymbol) {
  std::vector<uint8_t> buffer;
  BitUnpacker unpacker(buffer);

  unpacker.read_symbol('A');
  unpacker.flush();
  ASSERT_EQ(buffer.size(), 1u);
  EXPECT_EQ(buffer[0], 0x00);
}

TEST(BitUnpackerTest, InvalidSymbolReportsPosition) {
  std::vector<uint8_t> buffer;
  BitUnpacker unpacker(buffer);

  const std::string encoded = "ab c";
  try {
    unpacker.read_symbols(reinterpret_cast<const uint8_t *>(encoded.data()),
                          encoded.size());
    FAIL() << "Expected CorruptInputError";
  } catch (const CorruptInputError &e) {
    EXPECT_EQ(e.position(), 2u);
    EXPECT_STREQ(e.what(), "base91: illegal data at input byte 2");
  }
  EXPECT_EQ(unpacker.position(), 2u);
}

TEST(BitUnpackerTest, PositionCountsAcrossCalls) {
  std::vector<uint8_t> buffer;
  BitUnpacker unpacker(buffer);

  unpacker.read_symbol('T');
  unpacker.read_symbol('P');
  EXPECT_EQ(unpacker.position(), 2u);
  try {
    unpacker.read_symbol('-');
    FAIL() << "Expected CorruptInputError";
  } catch (const CorruptInputError &e) {
    EXPECT_EQ(e.position(), 2u);
  }
}

TEST(BitUnpackerTest, PackerRoundTrip) {
  std::vector<uint8_t> original;
  for (int i = 0; i < 257; i++) {
    original.push_back(static_cast<uint8_t>(255 - i));
  }

  std::vector<uint8_t> encoded;
  BitPacker packer(encoded);
  packer.write_bytes(original.data(), original.size());
  packer.flush();

  std::vector<uint8_t> decoded;
  BitUnpacker unpacker(decoded);
  unpacker.read_symbols(encoded.data(), encoded.size());
  unpacker.flush();

  EXPECT_EQ(decoded, original);
}
