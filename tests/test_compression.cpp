#include <string>
#include <vector>

#include <mpqx/compression.hpp>

#include <gtest/gtest.h>

#include "mpq_builder.hpp"

using mpqx::test::compressSector;

namespace {

// Test codec: every input byte stands for two output bytes
bool doubleBytes(std::span<const uint8_t> in, size_t outLimit, std::vector<uint8_t> &out,
                 std::string *outError) {
  if (in.size() * 2 > outLimit) {
    if (outError) {
      *outError = "output too large";
    }
    return false;
  }
  for (uint8_t b : in) {
    out.push_back(b);
    out.push_back(b);
  }
  return true;
}

} // namespace

class CompressionTest : public ::testing::Test {
protected:
  mpqx::CodecRegistry registry_ = mpqx::CodecRegistry::withDefaults();
};

// Test the codecs registered by default
TEST_F(CompressionTest, DefaultCodecs) {
  EXPECT_TRUE(registry_.has(mpqx::kCompressionZlib));
  EXPECT_TRUE(registry_.has(mpqx::kCompressionBzip2));
  EXPECT_TRUE(registry_.has(mpqx::kCompressionLzma));
  EXPECT_TRUE(registry_.has(mpqx::kCompressionSparse));
  EXPECT_TRUE(registry_.has(mpqx::kCompressionAdpcmMono));
  EXPECT_TRUE(registry_.has(mpqx::kCompressionAdpcmStereo));
  EXPECT_FALSE(registry_.has(mpqx::kCompressionPkware));
  EXPECT_FALSE(registry_.has(mpqx::kCompressionHuffman));
}

// Test zlib sectors
TEST_F(CompressionTest, Zlib) {
  auto plain = mpqx::test::textData(4096);
  auto packed = compressSector(mpqx::kCompressionZlib, plain);
  ASSERT_LT(packed.size(), plain.size());

  mpqx::Error error;
  auto out = registry_.decompress(packed, plain.size(), &error);
  ASSERT_TRUE(out.has_value()) << error.message;
  EXPECT_EQ(*out, plain);
}

// Test bzip2 sectors
TEST_F(CompressionTest, Bzip2) {
  auto plain = mpqx::test::textData(4096, 7);
  auto packed = compressSector(mpqx::kCompressionBzip2, plain);

  mpqx::Error error;
  auto out = registry_.decompress(packed, plain.size(), &error);
  ASSERT_TRUE(out.has_value()) << error.message;
  EXPECT_EQ(*out, plain);
}

// Test LZMA sectors, which carry a filter byte before the stream
TEST_F(CompressionTest, Lzma) {
  auto plain = mpqx::test::textData(4096, 3);
  auto packed = compressSector(mpqx::kCompressionLzma, plain);
  ASSERT_EQ(packed[0], mpqx::kCompressionLzma);
  ASSERT_EQ(packed[1], 0);

  mpqx::Error error;
  auto out = registry_.decompress(packed, plain.size(), &error);
  ASSERT_TRUE(out.has_value()) << error.message;
  EXPECT_EQ(*out, plain);
}

// Test that LZMA rejects unknown filters
TEST_F(CompressionTest, LzmaFilterRejected) {
  auto plain = mpqx::test::textData(1024);
  auto packed = compressSector(mpqx::kCompressionLzma, plain);
  packed[1] = 1;

  mpqx::Error error;
  EXPECT_FALSE(registry_.decompress(packed, plain.size(), &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::DecompressionFailed);
}

// Test sparse sectors
TEST_F(CompressionTest, Sparse) {
  auto plain = mpqx::test::sparseData(4096);
  auto packed = compressSector(mpqx::kCompressionSparse, plain);
  ASSERT_LT(packed.size(), plain.size());

  mpqx::Error error;
  auto out = registry_.decompress(packed, plain.size(), &error);
  ASSERT_TRUE(out.has_value()) << error.message;
  EXPECT_EQ(*out, plain);
}

// Test a hand-written sparse stream
TEST_F(CompressionTest, SparseHandVector) {
  // Size 8: two literals, then five zeros, then one literal
  std::vector<uint8_t> packed = {mpqx::kCompressionSparse, 0, 0, 0, 8, 0x81, 'a', 'b', 0x02,
                                 0x80, 'c'};

  mpqx::Error error;
  auto out = registry_.decompress(packed, 8, &error);
  ASSERT_TRUE(out.has_value()) << error.message;
  EXPECT_EQ(*out, (std::vector<uint8_t>{'a', 'b', 0, 0, 0, 0, 0, 'c'}));
}

// Test a sparse stream whose declared size exceeds the sector
TEST_F(CompressionTest, SparseTooLarge) {
  std::vector<uint8_t> packed = {mpqx::kCompressionSparse, 0, 0, 1, 0, 0x7F};

  mpqx::Error error;
  EXPECT_FALSE(registry_.decompress(packed, 16, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::DecompressionFailed);
}

// Test chaining: sparse was applied first, zlib second
TEST_F(CompressionTest, SparseThenZlib) {
  auto plain = mpqx::test::sparseData(4096);
  uint8_t mask = mpqx::kCompressionSparse | mpqx::kCompressionZlib;
  auto packed = compressSector(mask, plain);
  ASSERT_EQ(packed[0], mask);

  mpqx::Error error;
  auto out = registry_.decompress(packed, plain.size(), &error);
  ASSERT_TRUE(out.has_value()) << error.message;
  EXPECT_EQ(*out, plain);
}

// Test chaining of bzip2 over zlib
TEST_F(CompressionTest, ZlibThenBzip2) {
  auto plain = mpqx::test::textData(4096, 11);
  uint8_t mask = mpqx::kCompressionBzip2 | mpqx::kCompressionZlib;
  auto packed = compressSector(mask, plain);

  mpqx::Error error;
  auto out = registry_.decompress(packed, plain.size(), &error);
  ASSERT_TRUE(out.has_value()) << error.message;
  EXPECT_EQ(*out, plain);
}

// Test mono ADPCM: initial sample followed by two repeats
TEST_F(CompressionTest, AdpcmMonoHandVector) {
  std::vector<uint8_t> packed = {mpqx::kCompressionAdpcmMono, 0x00, 0x02, 0x34, 0x12, 0x80, 0x80};

  mpqx::Error error;
  auto out = registry_.decompress(packed, 6, &error);
  ASSERT_TRUE(out.has_value()) << error.message;
  EXPECT_EQ(*out, (std::vector<uint8_t>{0x34, 0x12, 0x34, 0x12, 0x34, 0x12}));
}

// Test stereo ADPCM: samples alternate between channels
TEST_F(CompressionTest, AdpcmStereoHandVector) {
  std::vector<uint8_t> packed = {mpqx::kCompressionAdpcmStereo, 0x00, 0x02, 0x34, 0x12,
                                 0x78, 0x56, 0x80, 0x80};

  mpqx::Error error;
  auto out = registry_.decompress(packed, 8, &error);
  ASSERT_TRUE(out.has_value()) << error.message;
  EXPECT_EQ(*out, (std::vector<uint8_t>{0x34, 0x12, 0x78, 0x56, 0x34, 0x12, 0x78, 0x56}));
}

// Test an ADPCM delta: step index 0x2C gives step size 494
TEST_F(CompressionTest, AdpcmDecodesDelta) {
  // Bit shift 2: difference = 494 >> 2 = 123, bit 0 adds 494, sign bit clear
  std::vector<uint8_t> packed = {mpqx::kCompressionAdpcmMono, 0x00, 0x02, 0x00, 0x00, 0x01};

  mpqx::Error error;
  auto out = registry_.decompress(packed, 4, &error);
  ASSERT_TRUE(out.has_value()) << error.message;
  int16_t second = static_cast<int16_t>((*out)[2] | ((*out)[3] << 8));
  EXPECT_EQ(second, 617);
}

// Test that the output must match the expected length
TEST_F(CompressionTest, SizeMismatch) {
  auto plain = mpqx::test::textData(4096);
  auto packed = compressSector(mpqx::kCompressionZlib, plain);

  mpqx::Error error;
  EXPECT_FALSE(registry_.decompress(packed, plain.size() + 10, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::SectorSizeMismatch);
  EXPECT_EQ(error.category(), mpqx::ErrorCategory::Integrity);
}

// Test a zlib stream that decodes to more than the sector holds
TEST_F(CompressionTest, ZlibOverrunRejected) {
  std::vector<uint8_t> plain(200, 'A');
  auto packed = compressSector(mpqx::kCompressionZlib, plain);

  mpqx::Error error;
  EXPECT_FALSE(registry_.decompress(packed, 100, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::SectorSizeMismatch);
}

// Test a zlib stream cut off before its end
TEST_F(CompressionTest, ZlibTruncatedStream) {
  auto plain = mpqx::test::textData(4096);
  auto packed = compressSector(mpqx::kCompressionZlib, plain);
  packed.resize(packed.size() - 10);

  mpqx::Error error;
  EXPECT_FALSE(registry_.decompress(packed, plain.size(), &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::DecompressionFailed);
}

// Test an LZMA stream that decodes to more than the sector holds
TEST_F(CompressionTest, LzmaOverrunRejected) {
  auto plain = mpqx::test::textData(4096, 3);
  auto packed = compressSector(mpqx::kCompressionLzma, plain);

  mpqx::Error error;
  EXPECT_FALSE(registry_.decompress(packed, 1000, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::SectorSizeMismatch);
}

// Test a bzip2 stream that decodes to more than the sector holds
TEST_F(CompressionTest, Bzip2OverrunRejected) {
  auto plain = mpqx::test::textData(4096, 7);
  auto packed = compressSector(mpqx::kCompressionBzip2, plain);

  mpqx::Error error;
  EXPECT_FALSE(registry_.decompress(packed, 1000, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::DecompressionFailed);
}

// Test sparse data that ends before the declared size is reached
TEST_F(CompressionTest, SparseShortInput) {
  std::vector<uint8_t> packed = {mpqx::kCompressionSparse, 0, 0, 0, 100, 0x81, 'x', 'y'};

  mpqx::Error error;
  EXPECT_FALSE(registry_.decompress(packed, 100, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::DecompressionFailed);
  EXPECT_NE(error.message.find("2 of 100"), std::string::npos);
}

// Test ADPCM input left over once the output is full
TEST_F(CompressionTest, AdpcmTrailingInput) {
  std::vector<uint8_t> packed = {mpqx::kCompressionAdpcmMono, 0x00, 0x02, 0x34, 0x12,
                                 0x80, 0x80, 0x80};

  mpqx::Error error;
  EXPECT_FALSE(registry_.decompress(packed, 6, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::DecompressionFailed);

  // Same data with room for every sample
  auto out = registry_.decompress(packed, 8, &error);
  ASSERT_TRUE(out.has_value()) << error.message;
  EXPECT_EQ(out->size(), 8u);
}

// Test corrupt zlib data
TEST_F(CompressionTest, CorruptData) {
  std::vector<uint8_t> packed = {mpqx::kCompressionZlib, 0xDE, 0xAD, 0xBE, 0xEF, 0x00, 0x11};

  mpqx::Error error;
  EXPECT_FALSE(registry_.decompress(packed, 64, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::DecompressionFailed);
  EXPECT_FALSE(error.message.empty());
}

// Test bits without a registered codec
TEST_F(CompressionTest, UnregisteredMethod) {
  std::vector<uint8_t> packed = {mpqx::kCompressionPkware, 1, 2, 3};

  mpqx::Error error;
  EXPECT_FALSE(registry_.decompress(packed, 16, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::UnsupportedCompressionMethod);

  packed[0] = mpqx::kCompressionHuffman | mpqx::kCompressionZlib;
  EXPECT_FALSE(registry_.decompress(packed, 16, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::UnsupportedCompressionMethod);
}

// Test bits outside the known set
TEST_F(CompressionTest, UnknownBit) {
  std::vector<uint8_t> packed = {0x04, 1, 2, 3};

  mpqx::Error error;
  EXPECT_FALSE(registry_.decompress(packed, 16, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::UnsupportedCompressionMethod);
}

// Test a missing mask byte
TEST_F(CompressionTest, EmptyInput) {
  mpqx::Error error;
  EXPECT_FALSE(registry_.decompress({}, 16, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::DecompressionFailed);
}

// Test registering an extra codec
TEST_F(CompressionTest, CustomCodec) {
  registry_.registerCodec(mpqx::kCompressionPkware, doubleBytes);
  ASSERT_TRUE(registry_.has(mpqx::kCompressionPkware));

  std::vector<uint8_t> packed = {mpqx::kCompressionPkware, 'x', 'y'};
  mpqx::Error error;
  auto out = registry_.decompress(packed, 4, &error);
  ASSERT_TRUE(out.has_value()) << error.message;
  EXPECT_EQ(*out, (std::vector<uint8_t>{'x', 'x', 'y', 'y'}));
}

// Test that PKWARE is undone before Huffman
TEST_F(CompressionTest, StageOrder) {
  registry_.registerCodec(mpqx::kCompressionPkware, doubleBytes);
  registry_.registerCodec(mpqx::kCompressionHuffman,
                          [](std::span<const uint8_t> in, size_t, std::vector<uint8_t> &out,
                             std::string *) {
                            out.assign(in.begin(), in.end());
                            out.push_back('!');
                            return true;
                          });

  std::vector<uint8_t> packed = {mpqx::kCompressionPkware | mpqx::kCompressionHuffman, 'a', 'b'};
  mpqx::Error error;
  auto out = registry_.decompress(packed, 5, &error);
  ASSERT_TRUE(out.has_value()) << error.message;
  EXPECT_EQ(*out, (std::vector<uint8_t>{'a', 'a', 'b', 'b', '!'}));
}

// Test explode: the PKWARE codec applied without a mask byte
TEST_F(CompressionTest, Explode) {
  mpqx::Error error;
  std::vector<uint8_t> packed = {'a', 'b'};
  EXPECT_FALSE(registry_.explode(packed, 4, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::UnsupportedCompressionMethod);

  registry_.registerCodec(mpqx::kCompressionPkware, doubleBytes);
  auto out = registry_.explode(packed, 4, &error);
  ASSERT_TRUE(out.has_value()) << error.message;
  EXPECT_EQ(*out, (std::vector<uint8_t>{'a', 'a', 'b', 'b'}));
}

// Test that a failing codec reports its own reason
TEST_F(CompressionTest, CodecReason) {
  registry_.registerCodec(mpqx::kCompressionPkware, doubleBytes);
  std::vector<uint8_t> packed = {mpqx::kCompressionPkware, 'x', 'y', 'z'};

  mpqx::Error error;
  EXPECT_FALSE(registry_.decompress(packed, 4, &error).has_value());
  EXPECT_EQ(error.code, mpqx::ErrorCode::DecompressionFailed);
  EXPECT_NE(error.message.find("output too large"), std::string::npos);
}
