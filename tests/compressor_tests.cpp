#include "core/compressor.hpp"
#include "core/errors.hpp"
#include "test_utils.hpp"
#include "gtest/gtest.h"

using namespace backupforge;
using backupforge::test::randomBytes;
using backupforge::test::toBytes;

class CompressorCodecTest
    : public ::testing::TestWithParam<CompressionAlgorithm> {};

TEST_P(CompressorCodecTest, RestoresOriginalBytes) {
  Compressor compressor(GetParam());
  std::string text;
  for (int i = 0; i < 2000; ++i)
    text += "line " + std::to_string(i % 50) + " of a fairly repetitive log\n";
  for (const auto &input :
       {toBytes(""), toBytes("x"), toBytes(text), randomBytes(300 * 1024, 5)}) {
    const auto packed = compressor.compress(input);
    EXPECT_EQ(compressor.decompress(packed), input);
  }
}

TEST_P(CompressorCodecTest, RejectsTruncatedFrame) {
  if (GetParam() == CompressionAlgorithm::None)
    GTEST_SKIP() << "identity codec has no framing";
  Compressor compressor(GetParam());
  auto packed = compressor.compress(randomBytes(64 * 1024, 11));
  packed.resize(packed.size() / 2);
  EXPECT_THROW(compressor.decompress(packed), CorruptionError);
}

TEST_P(CompressorCodecTest, RejectsGarbage) {
  if (GetParam() == CompressionAlgorithm::None)
    GTEST_SKIP() << "identity codec accepts any bytes";
  Compressor compressor(GetParam());
  EXPECT_THROW(compressor.decompress(toBytes("definitely not a frame")),
               CorruptionError);
}

INSTANTIATE_TEST_SUITE_P(AllCodecs, CompressorCodecTest,
                         ::testing::Values(CompressionAlgorithm::None,
                                           CompressionAlgorithm::Zstd,
                                           CompressionAlgorithm::Lz4));

TEST(CompressorTest, RepetitiveDataShrinks) {
  const auto input = toBytes(std::string(256 * 1024, 'a'));
  for (auto algo : {CompressionAlgorithm::Zstd, CompressionAlgorithm::Lz4}) {
    Compressor compressor(algo);
    const auto packed = compressor.compress(input);
    EXPECT_LT(Compressor::ratio(input.size(), packed.size()), 0.1);
  }
}

TEST(CompressorTest, ZstdLevelRange) {
  EXPECT_THROW(Compressor(CompressionAlgorithm::Zstd, 0), ConfigurationError);
  EXPECT_THROW(Compressor(CompressionAlgorithm::Zstd, 23), ConfigurationError);
  EXPECT_NO_THROW(Compressor(CompressionAlgorithm::Zstd, 1));
  EXPECT_NO_THROW(Compressor(CompressionAlgorithm::Zstd, 22));
  // Other codecs ignore the level.
  EXPECT_NO_THROW(Compressor(CompressionAlgorithm::Lz4, 0));
}

TEST(CompressorTest, ValidateLevelWithoutConstructing) {
  EXPECT_THROW(Compressor::validateLevel(CompressionAlgorithm::Zstd, -1),
               ConfigurationError);
  EXPECT_NO_THROW(Compressor::validateLevel(CompressionAlgorithm::Zstd, 19));
  EXPECT_NO_THROW(Compressor::validateLevel(CompressionAlgorithm::None, 99));
}

TEST(CompressorTest, NamesAndRatio) {
  EXPECT_EQ(compressionAlgorithmFromString("zstd"), CompressionAlgorithm::Zstd);
  EXPECT_EQ(compressionAlgorithmFromString("lz4"), CompressionAlgorithm::Lz4);
  EXPECT_EQ(compressionAlgorithmFromString("none"), CompressionAlgorithm::None);
  EXPECT_EQ(compressionAlgorithmToString(CompressionAlgorithm::Lz4), "lz4");
  EXPECT_THROW(compressionAlgorithmFromString("brotli"), ConfigurationError);

  EXPECT_DOUBLE_EQ(Compressor::ratio(0, 0), 1.0);
  EXPECT_DOUBLE_EQ(Compressor::ratio(200, 50), 0.25);
}
