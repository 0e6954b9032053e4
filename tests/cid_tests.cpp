#include "core/chunk_id.hpp"
#include "utilities/cid_utils.hpp"
#include "utilities/digest.hpp"
#include "test_utils.hpp"
#include "gtest/gtest.h"

#include "cppcodec/base32_rfc4648.hpp"
#include <array>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <vector>

using namespace backupforge;

TEST(CIDConversionFuzzTest, RoundTripConsistency) {
  std::mt19937 gen(20240611);
  std::uniform_int_distribution<int> distrib(0, 255);

  for (int i = 0; i < 1000; ++i) {
    utils::DigestArray original;
    for (auto &b : original)
      b = static_cast<uint8_t>(distrib(gen));
    const auto algo =
        (i % 2) ? utils::HashAlgorithm::SHA256 : utils::HashAlgorithm::BLAKE3;

    std::string cid;
    ASSERT_NO_THROW(cid = utils::digest_to_cid(original, algo));
    utils::HashAlgorithm decodedAlgo;
    utils::DigestArray decoded;
    ASSERT_NO_THROW(decoded = utils::cid_to_digest(cid, &decodedAlgo));
    ASSERT_EQ(original, decoded);
    ASSERT_EQ(algo, decodedAlgo);
  }
}

TEST(CIDInvalidInputTest, HandlesInvalidCIDs) {
  EXPECT_THROW(utils::cid_to_digest(""), std::runtime_error);
  EXPECT_THROW(utils::cid_to_digest("AE"), std::runtime_error);

  utils::DigestArray zero{};
  const std::string valid = utils::digest_to_cid(zero);
  EXPECT_THROW(utils::cid_to_digest(valid.substr(0, valid.size() - 1) + "!"),
               std::runtime_error);

  // dag-pb instead of raw
  std::vector<uint8_t> wrongCodec = {0x01, 0x70, 0x1e, 0x20};
  wrongCodec.resize(wrongCodec.size() + 32, 0);
  EXPECT_THROW(
      utils::cid_to_digest(cppcodec::base32_rfc4648::encode(wrongCodec)),
      std::runtime_error);

  // sha2-512 multihash code
  std::vector<uint8_t> otherHash = {0x01, 0x55, 0x13, 0x20};
  otherHash.resize(otherHash.size() + 32, 0);
  EXPECT_THROW(
      utils::cid_to_digest(cppcodec::base32_rfc4648::encode(otherHash)),
      std::runtime_error);

  const auto prefix = utils::cid_prefix(utils::HashAlgorithm::BLAKE3);
  std::vector<uint8_t> shortDigest(prefix.begin(), prefix.end());
  shortDigest.resize(shortDigest.size() + 31, 0);
  EXPECT_THROW(
      utils::cid_to_digest(cppcodec::base32_rfc4648::encode(shortDigest)),
      std::runtime_error);
}

TEST(CIDToBytesTest, ProducesCorrectByteVector) {
  utils::DigestArray digest;
  for (size_t i = 0; i < digest.size(); ++i)
    digest[i] = static_cast<uint8_t>(i);
  const std::string cid = utils::digest_to_cid(digest);

  const std::vector<uint8_t> expectedPrefix = {0x01, 0x55, 0x1e, 0x20};
  std::vector<uint8_t> expected = expectedPrefix;
  expected.insert(expected.end(), digest.begin(), digest.end());
  EXPECT_EQ(utils::cid_to_bytes(cid), expected);
}

TEST(DigestTest, StreamingMatchesOneShot) {
  const auto data = backupforge::test::randomBytes(200 * 1024 + 3, 77);
  for (auto algo :
       {utils::HashAlgorithm::BLAKE3, utils::HashAlgorithm::SHA256}) {
    utils::StreamingHasher hasher(algo);
    std::span<const std::byte> view(data);
    hasher.update(view.first(1000));
    hasher.update(view.subspan(1000));
    EXPECT_EQ(hasher.finalize(), utils::hash_bytes(data, algo));
    EXPECT_THROW(hasher.finalize(), std::logic_error);
  }
}

TEST(DigestTest, Sha256KnownAnswer) {
  const auto digest = utils::hash_bytes(backupforge::test::toBytes("abc"),
                                        utils::HashAlgorithm::SHA256);
  EXPECT_EQ(utils::digest_to_hex(digest),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ChunkIdTest, StringFormRoundTrips) {
  const auto data = backupforge::test::toBytes("chunk payload");
  for (auto algo :
       {utils::HashAlgorithm::BLAKE3, utils::HashAlgorithm::SHA256}) {
    const ChunkId id = ChunkId::compute(data, algo);
    const ChunkId parsed = ChunkId::fromString(id.toString());
    EXPECT_EQ(parsed, id);
    EXPECT_EQ(parsed.algorithm, algo);
  }
  EXPECT_NE(ChunkId::compute(data, utils::HashAlgorithm::BLAKE3),
            ChunkId::compute(data, utils::HashAlgorithm::SHA256));
  EXPECT_THROW(ChunkId::fromString("not-a-cid"), std::runtime_error);
}

TEST(ChunkIdTest, IdentityFollowsContent) {
  const ChunkId a = ChunkId::compute(backupforge::test::toBytes("same"));
  const ChunkId b = ChunkId::compute(backupforge::test::toBytes("same"));
  const ChunkId c = ChunkId::compute(backupforge::test::toBytes("diff"));
  EXPECT_EQ(a, b);
  EXPECT_NE(a, c);
  EXPECT_EQ(ChunkIdHash{}(a), ChunkIdHash{}(b));
}
