#pragma once
#ifndef BACKUPFORGE_COMPRESSOR_HPP
#define BACKUPFORGE_COMPRESSOR_HPP

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace backupforge {

/**
 * @brief Closed set of chunk compression codecs.
 *
 * The numeric values are written into the stored chunk record flag and must
 * never be reassigned.
 */
enum class CompressionAlgorithm : uint8_t { None = 0, Zstd = 1, Lz4 = 2 };

std::string compressionAlgorithmToString(CompressionAlgorithm algo);
/** @throw ConfigurationError on an unknown name. */
CompressionAlgorithm compressionAlgorithmFromString(const std::string &name);

/**
 * @brief Reversible chunk transform using zstd or LZ4 frames.
 *
 * Both codecs produce self-describing frames that record the content size
 * and carry a checksum, so decompress() needs nothing besides the bytes.
 */
class Compressor {
public:
  static constexpr int DEFAULT_ZSTD_LEVEL = 3;

  /**
   * @param algo Codec to use for compress().
   * @param level zstd level (1-22). Ignored by the other codecs.
   * @throw ConfigurationError If @p level is outside the zstd range.
   */
  explicit Compressor(CompressionAlgorithm algo = CompressionAlgorithm::Zstd,
                      int level = DEFAULT_ZSTD_LEVEL);

  std::vector<std::byte> compress(std::span<const std::byte> plaintext) const;

  /**
   * @brief Inverse of compress() for this codec.
   * @throw CorruptionError If the input is truncated, corrupt, has trailing
   *        garbage or would expand beyond MAX_CHUNK_LIMIT.
   */
  std::vector<std::byte> decompress(std::span<const std::byte> compressed) const;

  CompressionAlgorithm algorithm() const { return algo_; }
  int level() const { return level_; }

  /** @throw ConfigurationError If @p level is outside the zstd range. */
  static void validateLevel(CompressionAlgorithm algo, int level);

  /** compressed / original, 1.0 for empty input. */
  static double ratio(uint64_t originalSize, uint64_t compressedSize);

private:
  std::vector<std::byte> compressZstd(std::span<const std::byte> in) const;
  std::vector<std::byte> decompressZstd(std::span<const std::byte> in) const;
  std::vector<std::byte> compressLz4(std::span<const std::byte> in) const;
  std::vector<std::byte> decompressLz4(std::span<const std::byte> in) const;

  CompressionAlgorithm algo_;
  int level_;
};

} // namespace backupforge

#endif // BACKUPFORGE_COMPRESSOR_HPP
