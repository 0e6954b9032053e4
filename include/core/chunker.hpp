#pragma once
#ifndef BACKUPFORGE_CHUNKER_HPP
#define BACKUPFORGE_CHUNKER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace backupforge {

enum class ChunkingStrategy { Fixed, ContentDefined };

std::string chunkingStrategyToString(ChunkingStrategy strategy);
/** @throw ConfigurationError on an unknown name. */
ChunkingStrategy chunkingStrategyFromString(const std::string &name);

/** Largest chunk the pipeline accepts; also caps decompression output. */
inline constexpr size_t MAX_CHUNK_LIMIT = 128 * 1024 * 1024;

/**
 * @brief Chunk size bounds and strategy.
 */
struct ChunkerConfig {
  ChunkingStrategy strategy = ChunkingStrategy::ContentDefined;
  size_t minSize = 256 * 1024;
  size_t avgSize = 1024 * 1024;
  size_t maxSize = 4 * 1024 * 1024;

  /**
   * @brief Check the bounds.
   * @throw ConfigurationError unless 0 < min <= avg <= max <= MAX_CHUNK_LIMIT.
   */
  void validate() const;
};

/**
 * @brief Buzhash (cyclic polynomial) over a sliding window.
 *
 * The value depends only on the last WINDOW_SIZE bytes fed in, which is what
 * makes cut points content-defined.
 */
class RollingHash {
public:
  static constexpr size_t WINDOW_SIZE = 48;

  /** Push one byte, evicting the oldest once the window is full. */
  uint32_t roll(uint8_t in);
  uint32_t value() const { return hash_; }
  void reset();

private:
  std::array<uint8_t, WINDOW_SIZE> window_{};
  size_t pos_ = 0;
  size_t filled_ = 0;
  uint32_t hash_ = 0;
};

/**
 * @brief Streaming boundary rule: window hash, threshold and bytes-since-cut.
 *
 * For content-defined chunking a cut is allowed once minSize bytes have been
 * seen since the previous cut, occurs at the first position whose hash is
 * below the threshold, and is forced at maxSize. The threshold is chosen so
 * the expected chunk length is avgSize.
 */
class BoundaryDetector {
public:
  explicit BoundaryDetector(const ChunkerConfig &config);

  /** Feed one byte. Returns true if the current chunk ends with it. */
  bool update(std::byte b) {
    ++bytesSinceCut_;
    if (fixed_) {
      if (bytesSinceCut_ >= avgSize_) {
        bytesSinceCut_ = 0;
        return true;
      }
      return false;
    }
    const uint32_t h = hash_.roll(static_cast<uint8_t>(b));
    if (bytesSinceCut_ < minSize_)
      return false;
    if (bytesSinceCut_ >= maxSize_ || static_cast<uint64_t>(h) < threshold_) {
      bytesSinceCut_ = 0;
      return true;
    }
    return false;
  }

  size_t bytesSinceCut() const { return bytesSinceCut_; }
  uint64_t threshold() const { return threshold_; }
  void reset();

private:
  bool fixed_;
  size_t minSize_;
  size_t avgSize_;
  size_t maxSize_;
  uint64_t threshold_;
  size_t bytesSinceCut_ = 0;
  RollingHash hash_;
};

/** A chunk's bytes and where it starts in its stream. */
struct RawChunk {
  uint64_t offset = 0;
  std::vector<std::byte> data;
};

/**
 * @brief Lazy chunk sequence over one input stream.
 *
 * Reads the stream in fixed-size blocks and hands out one chunk per next()
 * call, so at most one chunk plus one read block is buffered.
 */
class ChunkStream {
public:
  ChunkStream(std::istream &in, const ChunkerConfig &config,
              size_t readBlockSize = 64 * 1024);

  /**
   * @brief Produce the next chunk, or nullopt at end of stream.
   * @throw IoError If the stream reports a read error.
   */
  std::optional<RawChunk> next();

  /** Bytes consumed from the stream so far. */
  uint64_t bytesRead() const { return bytesRead_; }

private:
  bool refill();

  std::istream &in_;
  BoundaryDetector detector_;
  std::vector<std::byte> block_;
  size_t blockPos_ = 0;
  size_t blockLen_ = 0;
  uint64_t bytesRead_ = 0;
  uint64_t chunkStart_ = 0;
  bool eof_ = false;
};

/**
 * @brief Splits byte streams into chunks according to a ChunkerConfig.
 */
class Chunker {
public:
  /** @throw ConfigurationError If @p config is invalid. */
  explicit Chunker(ChunkerConfig config = {});

  ChunkStream stream(std::istream &in) const { return ChunkStream(in, config_); }

  /** Chunk an in-memory buffer. */
  std::vector<RawChunk> split(std::span<const std::byte> data) const;

  const ChunkerConfig &config() const { return config_; }

private:
  ChunkerConfig config_;
};

} // namespace backupforge

#endif // BACKUPFORGE_CHUNKER_HPP
