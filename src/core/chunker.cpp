#include "core/chunker.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <bit>

namespace backupforge {

namespace {

// Fixed substitution table so that chunk boundaries, and therefore chunk ids,
// are identical across processes and builds.
constexpr std::array<uint32_t, 256> makeBuzhashTable() {
  std::array<uint32_t, 256> table{};
  uint64_t state = 0x42d3b1f7c0ffee11ULL;
  for (auto &entry : table) {
    // splitmix64
    state += 0x9e3779b97f4a7c15ULL;
    uint64_t z = state;
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    z = z ^ (z >> 31);
    entry = static_cast<uint32_t>(z >> 32);
  }
  return table;
}

constexpr std::array<uint32_t, 256> BUZHASH_TABLE = makeBuzhashTable();

} // namespace

std::string chunkingStrategyToString(ChunkingStrategy strategy) {
  return strategy == ChunkingStrategy::Fixed ? "fixed" : "content-defined";
}

ChunkingStrategy chunkingStrategyFromString(const std::string &name) {
  if (name == "fixed")
    return ChunkingStrategy::Fixed;
  if (name == "content-defined" || name == "cdc")
    return ChunkingStrategy::ContentDefined;
  throw ConfigurationError("Unknown chunking strategy: " + name);
}

void ChunkerConfig::validate() const {
  if (minSize == 0) {
    throw ConfigurationError("chunking.min_size must be greater than zero");
  }
  if (minSize > maxSize) {
    throw ConfigurationError("chunking.min_size (" + std::to_string(minSize) +
                             ") exceeds chunking.max_size (" +
                             std::to_string(maxSize) + ")");
  }
  if (avgSize < minSize || avgSize > maxSize) {
    throw ConfigurationError("chunking.avg_size (" + std::to_string(avgSize) +
                             ") must lie between min_size and max_size");
  }
  if (maxSize > MAX_CHUNK_LIMIT) {
    throw ConfigurationError("chunking.max_size exceeds the " +
                             std::to_string(MAX_CHUNK_LIMIT) + " byte limit");
  }
}

uint32_t RollingHash::roll(uint8_t in) {
  hash_ = std::rotl(hash_, 1);
  if (filled_ == WINDOW_SIZE) {
    const uint8_t out = window_[pos_];
    hash_ ^= std::rotl(BUZHASH_TABLE[out], static_cast<int>(WINDOW_SIZE % 32));
  } else {
    ++filled_;
  }
  hash_ ^= BUZHASH_TABLE[in];
  window_[pos_] = in;
  pos_ = (pos_ + 1) % WINDOW_SIZE;
  return hash_;
}

void RollingHash::reset() {
  window_.fill(0);
  pos_ = 0;
  filled_ = 0;
  hash_ = 0;
}

BoundaryDetector::BoundaryDetector(const ChunkerConfig &config)
    : fixed_(config.strategy == ChunkingStrategy::Fixed),
      minSize_(config.minSize), avgSize_(config.avgSize),
      maxSize_(config.maxSize) {
  // A position past min_size cuts with probability 1 / (avg - min), giving an
  // expected chunk length of avg_size.
  const uint64_t spread = avgSize_ > minSize_ ? avgSize_ - minSize_ : 0;
  threshold_ = spread == 0 ? (uint64_t{1} << 32) : (uint64_t{1} << 32) / spread;
}

void BoundaryDetector::reset() {
  bytesSinceCut_ = 0;
  hash_.reset();
}

ChunkStream::ChunkStream(std::istream &in, const ChunkerConfig &config,
                         size_t readBlockSize)
    : in_(in), detector_(config), block_(std::max<size_t>(readBlockSize, 1)) {}

bool ChunkStream::refill() {
  if (eof_)
    return false;
  in_.read(reinterpret_cast<char *>(block_.data()),
           static_cast<std::streamsize>(block_.size()));
  const std::streamsize got = in_.gcount();
  if (in_.bad()) {
    throw IoError("Read failed", ErrorContext{{}, {}, bytesRead_});
  }
  if (got <= 0) {
    eof_ = true;
    return false;
  }
  if (in_.eof())
    eof_ = true;
  blockPos_ = 0;
  blockLen_ = static_cast<size_t>(got);
  bytesRead_ += blockLen_;
  return true;
}

std::optional<RawChunk> ChunkStream::next() {
  RawChunk chunk;
  chunk.offset = chunkStart_;
  for (;;) {
    if (blockPos_ == blockLen_ && !refill()) {
      if (chunk.data.empty())
        return std::nullopt;
      chunkStart_ += chunk.data.size();
      return chunk;
    }
    size_t i = blockPos_;
    bool cut = false;
    while (i < blockLen_) {
      if (detector_.update(block_[i++])) {
        cut = true;
        break;
      }
    }
    chunk.data.insert(chunk.data.end(), block_.begin() + blockPos_,
                      block_.begin() + i);
    blockPos_ = i;
    if (cut) {
      chunkStart_ += chunk.data.size();
      return chunk;
    }
  }
}

Chunker::Chunker(ChunkerConfig config) : config_(config) { config_.validate(); }

std::vector<RawChunk> Chunker::split(std::span<const std::byte> data) const {
  std::vector<RawChunk> chunks;
  BoundaryDetector detector(config_);
  size_t start = 0;
  for (size_t i = 0; i < data.size(); ++i) {
    if (detector.update(data[i])) {
      chunks.push_back(
          RawChunk{start, std::vector<std::byte>(data.begin() + start,
                                                 data.begin() + i + 1)});
      start = i + 1;
    }
  }
  if (start < data.size()) {
    chunks.push_back(RawChunk{
        start, std::vector<std::byte>(data.begin() + start, data.end())});
  }
  return chunks;
}

} // namespace backupforge
