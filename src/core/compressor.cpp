#include "core/compressor.hpp"
#include "core/chunker.hpp"
#include "core/errors.hpp"

#include <array>
#include <cstring>
#include <lz4frame.h>
#include <memory>
#include <stdexcept>
#include <zstd.h>

namespace backupforge {

namespace {

struct ZstdCCtxDeleter {
  void operator()(ZSTD_CCtx *ctx) const { ZSTD_freeCCtx(ctx); }
};

struct Lz4DCtxDeleter {
  void operator()(LZ4F_dctx *ctx) const { LZ4F_freeDecompressionContext(ctx); }
};

} // namespace

std::string compressionAlgorithmToString(CompressionAlgorithm algo) {
  switch (algo) {
  case CompressionAlgorithm::None:
    return "none";
  case CompressionAlgorithm::Zstd:
    return "zstd";
  case CompressionAlgorithm::Lz4:
    return "lz4";
  }
  return "unknown";
}

CompressionAlgorithm compressionAlgorithmFromString(const std::string &name) {
  if (name == "none")
    return CompressionAlgorithm::None;
  if (name == "zstd")
    return CompressionAlgorithm::Zstd;
  if (name == "lz4")
    return CompressionAlgorithm::Lz4;
  throw ConfigurationError("Unknown compression algorithm: " + name);
}

Compressor::Compressor(CompressionAlgorithm algo, int level)
    : algo_(algo), level_(level) {
  validateLevel(algo_, level_);
}

void Compressor::validateLevel(CompressionAlgorithm algo, int level) {
  if (algo == CompressionAlgorithm::Zstd &&
      (level < 1 || level > ZSTD_maxCLevel())) {
    throw ConfigurationError("compression.level " + std::to_string(level) +
                             " outside zstd range 1-" +
                             std::to_string(ZSTD_maxCLevel()));
  }
}

double Compressor::ratio(uint64_t originalSize, uint64_t compressedSize) {
  if (originalSize == 0) {
    return 1.0;
  }
  return static_cast<double>(compressedSize) /
         static_cast<double>(originalSize);
}

std::vector<std::byte>
Compressor::compress(std::span<const std::byte> plaintext) const {
  switch (algo_) {
  case CompressionAlgorithm::None:
    return {plaintext.begin(), plaintext.end()};
  case CompressionAlgorithm::Zstd:
    return compressZstd(plaintext);
  case CompressionAlgorithm::Lz4:
    return compressLz4(plaintext);
  }
  throw std::logic_error("Unhandled compression algorithm");
}

std::vector<std::byte>
Compressor::decompress(std::span<const std::byte> compressed) const {
  switch (algo_) {
  case CompressionAlgorithm::None:
    if (compressed.size() > MAX_CHUNK_LIMIT) {
      throw CorruptionError("Uncompressed payload exceeds chunk size limit");
    }
    return {compressed.begin(), compressed.end()};
  case CompressionAlgorithm::Zstd:
    return decompressZstd(compressed);
  case CompressionAlgorithm::Lz4:
    return decompressLz4(compressed);
  }
  throw std::logic_error("Unhandled compression algorithm");
}

std::vector<std::byte>
Compressor::compressZstd(std::span<const std::byte> in) const {
  std::unique_ptr<ZSTD_CCtx, ZstdCCtxDeleter> cctx(ZSTD_createCCtx());
  if (!cctx) {
    throw std::runtime_error("ZSTD_createCCtx failed");
  }
  ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_compressionLevel, level_);
  // Frame checksum lets decompress() reject damaged payloads.
  ZSTD_CCtx_setParameter(cctx.get(), ZSTD_c_checksumFlag, 1);

  const size_t bound = ZSTD_compressBound(in.size());
  std::vector<std::byte> out(bound);
  const size_t cSize =
      ZSTD_compress2(cctx.get(), out.data(), bound, in.data(), in.size());
  if (ZSTD_isError(cSize)) {
    throw std::runtime_error(std::string("ZSTD_compress2 failed: ") +
                             ZSTD_getErrorName(cSize));
  }
  out.resize(cSize);
  return out;
}

std::vector<std::byte>
Compressor::decompressZstd(std::span<const std::byte> in) const {
  const unsigned long long rSize =
      ZSTD_getFrameContentSize(in.data(), in.size());
  if (rSize == ZSTD_CONTENTSIZE_ERROR || rSize == ZSTD_CONTENTSIZE_UNKNOWN) {
    throw CorruptionError("zstd frame header is invalid or missing size");
  }
  if (rSize > MAX_CHUNK_LIMIT) {
    throw CorruptionError("zstd frame declares " + std::to_string(rSize) +
                          " bytes, above chunk size limit");
  }
  const size_t frameSize = ZSTD_findFrameCompressedSize(in.data(), in.size());
  if (ZSTD_isError(frameSize)) {
    throw CorruptionError(std::string("zstd frame is truncated: ") +
                          ZSTD_getErrorName(frameSize));
  }
  if (frameSize != in.size()) {
    throw CorruptionError("zstd payload has trailing bytes after the frame");
  }

  std::vector<std::byte> out(static_cast<size_t>(rSize));
  const size_t dSize =
      ZSTD_decompress(out.data(), out.size(), in.data(), in.size());
  if (ZSTD_isError(dSize)) {
    throw CorruptionError(std::string("ZSTD_decompress failed: ") +
                          ZSTD_getErrorName(dSize));
  }
  if (dSize != out.size()) {
    throw CorruptionError(
        "ZSTD_decompress failed: output size does not match frame header.");
  }
  return out;
}

std::vector<std::byte>
Compressor::compressLz4(std::span<const std::byte> in) const {
  LZ4F_preferences_t prefs;
  std::memset(&prefs, 0, sizeof(prefs));
  prefs.frameInfo.contentChecksumFlag = LZ4F_contentChecksumEnabled;
  prefs.frameInfo.contentSize = in.size();
  prefs.compressionLevel = 0; // fast mode, fixed effort

  const size_t bound = LZ4F_compressFrameBound(in.size(), &prefs);
  std::vector<std::byte> out(bound);
  const size_t cSize =
      LZ4F_compressFrame(out.data(), bound, in.data(), in.size(), &prefs);
  if (LZ4F_isError(cSize)) {
    throw std::runtime_error(std::string("LZ4F_compressFrame failed: ") +
                             LZ4F_getErrorName(cSize));
  }
  out.resize(cSize);
  return out;
}

std::vector<std::byte>
Compressor::decompressLz4(std::span<const std::byte> in) const {
  LZ4F_dctx *raw = nullptr;
  const size_t created = LZ4F_createDecompressionContext(&raw, LZ4F_VERSION);
  if (LZ4F_isError(created)) {
    throw std::runtime_error(
        std::string("LZ4F_createDecompressionContext failed: ") +
        LZ4F_getErrorName(created));
  }
  std::unique_ptr<LZ4F_dctx, Lz4DCtxDeleter> dctx(raw);

  LZ4F_frameInfo_t info;
  std::memset(&info, 0, sizeof(info));
  size_t consumed = in.size();
  size_t ret = LZ4F_getFrameInfo(dctx.get(), &info, in.data(), &consumed);
  if (LZ4F_isError(ret)) {
    throw CorruptionError(std::string("lz4 frame header is invalid: ") +
                          LZ4F_getErrorName(ret));
  }
  if (info.contentSize > MAX_CHUNK_LIMIT) {
    throw CorruptionError("lz4 frame declares a size above chunk size limit");
  }

  std::vector<std::byte> out;
  out.reserve(static_cast<size_t>(info.contentSize));
  std::array<std::byte, 64 * 1024> buffer;
  size_t srcPos = consumed;
  while (ret != 0) {
    size_t dstSize = buffer.size();
    size_t srcSize = in.size() - srcPos;
    ret = LZ4F_decompress(dctx.get(), buffer.data(), &dstSize,
                          in.data() + srcPos, &srcSize, nullptr);
    if (LZ4F_isError(ret)) {
      throw CorruptionError(std::string("LZ4F_decompress failed: ") +
                            LZ4F_getErrorName(ret));
    }
    out.insert(out.end(), buffer.begin(), buffer.begin() + dstSize);
    srcPos += srcSize;
    if (out.size() > MAX_CHUNK_LIMIT) {
      throw CorruptionError("lz4 payload expands beyond chunk size limit");
    }
    if (ret != 0 && srcSize == 0 && dstSize == 0) {
      throw CorruptionError("lz4 frame is truncated");
    }
  }
  if (srcPos != in.size()) {
    throw CorruptionError("lz4 payload has trailing bytes after the frame");
  }
  if (info.contentSize != 0 && out.size() != info.contentSize) {
    throw CorruptionError("lz4 output size does not match frame header");
  }
  return out;
}

} // namespace backupforge
