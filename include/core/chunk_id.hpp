#pragma once
#ifndef BACKUPFORGE_CHUNK_ID_HPP
#define BACKUPFORGE_CHUNK_ID_HPP

#include <cstddef>
#include <cstring>
#include <functional>
#include <span>
#include <string>

#include "utilities/digest.hpp"

namespace backupforge {

/**
 * @brief Fixed-width content identifier of a chunk.
 *
 * The digest is computed over the plaintext, uncompressed chunk bytes, so
 * identical content always yields the same id. The canonical string form is
 * a CIDv1 and doubles as the backend key.
 */
struct ChunkId {
  utils::DigestArray digest{};
  utils::HashAlgorithm algorithm = utils::HashAlgorithm::BLAKE3;

  /** Hash @p data and wrap the digest. */
  static ChunkId compute(std::span<const std::byte> data,
                         utils::HashAlgorithm algo = utils::HashAlgorithm::BLAKE3);

  /**
   * @brief Parse the canonical string form.
   * @throw std::runtime_error If @p cid is not a valid chunk CID.
   */
  static ChunkId fromString(const std::string &cid);

  std::string toString() const;

  bool operator==(const ChunkId &other) const {
    return algorithm == other.algorithm && digest == other.digest;
  }
  bool operator!=(const ChunkId &other) const { return !(*this == other); }
};

struct ChunkIdHash {
  size_t operator()(const ChunkId &id) const noexcept {
    // Digest bytes are uniformly distributed; the leading word is enough.
    size_t h;
    std::memcpy(&h, id.digest.data(), sizeof(h));
    return h ^ static_cast<size_t>(id.algorithm);
  }
};

} // namespace backupforge

#endif // BACKUPFORGE_CHUNK_ID_HPP
