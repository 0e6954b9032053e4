#ifndef BACKUPFORGE_DIGEST_HPP
#define BACKUPFORGE_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

#include "blake3.h"
#include <sodium.h>

namespace backupforge::utils {

/// Supported hashing algorithms.
enum class HashAlgorithm { SHA256, BLAKE3 };

/// Digest size for supported algorithms (32 bytes).
inline constexpr size_t DIGEST_SIZE = 32;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;

/**
 * @brief Hash a byte range in one shot.
 * @param data Bytes to hash.
 * @param algo Hash function to use.
 * @return 32 byte digest.
 */
DigestArray hash_bytes(std::span<const std::byte> data,
                       HashAlgorithm algo = HashAlgorithm::BLAKE3);

/**
 * @brief Incremental hasher over either supported algorithm.
 */
class StreamingHasher {
public:
  explicit StreamingHasher(HashAlgorithm algo = HashAlgorithm::BLAKE3);

  void update(std::span<const std::byte> data);

  /**
   * @brief Finish the digest.
   * @throw std::logic_error If called twice.
   */
  DigestArray finalize();

  HashAlgorithm algorithm() const { return algo_; }

private:
  HashAlgorithm algo_;
  bool finalized_ = false;
  crypto_hash_sha256_state sha_state_;
  blake3_hasher blake3_state_;
};

} // namespace backupforge::utils

#endif // BACKUPFORGE_DIGEST_HPP
