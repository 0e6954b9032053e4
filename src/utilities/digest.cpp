#include "utilities/digest.hpp"

#include <stdexcept>

namespace backupforge::utils {

DigestArray hash_bytes(std::span<const std::byte> data, HashAlgorithm algo) {
  StreamingHasher hasher(algo);
  hasher.update(data);
  return hasher.finalize();
}

StreamingHasher::StreamingHasher(HashAlgorithm algo) : algo_(algo) {
  if (algo_ == HashAlgorithm::SHA256) {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
    crypto_hash_sha256_init(&sha_state_);
  } else {
    blake3_hasher_init(&blake3_state_);
  }
}

void StreamingHasher::update(std::span<const std::byte> data) {
  if (finalized_) {
    throw std::logic_error("Cannot update a finalized hasher.");
  }
  if (data.empty()) {
    return;
  }
  if (algo_ == HashAlgorithm::SHA256) {
    crypto_hash_sha256_update(
        &sha_state_, reinterpret_cast<const unsigned char *>(data.data()),
        data.size());
  } else {
    blake3_hasher_update(&blake3_state_,
                         reinterpret_cast<const uint8_t *>(data.data()),
                         data.size());
  }
}

DigestArray StreamingHasher::finalize() {
  if (finalized_) {
    throw std::logic_error("finalize() already called.");
  }
  DigestArray digest{};
  if (algo_ == HashAlgorithm::SHA256) {
    crypto_hash_sha256_final(&sha_state_, digest.data());
  } else {
    blake3_hasher_finalize(&blake3_state_, digest.data(), DIGEST_SIZE);
  }
  finalized_ = true;
  return digest;
}

} // namespace backupforge::utils
