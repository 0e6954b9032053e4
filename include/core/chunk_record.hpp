#pragma once
#ifndef BACKUPFORGE_CHUNK_RECORD_HPP
#define BACKUPFORGE_CHUNK_RECORD_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "core/cipher.hpp"
#include "core/compressor.hpp"

namespace backupforge {

/// Record layout version written into the top two flag bits.
inline constexpr uint8_t RECORD_VERSION = 1;

/**
 * @brief Decoded form of the one-byte record flag.
 *
 * Bit layout: [version:2][cipher:2][codec:4], most significant first.
 */
struct RecordFlag {
  uint8_t version = RECORD_VERSION;
  CipherAlgorithm cipher = CipherAlgorithm::None;
  CompressionAlgorithm codec = CompressionAlgorithm::None;

  uint8_t encode() const;
  /** @throw CorruptionError On an unknown version, cipher or codec. */
  static RecordFlag decode(uint8_t byte);
};

/**
 * @brief Turns chunk plaintext into a stored record and back.
 *
 * seal() compresses then encrypts (when a key is configured):
 *   flag(1) || nonce(12) || ciphertext || tag(16)   encrypted
 *   flag(1) || compressed bytes                     plain
 * open() reads the codec and cipher from the record's own flag, so records
 * written under an older configuration remain readable.
 */
class ChunkRecordCodec {
public:
  /**
   * @param key Session key; must outlive the codec. nullptr disables
   *        encryption and @p cipher is then ignored.
   */
  ChunkRecordCodec(Compressor compressor, CipherAlgorithm cipher,
                   const SessionKey *key);

  std::vector<std::byte> seal(std::span<const std::byte> plaintext) const;

  /**
   * @throw CorruptionError If the record is malformed or fails to
   *        decompress; AuthenticationError if the tag does not verify.
   * @throw ConfigurationError If the record is encrypted and no key is set.
   */
  std::vector<std::byte> open(std::span<const std::byte> record) const;

  bool encrypted() const { return cipher_.has_value(); }
  const Compressor &compressor() const { return compressor_; }

private:
  Compressor compressor_;
  std::optional<Cipher> cipher_;
  const SessionKey *key_;
};

} // namespace backupforge

#endif // BACKUPFORGE_CHUNK_RECORD_HPP
