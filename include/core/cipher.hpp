#pragma once
#ifndef BACKUPFORGE_CIPHER_HPP
#define BACKUPFORGE_CIPHER_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "utilities/key_manager.hpp"

namespace backupforge {

/**
 * @brief Closed set of AEAD constructions for chunk payloads.
 *
 * Both real variants use a 96-bit nonce and a 128-bit tag so the stored
 * record layout is the same for either. Values are persisted in the record
 * flag.
 */
enum class CipherAlgorithm : uint8_t {
  None = 0,
  ChaCha20Poly1305 = 1, ///< IETF variant
  Aes256Gcm = 2
};

inline constexpr size_t NONCE_BYTES = 12;
inline constexpr size_t TAG_BYTES = 16;

using Nonce = std::array<unsigned char, NONCE_BYTES>;

std::string cipherAlgorithmToString(CipherAlgorithm algo);
/** @throw ConfigurationError on an unknown name. */
CipherAlgorithm cipherAlgorithmFromString(const std::string &name);

/** Output of Cipher::encrypt(). The tag is appended to the ciphertext. */
struct SealedPayload {
  Nonce nonce{};
  std::vector<std::byte> ciphertext;
};

/**
 * @brief Authenticated encryption of chunk payloads with libsodium.
 */
class Cipher {
public:
  /**
   * @throw ConfigurationError If @p algo is None, or AES-256-GCM is requested
   *        on a CPU without hardware AES support.
   */
  explicit Cipher(CipherAlgorithm algo = CipherAlgorithm::ChaCha20Poly1305);

  /** Whether libsodium can run @p algo on this machine. */
  static bool isAvailable(CipherAlgorithm algo);

  /**
   * @brief Encrypt under a fresh random nonce.
   * @throw std::runtime_error If libsodium reports a failure.
   */
  SealedPayload encrypt(std::span<const std::byte> plaintext,
                        const SessionKey &key) const;

  /**
   * @brief Verify and decrypt.
   * @throw AuthenticationError If the tag does not verify or the input is
   *        too short to hold one.
   */
  std::vector<std::byte> decrypt(const Nonce &nonce,
                                 std::span<const std::byte> ciphertextWithTag,
                                 const SessionKey &key) const;

  CipherAlgorithm algorithm() const { return algo_; }

private:
  CipherAlgorithm algo_;
};

} // namespace backupforge

#endif // BACKUPFORGE_CIPHER_HPP
