#include "core/cipher.hpp"
#include "core/errors.hpp"

#include <sodium.h>
#include <stdexcept>

namespace backupforge {

static_assert(crypto_aead_chacha20poly1305_ietf_NPUBBYTES == NONCE_BYTES);
static_assert(crypto_aead_chacha20poly1305_ietf_ABYTES == TAG_BYTES);
static_assert(crypto_aead_chacha20poly1305_ietf_KEYBYTES == SESSION_KEY_BYTES);
static_assert(crypto_aead_aes256gcm_NPUBBYTES == NONCE_BYTES);
static_assert(crypto_aead_aes256gcm_ABYTES == TAG_BYTES);
static_assert(crypto_aead_aes256gcm_KEYBYTES == SESSION_KEY_BYTES);

std::string cipherAlgorithmToString(CipherAlgorithm algo) {
  switch (algo) {
  case CipherAlgorithm::None:
    return "none";
  case CipherAlgorithm::ChaCha20Poly1305:
    return "ChaCha20-Poly1305";
  case CipherAlgorithm::Aes256Gcm:
    return "AES-256-GCM";
  }
  return "unknown";
}

CipherAlgorithm cipherAlgorithmFromString(const std::string &name) {
  if (name == "none")
    return CipherAlgorithm::None;
  if (name == "ChaCha20-Poly1305" || name == "chacha20-poly1305")
    return CipherAlgorithm::ChaCha20Poly1305;
  if (name == "AES-256-GCM" || name == "aes-256-gcm")
    return CipherAlgorithm::Aes256Gcm;
  throw ConfigurationError("Unknown cipher algorithm: " + name);
}

bool Cipher::isAvailable(CipherAlgorithm algo) {
  if (sodium_init() < 0) {
    return false;
  }
  switch (algo) {
  case CipherAlgorithm::ChaCha20Poly1305:
    return true;
  case CipherAlgorithm::Aes256Gcm:
    return crypto_aead_aes256gcm_is_available() != 0;
  case CipherAlgorithm::None:
    return false;
  }
  return false;
}

Cipher::Cipher(CipherAlgorithm algo) : algo_(algo) {
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
  if (algo_ == CipherAlgorithm::None) {
    throw ConfigurationError("Cipher requires an encryption algorithm");
  }
  if (!isAvailable(algo_)) {
    throw ConfigurationError(cipherAlgorithmToString(algo_) +
                             " is not supported on this CPU");
  }
}

SealedPayload Cipher::encrypt(std::span<const std::byte> plaintext,
                              const SessionKey &key) const {
  SealedPayload sealed;
  // Nonces are never derived from content or counters: a repeat under the
  // same key would void confidentiality for both chunks.
  randombytes_buf(sealed.nonce.data(), sealed.nonce.size());
  sealed.ciphertext.resize(plaintext.size() + TAG_BYTES);

  unsigned long long ciphertextLen = 0;
  int result;
  if (algo_ == CipherAlgorithm::Aes256Gcm) {
    result = crypto_aead_aes256gcm_encrypt(
        reinterpret_cast<unsigned char *>(sealed.ciphertext.data()),
        &ciphertextLen,
        reinterpret_cast<const unsigned char *>(plaintext.data()),
        plaintext.size(), nullptr, 0, nullptr, sealed.nonce.data(),
        key.data());
  } else {
    result = crypto_aead_chacha20poly1305_ietf_encrypt(
        reinterpret_cast<unsigned char *>(sealed.ciphertext.data()),
        &ciphertextLen,
        reinterpret_cast<const unsigned char *>(plaintext.data()),
        plaintext.size(), nullptr, 0, nullptr, sealed.nonce.data(),
        key.data());
  }
  if (result != 0) {
    throw std::runtime_error("Encryption failed.");
  }
  sealed.ciphertext.resize(static_cast<size_t>(ciphertextLen));
  return sealed;
}

std::vector<std::byte>
Cipher::decrypt(const Nonce &nonce, std::span<const std::byte> ciphertextWithTag,
                const SessionKey &key) const {
  if (ciphertextWithTag.size() < TAG_BYTES) {
    throw AuthenticationError("Invalid ciphertext: too short to contain MAC.");
  }
  std::vector<std::byte> decrypted(ciphertextWithTag.size() - TAG_BYTES);
  unsigned long long decryptedLen = 0;
  int result;
  if (algo_ == CipherAlgorithm::Aes256Gcm) {
    result = crypto_aead_aes256gcm_decrypt(
        reinterpret_cast<unsigned char *>(decrypted.data()), &decryptedLen,
        nullptr,
        reinterpret_cast<const unsigned char *>(ciphertextWithTag.data()),
        ciphertextWithTag.size(), nullptr, 0, nonce.data(), key.data());
  } else {
    result = crypto_aead_chacha20poly1305_ietf_decrypt(
        reinterpret_cast<unsigned char *>(decrypted.data()), &decryptedLen,
        nullptr,
        reinterpret_cast<const unsigned char *>(ciphertextWithTag.data()),
        ciphertextWithTag.size(), nullptr, 0, nonce.data(), key.data());
  }
  if (result != 0) {
    throw AuthenticationError(
        "Decryption failed. Ciphertext might be invalid or tampered.");
  }
  decrypted.resize(static_cast<size_t>(decryptedLen));
  return decrypted;
}

} // namespace backupforge
