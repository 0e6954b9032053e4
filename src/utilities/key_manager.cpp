#include "utilities/key_manager.hpp"
#include "core/errors.hpp"
#include "utilities/logger.h"

#include <cstdlib> // for getenv
#include <cstring>
#include <stdexcept>

namespace backupforge {

static void ensureSodium() {
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
}

void KdfParams::validate() const {
  if (opsLimit < crypto_pwhash_OPSLIMIT_MIN ||
      opsLimit > crypto_pwhash_OPSLIMIT_MAX) {
    throw ConfigurationError("encryption.kdf.ops_limit " +
                             std::to_string(opsLimit) + " is out of range");
  }
  if (memLimit < crypto_pwhash_MEMLIMIT_MIN ||
      memLimit > crypto_pwhash_MEMLIMIT_MAX) {
    throw ConfigurationError("encryption.kdf.mem_limit " +
                             std::to_string(memLimit) + " is out of range");
  }
}

SessionKey::SessionKey() : key_(nullptr) {
  ensureSodium();
  key_ = static_cast<unsigned char *>(sodium_malloc(SESSION_KEY_BYTES));
  if (!key_) {
    throw std::runtime_error(
        "Unable to allocate secure memory for encryption key");
  }
}

SessionKey::SessionKey(SessionKey &&other) noexcept : key_(other.key_) {
  other.key_ = nullptr;
}

SessionKey &SessionKey::operator=(SessionKey &&other) noexcept {
  if (this != &other) {
    release();
    key_ = other.key_;
    other.key_ = nullptr;
  }
  return *this;
}

SessionKey::~SessionKey() { release(); }

void SessionKey::release() {
  if (key_) {
    sodium_memzero(key_, SESSION_KEY_BYTES);
    sodium_free(key_);
    key_ = nullptr;
  }
}

bool SessionKey::equals(const SessionKey &other) const {
  if (!key_ || !other.key_) {
    return key_ == other.key_;
  }
  return sodium_memcmp(key_, other.key_, SESSION_KEY_BYTES) == 0;
}

SessionKey SessionKey::deriveFromPassphrase(const std::string &passphrase,
                                            const KeySalt &salt,
                                            const KdfParams &params) {
  if (passphrase.empty()) {
    throw ConfigurationError("Encryption passphrase must not be empty");
  }
  params.validate();
  SessionKey key;
  if (crypto_pwhash(key.key_, SESSION_KEY_BYTES, passphrase.data(),
                    passphrase.size(), salt.data(), params.opsLimit,
                    params.memLimit, crypto_pwhash_ALG_ARGON2ID13) != 0) {
    throw std::runtime_error(
        "Argon2id key derivation failed (out of memory?)");
  }
  return key;
}

SessionKey SessionKey::generate() {
  SessionKey key;
  randombytes_buf(key.key_, SESSION_KEY_BYTES);
  return key;
}

SessionKey SessionKey::fromHex(const std::string &hex) {
  if (hex.size() != SESSION_KEY_BYTES * 2) {
    throw ConfigurationError("Master key must be " +
                             std::to_string(SESSION_KEY_BYTES * 2) +
                             " hex characters");
  }
  SessionKey key;
  size_t binLen = 0;
  if (sodium_hex2bin(key.key_, SESSION_KEY_BYTES, hex.data(), hex.size(),
                     nullptr, &binLen, nullptr) != 0 ||
      binLen != SESSION_KEY_BYTES) {
    throw ConfigurationError("Master key is not valid hex");
  }
  return key;
}

std::optional<SessionKey> SessionKey::fromEnvironment(const KeySalt &salt,
                                                      const KdfParams &params) {
  if (const char *hex = std::getenv("BACKUPFORGE_MASTER_KEY")) {
    Logger::getInstance().log(LogLevel::DEBUG,
                              "Using raw master key from environment");
    return fromHex(hex);
  }
  if (const char *pass = std::getenv("BACKUPFORGE_PASSPHRASE")) {
    Logger::getInstance().log(LogLevel::DEBUG,
                              "Deriving session key from passphrase");
    return deriveFromPassphrase(pass, salt, params);
  }
  return std::nullopt;
}

KeySalt generateSalt() {
  ensureSodium();
  KeySalt salt;
  randombytes_buf(salt.data(), salt.size());
  return salt;
}

std::string saltToHex(const KeySalt &salt) {
  std::string hex(salt.size() * 2 + 1, '\0');
  sodium_bin2hex(hex.data(), hex.size(), salt.data(), salt.size());
  hex.pop_back();
  return hex;
}

KeySalt saltFromHex(const std::string &hex) {
  KeySalt salt;
  size_t binLen = 0;
  if (hex.size() != salt.size() * 2 ||
      sodium_hex2bin(salt.data(), salt.size(), hex.data(), hex.size(), nullptr,
                     &binLen, nullptr) != 0 ||
      binLen != salt.size()) {
    throw ConfigurationError("Repository salt is not " +
                             std::to_string(salt.size()) + " hex bytes");
  }
  return salt;
}

} // namespace backupforge
