#ifndef BACKUPFORGE_KEY_MANAGER_HPP
#define BACKUPFORGE_KEY_MANAGER_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <sodium.h>
#include <string>

namespace backupforge {

inline constexpr size_t SESSION_KEY_BYTES = 32;

using KeySalt = std::array<unsigned char, crypto_pwhash_SALTBYTES>;

/**
 * @brief Cost parameters for Argon2id key derivation.
 */
struct KdfParams {
  unsigned long long opsLimit = crypto_pwhash_OPSLIMIT_INTERACTIVE;
  size_t memLimit = crypto_pwhash_MEMLIMIT_INTERACTIVE;

  /** @throw ConfigurationError If either limit is outside libsodium's range. */
  void validate() const;
};

/**
 * @brief 256-bit chunk encryption key held in guarded memory.
 *
 * The key lives in a sodium_malloc() allocation (guard pages, mlock) and is
 * wiped when the object is destroyed. Move-only.
 */
class SessionKey {
public:
  /**
   * @brief Derive a key from a passphrase with Argon2id.
   * @throw ConfigurationError If the passphrase is empty.
   * @throw std::runtime_error If derivation runs out of memory.
   */
  static SessionKey deriveFromPassphrase(const std::string &passphrase,
                                         const KeySalt &salt,
                                         const KdfParams &params = {});

  /** Fresh random key. */
  static SessionKey generate();

  /**
   * @brief Import a key from 64 hex characters.
   * @throw ConfigurationError If @p hex is not a 32 byte hex string.
   */
  static SessionKey fromHex(const std::string &hex);

  /**
   * @brief Resolve key material from the environment.
   *
   * BACKUPFORGE_MASTER_KEY (hex) wins over BACKUPFORGE_PASSPHRASE. Returns
   * nullopt when neither is set.
   */
  static std::optional<SessionKey> fromEnvironment(const KeySalt &salt,
                                                   const KdfParams &params);

  SessionKey(SessionKey &&other) noexcept;
  SessionKey &operator=(SessionKey &&other) noexcept;
  SessionKey(const SessionKey &) = delete;
  SessionKey &operator=(const SessionKey &) = delete;
  ~SessionKey();

  const unsigned char *data() const { return key_; }
  static constexpr size_t size() { return SESSION_KEY_BYTES; }

  /** Constant-time comparison. */
  bool equals(const SessionKey &other) const;

private:
  SessionKey();
  void release();

  unsigned char *key_;
};

/** Random salt for a new repository. */
KeySalt generateSalt();
std::string saltToHex(const KeySalt &salt);
/** @throw ConfigurationError If @p hex does not decode to a salt. */
KeySalt saltFromHex(const std::string &hex);

} // namespace backupforge

#endif // BACKUPFORGE_KEY_MANAGER_HPP
