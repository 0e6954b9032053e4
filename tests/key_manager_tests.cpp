#include "core/errors.hpp"
#include "utilities/key_manager.hpp"
#include "gtest/gtest.h"
#include <cstdlib>
#include <string>

using namespace backupforge;

namespace {

// Cheapest parameters libsodium accepts, so derivation stays fast.
KdfParams fastKdf() {
  KdfParams params;
  params.opsLimit = crypto_pwhash_OPSLIMIT_MIN;
  params.memLimit = crypto_pwhash_MEMLIMIT_MIN;
  return params;
}

} // namespace

TEST(SessionKeyTest, PassphraseDerivationIsDeterministic) {
  const KeySalt salt = generateSalt();
  SessionKey a = SessionKey::deriveFromPassphrase("correct horse", salt,
                                                  fastKdf());
  SessionKey b = SessionKey::deriveFromPassphrase("correct horse", salt,
                                                  fastKdf());
  SessionKey c = SessionKey::deriveFromPassphrase("battery staple", salt,
                                                  fastKdf());
  EXPECT_TRUE(a.equals(b));
  EXPECT_FALSE(a.equals(c));

  SessionKey d = SessionKey::deriveFromPassphrase("correct horse",
                                                  generateSalt(), fastKdf());
  EXPECT_FALSE(a.equals(d));
}

TEST(SessionKeyTest, RejectsEmptyPassphraseAndBadParams) {
  EXPECT_THROW(SessionKey::deriveFromPassphrase("", generateSalt(), fastKdf()),
               ConfigurationError);
  KdfParams bad = fastKdf();
  bad.memLimit = 1;
  EXPECT_THROW(bad.validate(), ConfigurationError);
}

TEST(SessionKeyTest, GeneratedKeysDiffer) {
  SessionKey a = SessionKey::generate();
  SessionKey b = SessionKey::generate();
  EXPECT_FALSE(a.equals(b));
  EXPECT_EQ(SessionKey::size(), 32u);
}

TEST(SessionKeyTest, HexImport) {
  const std::string hex(64, 'a');
  SessionKey key = SessionKey::fromHex(hex);
  EXPECT_EQ(key.data()[0], 0xaa);
  EXPECT_EQ(key.data()[31], 0xaa);
  EXPECT_THROW(SessionKey::fromHex("abcd"), ConfigurationError);
  EXPECT_THROW(SessionKey::fromHex(std::string(64, 'z')), ConfigurationError);
}

TEST(SessionKeyTest, MoveTransfersOwnership) {
  SessionKey a = SessionKey::fromHex(std::string(64, '1'));
  SessionKey b = std::move(a);
  EXPECT_EQ(b.data()[0], 0x11);
  SessionKey c = SessionKey::generate();
  c = std::move(b);
  EXPECT_EQ(c.data()[5], 0x11);
}

TEST(SessionKeyTest, EnvironmentResolution) {
  const KeySalt salt = generateSalt();
  ::unsetenv("BACKUPFORGE_MASTER_KEY");
  ::unsetenv("BACKUPFORGE_PASSPHRASE");
  EXPECT_FALSE(SessionKey::fromEnvironment(salt, fastKdf()).has_value());

  ::setenv("BACKUPFORGE_PASSPHRASE", "from env", 1);
  auto derived = SessionKey::fromEnvironment(salt, fastKdf());
  ASSERT_TRUE(derived.has_value());
  EXPECT_TRUE(derived->equals(
      SessionKey::deriveFromPassphrase("from env", salt, fastKdf())));

  ::setenv("BACKUPFORGE_MASTER_KEY", std::string(64, '2').c_str(), 1);
  auto raw = SessionKey::fromEnvironment(salt, fastKdf());
  ASSERT_TRUE(raw.has_value());
  EXPECT_EQ(raw->data()[0], 0x22);

  ::unsetenv("BACKUPFORGE_MASTER_KEY");
  ::unsetenv("BACKUPFORGE_PASSPHRASE");
}

TEST(SessionKeyTest, SaltHexRoundTrip) {
  const KeySalt salt = generateSalt();
  EXPECT_EQ(saltFromHex(saltToHex(salt)), salt);
  EXPECT_THROW(saltFromHex("00"), ConfigurationError);
}
