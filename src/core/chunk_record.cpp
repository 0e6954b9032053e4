#include "core/chunk_record.hpp"
#include "core/errors.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace backupforge {

uint8_t RecordFlag::encode() const {
  return static_cast<uint8_t>(((version & 0x03) << 6) |
                              ((static_cast<uint8_t>(cipher) & 0x03) << 4) |
                              (static_cast<uint8_t>(codec) & 0x0f));
}

RecordFlag RecordFlag::decode(uint8_t byte) {
  RecordFlag flag;
  flag.version = static_cast<uint8_t>(byte >> 6);
  if (flag.version != RECORD_VERSION) {
    throw CorruptionError("Unsupported chunk record version " +
                          std::to_string(flag.version));
  }
  const uint8_t cipherBits = (byte >> 4) & 0x03;
  if (cipherBits > static_cast<uint8_t>(CipherAlgorithm::Aes256Gcm)) {
    throw CorruptionError("Unknown cipher in chunk record flag");
  }
  const uint8_t codecBits = byte & 0x0f;
  if (codecBits > static_cast<uint8_t>(CompressionAlgorithm::Lz4)) {
    throw CorruptionError("Unknown codec in chunk record flag");
  }
  flag.cipher = static_cast<CipherAlgorithm>(cipherBits);
  flag.codec = static_cast<CompressionAlgorithm>(codecBits);
  return flag;
}

ChunkRecordCodec::ChunkRecordCodec(Compressor compressor,
                                   CipherAlgorithm cipher,
                                   const SessionKey *key)
    : compressor_(std::move(compressor)), key_(key) {
  if (key_) {
    cipher_.emplace(cipher);
  }
}

std::vector<std::byte>
ChunkRecordCodec::seal(std::span<const std::byte> plaintext) const {
  RecordFlag flag;
  flag.codec = compressor_.algorithm();
  std::vector<std::byte> data = compressor_.compress(plaintext);

  std::vector<std::byte> record;
  if (cipher_) {
    flag.cipher = cipher_->algorithm();
    SealedPayload sealed = cipher_->encrypt(data, *key_);
    record.reserve(1 + NONCE_BYTES + sealed.ciphertext.size());
    record.push_back(static_cast<std::byte>(flag.encode()));
    for (unsigned char c : sealed.nonce) {
      record.push_back(static_cast<std::byte>(c));
    }
    record.insert(record.end(), sealed.ciphertext.begin(),
                  sealed.ciphertext.end());
  } else {
    record.reserve(1 + data.size());
    record.push_back(static_cast<std::byte>(flag.encode()));
    record.insert(record.end(), data.begin(), data.end());
  }
  return record;
}

std::vector<std::byte>
ChunkRecordCodec::open(std::span<const std::byte> record) const {
  if (record.empty()) {
    throw CorruptionError("Empty chunk record");
  }
  const RecordFlag flag =
      RecordFlag::decode(static_cast<uint8_t>(record.front()));
  std::span<const std::byte> body = record.subspan(1);

  std::vector<std::byte> compressed;
  if (flag.cipher != CipherAlgorithm::None) {
    if (!key_) {
      throw ConfigurationError(
          "Chunk record is encrypted but no session key is configured");
    }
    if (body.size() < NONCE_BYTES + TAG_BYTES) {
      throw CorruptionError("Encrypted chunk record is truncated");
    }
    Nonce nonce;
    std::transform(body.begin(), body.begin() + NONCE_BYTES, nonce.begin(),
                   [](std::byte b) { return static_cast<unsigned char>(b); });
    Cipher cipher(flag.cipher);
    compressed = cipher.decrypt(nonce, body.subspan(NONCE_BYTES), *key_);
    body = compressed;
  }

  if (flag.codec == compressor_.algorithm()) {
    return compressor_.decompress(body);
  }
  return Compressor(flag.codec).decompress(body);
}

} // namespace backupforge
