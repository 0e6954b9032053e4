#include "utilities/cid_utils.hpp"
#include "cppcodec/base32_rfc4648.hpp"
#include <algorithm>
#include <stdexcept>

namespace backupforge::utils {

std::array<uint8_t, CID_PREFIX_SIZE> cid_prefix(HashAlgorithm algo) {
  const uint8_t code =
      algo == HashAlgorithm::SHA256 ? MULTIHASH_SHA2_256 : MULTIHASH_BLAKE3;
  return {CID_VERSION, MULTICODEC_RAW, code, static_cast<uint8_t>(DIGEST_SIZE)};
}

std::string digest_to_cid(const DigestArray &digest, HashAlgorithm algo) {
  const auto prefix = cid_prefix(algo);
  std::vector<uint8_t> raw(prefix.begin(), prefix.end());
  raw.insert(raw.end(), digest.begin(), digest.end());
  return cppcodec::base32_rfc4648::encode(raw);
}

DigestArray cid_to_digest(const std::string &cid, HashAlgorithm *algo_out) {
  if (cid.empty()) {
    throw std::runtime_error("empty chunk id");
  }
  std::vector<uint8_t> raw;
  try {
    raw = cppcodec::base32_rfc4648::decode(cid.data(), cid.size());
  } catch (const cppcodec::parse_error &e) {
    throw std::runtime_error("chunk id is not Base32: " + std::string(e.what()));
  }
  if (raw.size() != CID_PREFIX_SIZE + DIGEST_SIZE) {
    throw std::runtime_error("chunk id decodes to " +
                             std::to_string(raw.size()) + " bytes, expected " +
                             std::to_string(CID_PREFIX_SIZE + DIGEST_SIZE));
  }
  if (raw[0] != CID_VERSION || raw[1] != MULTICODEC_RAW ||
      raw[3] != DIGEST_SIZE) {
    throw std::runtime_error("chunk id is not a raw CIDv1");
  }

  HashAlgorithm algo;
  switch (raw[2]) {
  case MULTIHASH_SHA2_256:
    algo = HashAlgorithm::SHA256;
    break;
  case MULTIHASH_BLAKE3:
    algo = HashAlgorithm::BLAKE3;
    break;
  default:
    throw std::runtime_error("chunk id uses an unsupported multihash");
  }

  DigestArray digest;
  std::copy(raw.begin() + CID_PREFIX_SIZE, raw.end(), digest.begin());
  if (algo_out) {
    *algo_out = algo;
  }
  return digest;
}

std::vector<uint8_t> cid_to_bytes(const std::string &cid) {
  HashAlgorithm algo;
  const DigestArray digest = cid_to_digest(cid, &algo);
  const auto prefix = cid_prefix(algo);
  std::vector<uint8_t> bytes(prefix.begin(), prefix.end());
  bytes.insert(bytes.end(), digest.begin(), digest.end());
  return bytes;
}

} // namespace backupforge::utils
