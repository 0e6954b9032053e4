#pragma once
#ifndef BACKUPFORGE_CID_UTILS_HPP
#define BACKUPFORGE_CID_UTILS_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "utilities/digest.hpp"

namespace backupforge::utils {

/// CIDv1 header: version, "raw" multicodec, multihash code, digest length.
inline constexpr size_t CID_PREFIX_SIZE = 4;
inline constexpr uint8_t CID_VERSION = 0x01;
inline constexpr uint8_t MULTICODEC_RAW = 0x55;
inline constexpr uint8_t MULTIHASH_SHA2_256 = 0x12;
inline constexpr uint8_t MULTIHASH_BLAKE3 = 0x1e;

std::array<uint8_t, CID_PREFIX_SIZE> cid_prefix(HashAlgorithm algo);

/**
 * @brief Encode @p digest as a CIDv1 string (RFC 4648 Base32, upper case,
 *        padded).
 */
std::string digest_to_cid(const DigestArray &digest,
                          HashAlgorithm algo = HashAlgorithm::BLAKE3);

/**
 * @brief Inverse of digest_to_cid().
 * @param algo_out Receives the algorithm named by the multihash code.
 * @throws std::runtime_error If @p cid is not Base32, not a raw CIDv1, or
 *         carries a digest of the wrong length.
 */
DigestArray cid_to_digest(const std::string &cid,
                          HashAlgorithm *algo_out = nullptr);

/** Binary CID: prefix followed by the digest. @throws std::runtime_error */
std::vector<uint8_t> cid_to_bytes(const std::string &cid);

} // namespace backupforge::utils

#endif // BACKUPFORGE_CID_UTILS_HPP
