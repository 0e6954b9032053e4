#include "core/chunk_id.hpp"
#include "utilities/cid_utils.hpp"

namespace backupforge {

ChunkId ChunkId::compute(std::span<const std::byte> data,
                         utils::HashAlgorithm algo) {
  ChunkId id;
  id.digest = utils::hash_bytes(data, algo);
  id.algorithm = algo;
  return id;
}

ChunkId ChunkId::fromString(const std::string &cid) {
  ChunkId id;
  id.digest = utils::cid_to_digest(cid, &id.algorithm);
  return id;
}

std::string ChunkId::toString() const {
  return utils::digest_to_cid(digest, algorithm);
}

} // namespace backupforge
