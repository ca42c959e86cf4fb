#include <blake3.h>
#include <bounty/blake3/hash.hpp>

namespace bounty::blake3 {

bounty::schema::hash32_t hash(const std::string_view& str) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, str.data(), str.size());
  // BLAKE3_OUT_LEN
  auto output = bounty::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

bounty::schema::hash32_t hash(const bounty::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  // BLAKE3_OUT_LEN
  auto output = bounty::schema::hash32_t{};
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace bounty::blake3
