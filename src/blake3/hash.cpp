#include <blake3.h>
#include <chipmint/blake3/hash.hpp>

namespace chipmint::blake3 {

chipmint::schema::hash32_t hash(const chipmint::schema::bytes_view_t& bytes) {
  auto hasher = blake3_hasher{};
  blake3_hasher_init(&hasher);
  blake3_hasher_update(&hasher, bytes.data(), bytes.size());
  auto output = chipmint::schema::hash32_t{};
  static_assert(BLAKE3_OUT_LEN == std::tuple_size_v<chipmint::schema::hash32_t>);
  blake3_hasher_finalize(&hasher, output.data(), output.size());
  return output;
}

}  // namespace chipmint::blake3
