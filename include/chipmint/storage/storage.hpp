#pragma once
#include <chipmint/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace chipmint::storage {

using key_value_entry_t =
    std::pair<chipmint::schema::bytes_t, chipmint::schema::bytes_t>;

/// One staged mutation. An empty value erases the key.
struct write_entry_t final {
  chipmint::schema::bytes_t key;
  std::optional<chipmint::schema::bytes_t> value;
};

/// Mutations applied together or not at all.
using write_batch_t = std::vector<write_entry_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const chipmint::schema::bytes_view_t& key) const;

  /// Return the raw stored bytes at key, or std::nullopt when missing.
  std::optional<chipmint::schema::bytes_t> get_raw(
      const chipmint::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const chipmint::schema::bytes_view_t& key,
           const T& value) const;

  /// True when key is present.
  bool contains(const chipmint::schema::bytes_view_t& key) const;

  /// Remove key; a missing key is not an error.
  void erase(const chipmint::schema::bytes_view_t& key) const;

  /// Atomically apply every staged put and erase in order.
  void write(const write_batch_t& batch) const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const chipmint::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace chipmint::storage
