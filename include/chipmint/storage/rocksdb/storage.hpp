#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <chipmint/common/critical.hpp>
#include <chipmint/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace chipmint::storage {

namespace detail {

inline chipmint::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const chipmint::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const chipmint::schema::bytes_view_t& key) const;

  std::optional<chipmint::schema::bytes_t> get_raw(
      const chipmint::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const chipmint::schema::bytes_view_t& key,
           const T& value) const;

  bool contains(const chipmint::schema::bytes_view_t& key) const;
  void erase(const chipmint::schema::bytes_view_t& key) const;
  void write(const write_batch_t& batch) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const chipmint::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const chipmint::schema::bytes_view_t& key) const {
  auto value = get_raw(key);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      chipmint::schema::bytes_view_t{value->data(), value->size()})};
}

inline std::optional<chipmint::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const chipmint::schema::bytes_view_t& key) const {
  if (!database) {
    chipmint::common::critical("State store is not open");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      chipmint::common::critical("State store read failed: {}",
                                 status.ToString());
    }
  }
  return chipmint::schema::bytes_t(std::begin(value), std::end(value));
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const chipmint::schema::bytes_view_t& key,
    const T& value) const {
  if (!database) {
    chipmint::common::critical("State store is not open");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(chipmint::schema::bytes_view_t{encoded_value.data(),
                                                      encoded_value.size()}));
  if (!status.ok()) {
    chipmint::common::critical("State store write failed: {}",
                               status.ToString());
  }
}

inline bool storage<rocksdb_storage_tag>::contains(
    const chipmint::schema::bytes_view_t& key) const {
  return get_raw(key).has_value();
}

inline void storage<rocksdb_storage_tag>::erase(
    const chipmint::schema::bytes_view_t& key) const {
  if (!database) {
    chipmint::common::critical("State store is not open");
  }
  auto status =
      database->Delete(ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key));
  if (!status.ok()) {
    chipmint::common::critical("State store delete failed: {}",
                               status.ToString());
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const chipmint::schema::bytes_view_t& prefix) const {
  if (!database) {
    chipmint::common::critical("State store is not open");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  return entries;
}

}  // namespace chipmint::storage
