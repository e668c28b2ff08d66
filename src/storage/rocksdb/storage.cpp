#include <chipmint/common/critical.hpp>
#include <chipmint/storage/rocksdb/storage.hpp>

namespace chipmint::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    chipmint::common::critical("Cannot open chipmint state store at {}: {}",
                               path, status.ToString());
  }
  spdlog::info("Opened chipmint state store at {}", path);
  store.database.reset(database);

  return store;
}

// Synced: a returned batch is on disk.
void storage<rocksdb_storage_tag>::write(const write_batch_t& batch) const {
  if (!database) {
    chipmint::common::critical("State store is not open");
  }

  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& entry : batch) {
    auto key_slice = detail::to_slice(
        chipmint::schema::bytes_view_t{entry.key.data(), entry.key.size()});
    auto status =
        entry.value.has_value()
            ? rocks_batch.Put(key_slice,
                              detail::to_slice(chipmint::schema::bytes_view_t{
                                  entry.value->data(), entry.value->size()}))
            : rocks_batch.Delete(key_slice);
    if (!status.ok()) {
      chipmint::common::critical("Cannot stage key in write batch: {}",
                                 status.ToString());
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Write(write_options, &rocks_batch);
  if (!status.ok()) {
    chipmint::common::critical("Cannot commit {} staged changes: {}",
                               batch.size(), status.ToString());
  }
  spdlog::debug("Committed {} staged changes", batch.size());
}

}  // namespace chipmint::storage
