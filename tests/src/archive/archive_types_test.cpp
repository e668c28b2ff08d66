#include <chipmint/archive/archive.hpp>
#include <chipmint/schema/key/state_keys.hpp>
#include <chipmint/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <type_traits>

namespace {

using encoder_t = chipmint::schema::encoding::encoder<
    chipmint::schema::encoding::scale_encoder_tag>;
using storage_t =
    chipmint::storage::storage<chipmint::storage::rocksdb_storage_tag>;

class archive_store final {
 public:
  explicit archive_store(const std::string_view prefix)
      : db_path_{chipmint::testing::make_db_path(prefix)},
        storage_{chipmint::storage::make_storage<
            chipmint::storage::rocksdb_storage_tag>(db_path_)},
        archive_{encoder_, storage_} {}

  ~archive_store() {
    storage_.database.reset();
    chipmint::testing::remove_path(db_path_);
  }

  encoder_t& encoder() { return encoder_; }
  storage_t& storage() { return storage_; }
  chipmint::archive::archive& archive() { return archive_; }

 private:
  std::string db_path_;
  encoder_t encoder_;
  storage_t storage_;
  chipmint::archive::archive archive_;
};

chipmint::schema::bytes_t make_public_key(const uint8_t seed) {
  auto key = chipmint::schema::bytes_t(33, seed);
  key[0] = 0x02;
  return key;
}

}  // namespace

static_assert(!std::is_copy_constructible_v<chipmint::archive::admin_capability>);
static_assert(std::is_move_constructible_v<chipmint::archive::admin_capability>);
static_assert(
    !std::is_default_constructible_v<chipmint::archive::admin_capability>);

TEST(archive_types, initialize_issues_capability_once) {
  auto store = archive_store{"chipmint_archive_init"};
  EXPECT_FALSE(store.archive().initialized());

  auto secret = chipmint::testing::make_hash(1);
  auto capability = store.archive().initialize(secret);
  EXPECT_TRUE(capability.has_value());
  EXPECT_TRUE(store.archive().initialized());
  EXPECT_FALSE(store.archive().initialize(secret).has_value());
}

TEST(archive_types, capability_can_be_reclaimed_with_secret_only) {
  auto store = archive_store{"chipmint_archive_claim"};
  auto secret = chipmint::testing::make_hash(1);
  EXPECT_FALSE(store.archive().claim_capability(secret).has_value());
  ASSERT_TRUE(store.archive().initialize(secret).has_value());

  EXPECT_TRUE(store.archive().claim_capability(secret).has_value());
  EXPECT_FALSE(store.archive()
                   .claim_capability(chipmint::testing::make_hash(2))
                   .has_value());
}

TEST(archive_types, add_entry_starts_not_minted_and_emits_event) {
  auto store = archive_store{"chipmint_archive_add"};
  auto capability = store.archive().initialize(chipmint::testing::make_hash(1));
  ASSERT_TRUE(capability.has_value());

  auto key = make_public_key(7);
  auto result =
      store.archive().add_entry(*capability, chipmint::testing::as_view(key));
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.codespace, "chipmint.archive");
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, "archive_entry_added");
  ASSERT_EQ(result.events[0].attributes.size(), 1u);
  EXPECT_EQ(result.events[0].attributes[0].value, chipmint::schema::to_hex(key));

  EXPECT_TRUE(store.archive().exists(chipmint::testing::as_view(key)));
  auto status = chipmint::schema::mint_status_t::minted;
  EXPECT_EQ(store.archive().get_status(chipmint::testing::as_view(key), status),
            chipmint::schema::error_code::ok);
  EXPECT_EQ(status, chipmint::schema::mint_status_t::not_minted);
}

TEST(archive_types, duplicate_entry_is_rejected) {
  auto store = archive_store{"chipmint_archive_duplicate"};
  auto capability = store.archive().initialize(chipmint::testing::make_hash(1));
  ASSERT_TRUE(capability.has_value());
  auto key = make_public_key(7);
  ASSERT_TRUE(store.archive()
                  .add_entry(*capability, chipmint::testing::as_view(key))
                  .ok());
  ASSERT_EQ(store.archive().set_status(chipmint::testing::as_view(key),
                                       chipmint::schema::mint_status_t::minted),
            chipmint::schema::error_code::ok);

  auto result =
      store.archive().add_entry(*capability, chipmint::testing::as_view(key));
  EXPECT_EQ(result.error(), chipmint::schema::error_code::duplicate_entry);

  auto status = chipmint::schema::mint_status_t{};
  ASSERT_EQ(store.archive().get_status(chipmint::testing::as_view(key), status),
            chipmint::schema::error_code::ok);
  EXPECT_EQ(status, chipmint::schema::mint_status_t::minted);
}

TEST(archive_types, capability_from_another_archive_is_rejected) {
  auto first = archive_store{"chipmint_archive_first"};
  auto second = archive_store{"chipmint_archive_second"};
  auto foreign = first.archive().initialize(chipmint::testing::make_hash(1));
  ASSERT_TRUE(foreign.has_value());
  ASSERT_TRUE(
      second.archive().initialize(chipmint::testing::make_hash(2)).has_value());

  auto key = make_public_key(3);
  auto result =
      second.archive().add_entry(*foreign, chipmint::testing::as_view(key));
  EXPECT_EQ(result.error(), chipmint::schema::error_code::capability_mismatch);
  EXPECT_FALSE(second.archive().exists(chipmint::testing::as_view(key)));
}

TEST(archive_types, missing_entries_report_missing_entry) {
  auto store = archive_store{"chipmint_archive_missing"};
  auto key = make_public_key(9);
  auto status = chipmint::schema::mint_status_t{};
  EXPECT_FALSE(store.archive().exists(chipmint::testing::as_view(key)));
  EXPECT_EQ(store.archive().get_status(chipmint::testing::as_view(key), status),
            chipmint::schema::error_code::missing_entry);
  EXPECT_EQ(store.archive().set_status(chipmint::testing::as_view(key),
                                       chipmint::schema::mint_status_t::minted),
            chipmint::schema::error_code::missing_entry);
  EXPECT_EQ(store.archive().remove_entry(chipmint::testing::as_view(key)),
            chipmint::schema::error_code::missing_entry);
}

TEST(archive_types, non_status_value_reports_type_mismatch) {
  auto store = archive_store{"chipmint_archive_mismatch"};
  auto key = make_public_key(4);
  auto storage_key = chipmint::schema::key::make_archive_key(
      store.encoder(), chipmint::testing::as_view(key));
  store.storage().write(chipmint::storage::write_batch_t{
      chipmint::storage::write_entry_t{
          .key = storage_key, .value = chipmint::schema::bytes_t{0x01, 0x02}}});

  auto status = chipmint::schema::mint_status_t{};
  EXPECT_TRUE(store.archive().exists(chipmint::testing::as_view(key)));
  EXPECT_EQ(store.archive().get_status(chipmint::testing::as_view(key), status),
            chipmint::schema::error_code::type_mismatch);

  store.storage().write(chipmint::storage::write_batch_t{
      chipmint::storage::write_entry_t{
          .key = storage_key, .value = chipmint::schema::bytes_t{0x07}}});
  EXPECT_EQ(store.archive().get_status(chipmint::testing::as_view(key), status),
            chipmint::schema::error_code::type_mismatch);
}

TEST(archive_types, remove_entry_deletes_key) {
  auto store = archive_store{"chipmint_archive_remove"};
  auto capability = store.archive().initialize(chipmint::testing::make_hash(1));
  ASSERT_TRUE(capability.has_value());
  auto key = make_public_key(5);
  ASSERT_TRUE(store.archive()
                  .add_entry(*capability, chipmint::testing::as_view(key))
                  .ok());

  EXPECT_EQ(store.archive().remove_entry(chipmint::testing::as_view(key)),
            chipmint::schema::error_code::ok);
  EXPECT_FALSE(store.archive().exists(chipmint::testing::as_view(key)));
}

TEST(archive_types, staged_changes_apply_only_on_write) {
  auto store = archive_store{"chipmint_archive_stage"};
  auto capability = store.archive().initialize(chipmint::testing::make_hash(1));
  ASSERT_TRUE(capability.has_value());
  auto old_key = make_public_key(1);
  auto new_key = make_public_key(2);
  ASSERT_TRUE(store.archive()
                  .add_entry(*capability, chipmint::testing::as_view(old_key))
                  .ok());
  ASSERT_TRUE(store.archive()
                  .add_entry(*capability, chipmint::testing::as_view(new_key))
                  .ok());

  auto batch = chipmint::storage::write_batch_t{};
  ASSERT_EQ(store.archive().stage_remove_entry(
                batch, chipmint::testing::as_view(old_key)),
            chipmint::schema::error_code::ok);
  ASSERT_EQ(store.archive().stage_set_status(
                batch, chipmint::testing::as_view(new_key),
                chipmint::schema::mint_status_t::minted),
            chipmint::schema::error_code::ok);
  EXPECT_EQ(store.archive().stage_set_status(
                batch, chipmint::testing::as_view(make_public_key(3)),
                chipmint::schema::mint_status_t::minted),
            chipmint::schema::error_code::missing_entry);
  EXPECT_EQ(batch.size(), 2u);
  EXPECT_TRUE(store.archive().exists(chipmint::testing::as_view(old_key)));

  store.storage().write(batch);
  EXPECT_FALSE(store.archive().exists(chipmint::testing::as_view(old_key)));
  auto status = chipmint::schema::mint_status_t{};
  ASSERT_EQ(
      store.archive().get_status(chipmint::testing::as_view(new_key), status),
      chipmint::schema::error_code::ok);
  EXPECT_EQ(status, chipmint::schema::mint_status_t::minted);
}
