#pragma once

#include <chipmint/schema/primitives.hpp>

namespace chipmint::archive {

class archive;

/// Possession of this value authorizes privileged archive calls.
///
/// Only an archive can mint one, on initialization or when presented with
/// the admin secret; it cannot be copied, only moved to a new holder.
class admin_capability final {
 public:
  admin_capability(const admin_capability&) = delete;
  admin_capability& operator=(const admin_capability&) = delete;
  admin_capability(admin_capability&&) noexcept = default;
  admin_capability& operator=(admin_capability&&) noexcept = default;
  ~admin_capability() = default;

 private:
  friend class archive;

  explicit admin_capability(const chipmint::schema::hash32_t& digest)
      : digest_{digest} {}

  chipmint::schema::hash32_t digest_;
};

}  // namespace chipmint::archive
