#include <chipmint/crypto/bls.hpp>

extern "C" {
#include <relic/relic.h>
}

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>

namespace chipmint::crypto::bls {

namespace {

constexpr uint8_t kCompressedFlag = 0x80;
constexpr uint8_t kInfinityFlag = 0x40;
constexpr uint8_t kSignFlag = 0x20;
constexpr uint8_t kFlagMask = 0xE0;
// relic's compressed point prefix; the y coordinate it selects is corrected
// against the sign flag after decoding.
constexpr uint8_t kRelicCompressedPrefix = 0x02;

// relic reports failures through the per-thread context code; read and clear
// it so one failure does not leak into the next call.
bool consume_relic_error() {
  auto* context = core_get();
  if (context == nullptr) {
    return true;
  }
  if (context->code != RLC_OK) {
    context->code = RLC_OK;
    return true;
  }
  return false;
}

bool ensure_relic() {
  thread_local const auto ready = [] {
    if (core_get() == nullptr && core_init() != RLC_OK) {
      spdlog::error("Failed to initialize relic core");
      return false;
    }
    if (pc_param_set_any() != RLC_OK) {
      spdlog::error("relic has no pairing-friendly curve configured");
      return false;
    }
    if (ep_param_get() != B12_P381) {
      spdlog::error("relic is not configured for BLS12-381");
      return false;
    }
    return true;
  }();
  return ready;
}

struct bn_value final {
  bn_value() {
    bn_null(value);
    bn_new(value);
  }
  ~bn_value() { bn_free(value); }
  bn_value(const bn_value&) = delete;
  bn_value& operator=(const bn_value&) = delete;

  bn_t value;
};

struct fp_value final {
  fp_value() {
    fp_null(value);
    fp_new(value);
  }
  ~fp_value() { fp_free(value); }
  fp_value(const fp_value&) = delete;
  fp_value& operator=(const fp_value&) = delete;

  fp_t value;
};

struct g1_value final {
  g1_value() {
    g1_null(value);
    g1_new(value);
  }
  ~g1_value() { g1_free(value); }
  g1_value(const g1_value&) = delete;
  g1_value& operator=(const g1_value&) = delete;

  g1_t value;
};

struct g2_value final {
  g2_value() {
    g2_null(value);
    g2_new(value);
  }
  ~g2_value() { g2_free(value); }
  g2_value(const g2_value&) = delete;
  g2_value& operator=(const g2_value&) = delete;

  g2_t value;
};

struct gt_value final {
  gt_value() {
    gt_null(value);
    gt_new(value);
  }
  ~gt_value() { gt_free(value); }
  gt_value(const gt_value&) = delete;
  gt_value& operator=(const gt_value&) = delete;

  gt_t value;
};

// An element is "lexicographically largest" when it exceeds its negation.
bool fp_is_largest(const fp_t element) {
  auto negated = fp_value{};
  fp_neg(negated.value, element);
  auto lhs = bn_value{};
  auto rhs = bn_value{};
  fp_prime_back(lhs.value, element);
  fp_prime_back(rhs.value, negated.value);
  return bn_cmp(lhs.value, rhs.value) == RLC_GT;
}

bool fp2_is_largest(const fp2_t element) {
  if (!fp_is_zero(element[1])) {
    return fp_is_largest(element[1]);
  }
  return fp_is_largest(element[0]);
}

bool read_g1(g1_t point, const chipmint::schema::bytes_view_t& bytes) {
  if (bytes.size() != kPublicKeySize) {
    return false;
  }
  const auto flags = static_cast<uint8_t>(bytes[0] & kFlagMask);
  if ((flags & kCompressedFlag) == 0 || (flags & kInfinityFlag) != 0) {
    return false;
  }

  auto buffer = std::array<uint8_t, kPublicKeySize + 1>{};
  buffer[0] = kRelicCompressedPrefix;
  std::copy(std::begin(bytes), std::end(bytes), std::begin(buffer) + 1);
  buffer[1] = static_cast<uint8_t>(buffer[1] & ~kFlagMask);

  g1_read_bin(point, buffer.data(), buffer.size());
  if (consume_relic_error()) {
    return false;
  }
  g1_norm(point, point);
  if (fp_is_largest(point->y) != ((flags & kSignFlag) != 0)) {
    g1_neg(point, point);
  }
  return g1_is_valid(point) == 1 && !consume_relic_error();
}

bool read_g2(g2_t point, const chipmint::schema::bytes_view_t& bytes) {
  if (bytes.size() != kSignatureSize) {
    return false;
  }
  const auto flags = static_cast<uint8_t>(bytes[0] & kFlagMask);
  if ((flags & kCompressedFlag) == 0 || (flags & kInfinityFlag) != 0) {
    return false;
  }

  // The wire form carries x as (c1 || c0); relic reads (c0 || c1).
  constexpr auto kHalf = kSignatureSize / 2;
  auto buffer = std::array<uint8_t, kSignatureSize + 1>{};
  buffer[0] = kRelicCompressedPrefix;
  std::copy(std::begin(bytes) + kHalf, std::end(bytes),
            std::begin(buffer) + 1);
  std::copy(std::begin(bytes), std::begin(bytes) + kHalf,
            std::begin(buffer) + 1 + kHalf);
  buffer[1 + kHalf] = static_cast<uint8_t>(buffer[1 + kHalf] & ~kFlagMask);

  g2_read_bin(point, buffer.data(), buffer.size());
  if (consume_relic_error()) {
    return false;
  }
  g2_norm(point, point);
  if (fp2_is_largest(point->y) != ((flags & kSignFlag) != 0)) {
    g2_neg(point, point);
  }
  return g2_is_valid(point) == 1 && !consume_relic_error();
}

public_key_t write_g1(g1_t point) {
  auto out = public_key_t{};
  g1_norm(point, point);
  fp_write_bin(out.data(), out.size(), point->x);
  out[0] |= kCompressedFlag;
  if (fp_is_largest(point->y)) {
    out[0] |= kSignFlag;
  }
  return out;
}

signature_t write_g2(g2_t point) {
  constexpr auto kHalf = kSignatureSize / 2;
  auto out = signature_t{};
  g2_norm(point, point);
  fp_write_bin(out.data(), kHalf, point->x[1]);
  fp_write_bin(out.data() + kHalf, kHalf, point->x[0]);
  out[0] |= kCompressedFlag;
  if (fp2_is_largest(point->y)) {
    out[0] |= kSignFlag;
  }
  return out;
}

void hash_to_g2(g2_t point, const chipmint::schema::bytes_view_t& message) {
  ep2_map_dst(point, message.data(), message.size(),
              reinterpret_cast<const uint8_t*>(kMinPkDst.data()),
              kMinPkDst.size());
}

bool read_secret(bn_t scalar, const secret_key_t& secret) {
  auto order = bn_value{};
  g1_get_ord(order.value);
  bn_read_bin(scalar, secret.data(), secret.size());
  bn_mod(scalar, scalar, order.value);
  return !bn_is_zero(scalar) && !consume_relic_error();
}

}  // namespace

bool available() {
  return ensure_relic();
}

bool verify(const chipmint::schema::bytes_view_t& public_key,
            const chipmint::schema::bytes_view_t& message,
            const chipmint::schema::bytes_view_t& signature) {
  if (!ensure_relic()) {
    return false;
  }

  auto key_point = g1_value{};
  if (!read_g1(key_point.value, public_key)) {
    spdlog::debug("Rejecting malformed BLS public key");
    return false;
  }
  auto signature_point = g2_value{};
  if (!read_g2(signature_point.value, signature)) {
    spdlog::debug("Rejecting malformed BLS signature");
    return false;
  }

  auto hashed = g2_value{};
  hash_to_g2(hashed.value, message);

  auto generator = g1_value{};
  g1_get_gen(generator.value);

  // e(pk, H(m)) == e(g1, sig)
  auto lhs = gt_value{};
  auto rhs = gt_value{};
  pc_map(lhs.value, key_point.value, hashed.value);
  pc_map(rhs.value, generator.value, signature_point.value);
  if (consume_relic_error()) {
    return false;
  }
  return gt_cmp(lhs.value, rhs.value) == RLC_EQ;
}

bool is_valid_public_key(const chipmint::schema::bytes_view_t& public_key) {
  if (!ensure_relic()) {
    return false;
  }
  auto point = g1_value{};
  return read_g1(point.value, public_key);
}

bool is_valid_signature(const chipmint::schema::bytes_view_t& signature) {
  if (!ensure_relic()) {
    return false;
  }
  auto point = g2_value{};
  return read_g2(point.value, signature);
}

std::optional<public_key_t> derive_public_key(const secret_key_t& secret) {
  if (!ensure_relic()) {
    return std::nullopt;
  }
  auto scalar = bn_value{};
  if (!read_secret(scalar.value, secret)) {
    return std::nullopt;
  }
  auto point = g1_value{};
  g1_mul_gen(point.value, scalar.value);
  return write_g1(point.value);
}

std::optional<signature_t> sign(const secret_key_t& secret,
                                const chipmint::schema::bytes_view_t& message) {
  if (!ensure_relic()) {
    return std::nullopt;
  }
  auto scalar = bn_value{};
  if (!read_secret(scalar.value, secret)) {
    return std::nullopt;
  }
  auto point = g2_value{};
  hash_to_g2(point.value, message);
  g2_mul(point.value, point.value, scalar.value);
  if (consume_relic_error()) {
    return std::nullopt;
  }
  return write_g2(point.value);
}

}  // namespace chipmint::crypto::bls
