#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <random>

#include "common/error.hpp"
#include "common/text/text.hpp"

namespace ax::identity {

/// Length of an actor identity in bytes.
inline constexpr std::size_t kActorIdLength = 32;

/// Requests up to this many 64-bit words are served from an inline buffer.
inline constexpr std::size_t kInlineWords = 4;

/// Supplies 64 bits of seed material.
using EntropySource = std::function<Expected<std::uint64_t>()>;

/// 64 bits from the kernel CSPRNG (getrandom(2)).
auto os_entropy() -> Expected<std::uint64_t>;

/// Produces unpredictable byte strings from a 64-bit Mersenne Twister that
/// is seeded from `EntropySource` on first use.
///
/// Output bytes are the engine's raw word stream in little-endian order,
/// truncated to the requested length. Suitable for collision avoidance,
/// not for secrets.
class IdGenerator {
 public:
  explicit IdGenerator(EntropySource source = os_entropy);

  IdGenerator(const IdGenerator &) = delete;
  auto operator=(const IdGenerator &) -> IdGenerator & = delete;

  /// The process-wide generator.
  static auto global() -> IdGenerator &;

  /// Seed from a fresh draw of the entropy source. On failure the previous
  /// state is kept.
  auto reseed() -> Expected<void>;

  auto new_random_id(std::size_t byte_length) -> Expected<Bytes>;

  auto new_actor_id() -> Expected<Bytes>;

  auto seeded() const -> bool;

 private:
  auto reseed_locked() -> Expected<void>;

  EntropySource source_;
  mutable std::mutex mutex_;
  std::mt19937_64 engine_;
  bool seeded_ = false;
};

auto reseed() -> Expected<void>;

auto new_random_id(std::size_t byte_length) -> Expected<Bytes>;

auto new_actor_id() -> Expected<Bytes>;

}  // namespace ax::identity
