#include "identity/id_generator.hpp"

#include <sys/random.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <format>
#include <memory>
#include <utility>

#include "common/logging/log.hpp"

namespace ax::identity {
namespace {

auto fill_words(std::mt19937_64 &engine, std::uint64_t *words, std::size_t count) -> void {
  for (std::size_t i = 0; i < count; ++i) {
    words[i] = engine();
  }
}

auto copy_little_endian(const std::uint64_t *words, std::size_t byte_length) -> Bytes {
  Bytes out(byte_length);
  for (std::size_t i = 0; i < byte_length; ++i) {
    out[i] = static_cast<std::byte>((words[i / 8] >> ((i % 8) * 8)) & 0xff);
  }
  return out;
}

}  // namespace

auto os_entropy() -> Expected<std::uint64_t> {
  std::uint64_t value = 0;
  ssize_t got = 0;
  do {
    got = getrandom(&value, sizeof(value), 0);
  } while (got < 0 && errno == EINTR);

  if (got < 0) {
    return tl::unexpected(make_error(
        ErrorCode::EntropyUnavailable,
        std::format("getrandom failed: {}", std::strerror(errno))));
  }
  if (static_cast<std::size_t>(got) != sizeof(value)) {
    return tl::unexpected(make_error(
        ErrorCode::EntropyUnavailable,
        std::format("getrandom returned {} of {} bytes", got, sizeof(value))));
  }
  return value;
}

IdGenerator::IdGenerator(EntropySource source) : source_(std::move(source)) {}

auto IdGenerator::global() -> IdGenerator & {
  static IdGenerator generator;
  return generator;
}

auto IdGenerator::reseed() -> Expected<void> {
  std::lock_guard<std::mutex> lock(mutex_);
  return reseed_locked();
}

auto IdGenerator::reseed_locked() -> Expected<void> {
  if (!source_) {
    return tl::unexpected(make_error(ErrorCode::EntropyUnavailable, "no entropy source"));
  }
  auto seed = source_();
  if (!seed) {
    ax::log::error("identity generator reseed failed: {}", seed.error().message);
    return tl::unexpected(seed.error());
  }
  engine_.seed(*seed);
  seeded_ = true;
  ax::log::debug("identity generator reseeded");
  return {};
}

auto IdGenerator::new_random_id(std::size_t byte_length) -> Expected<Bytes> {
  if (byte_length == 0) {
    return Bytes{};
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (!seeded_) {
    auto seeded = reseed_locked();
    if (!seeded) {
      return tl::unexpected(seeded.error());
    }
  }

  const std::size_t word_count = (byte_length + 7) / 8;
  if (word_count <= kInlineWords) {
    std::array<std::uint64_t, kInlineWords> words{};
    fill_words(engine_, words.data(), word_count);
    return copy_little_endian(words.data(), byte_length);
  }

  auto words = std::make_unique<std::uint64_t[]>(word_count);
  fill_words(engine_, words.get(), word_count);
  return copy_little_endian(words.get(), byte_length);
}

auto IdGenerator::new_actor_id() -> Expected<Bytes> {
  auto id = new_random_id(kActorIdLength);
  if (id && spdlog::should_log(spdlog::level::trace)) {
    ax::log::trace("minted actor id {}", text::to_hex(*id));
  }
  return id;
}

auto IdGenerator::seeded() const -> bool {
  std::lock_guard<std::mutex> lock(mutex_);
  return seeded_;
}

auto reseed() -> Expected<void> { return IdGenerator::global().reseed(); }

auto new_random_id(std::size_t byte_length) -> Expected<Bytes> {
  return IdGenerator::global().new_random_id(byte_length);
}

auto new_actor_id() -> Expected<Bytes> { return IdGenerator::global().new_actor_id(); }

}  // namespace ax::identity
