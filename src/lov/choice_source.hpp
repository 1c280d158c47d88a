#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>
#include <vector>

namespace batchexec::lov {

// "Choose one of N" seam used by randomized LoV assignment.
class IChoiceSource {
public:
  virtual ~IChoiceSource() = default;

  // Returns an index in [0, count). `count` is never zero.
  virtual std::size_t Choose(std::size_t count) = 0;
};

// Default source: seeded once at construction, then shuffles the candidate
// indices and takes the first.
class ShuffleChoiceSource final : public IChoiceSource {
public:
  // Seeds from the wall clock.
  ShuffleChoiceSource();
  explicit ShuffleChoiceSource(std::uint64_t seed);

  std::size_t Choose(std::size_t count) override;

private:
  std::mutex mu_;
  std::mt19937_64 engine_;
};

// Deterministic source for tests: replays `picks` (each taken modulo count),
// wrapping around when exhausted.
class SequenceChoiceSource final : public IChoiceSource {
public:
  explicit SequenceChoiceSource(std::vector<std::size_t> picks);

  std::size_t Choose(std::size_t count) override;

  std::size_t calls() const {
    return calls_;
  }

private:
  std::vector<std::size_t> picks_;
  std::size_t calls_ = 0;
};

} // namespace batchexec::lov
