#include "lov/choice_source.hpp"

#include <algorithm>
#include <chrono>
#include <numeric>
#include <utility>

namespace batchexec::lov {

ShuffleChoiceSource::ShuffleChoiceSource()
    : ShuffleChoiceSource(static_cast<std::uint64_t>(
          std::chrono::system_clock::now().time_since_epoch().count())) {}

ShuffleChoiceSource::ShuffleChoiceSource(std::uint64_t seed) : engine_(seed) {}

std::size_t ShuffleChoiceSource::Choose(std::size_t count) {
  std::vector<std::size_t> order(count);
  std::iota(order.begin(), order.end(), std::size_t{0});

  std::lock_guard<std::mutex> lock(mu_);
  std::shuffle(order.begin(), order.end(), engine_);
  return order.front();
}

SequenceChoiceSource::SequenceChoiceSource(std::vector<std::size_t> picks)
    : picks_(std::move(picks)) {}

std::size_t SequenceChoiceSource::Choose(std::size_t count) {
  if (picks_.empty()) {
    ++calls_;
    return 0;
  }
  const std::size_t pick = picks_[calls_ % picks_.size()];
  ++calls_;
  return pick % count;
}

} // namespace batchexec::lov
