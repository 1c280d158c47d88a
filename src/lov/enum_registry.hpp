#pragma once

#include "attributes/attribute_registry.hpp"
#include "core/errors/error.hpp"
#include "core/logging/logger.hpp"
#include "lov/choice_source.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace batchexec::lov {

// key -> human-readable description for one LoV class.
using EnumEntries = std::map<std::string, std::string>;

// Named lists of valid values ("LoV" classes) shared by every host object.
//
// Contract:
// - Register on an existing class merges key-wise; for overlapping keys the
//   later registration's description wins
// - Clear removes the class entirely; afterwards it behaves as never registered
// - Random/ConditionalDefault/ForceSet validate membership and the target
//   attribute before writing anything to the target
// - writers (Register, Clear) are serialized against readers by a
//   reader/writer lock so one registry may be shared across threads
class EnumRegistry {
public:
  // A null `choice_source` selects a clock-seeded ShuffleChoiceSource.
  explicit EnumRegistry(std::unique_ptr<IChoiceSource> choice_source = nullptr);

  EnumRegistry(const EnumRegistry&) = delete;
  EnumRegistry& operator=(const EnumRegistry&) = delete;

  // `count` receives the class size after the merge. Mutating calls log to the
  // caller's `logger` when one is given; the registry itself holds no logger.
  bool Register(std::string_view class_name, const EnumEntries& entries, std::size_t& count,
                core::errors::Error& error, core::logging::Logger* logger = nullptr);

  // Returns the class size just before removal, 0 when it was never registered.
  std::size_t Clear(std::string_view class_name);

  bool HasClass(std::string_view class_name) const;
  bool Contains(std::string_view class_name, std::string_view key) const;

  bool Keys(std::string_view class_name, std::vector<std::string>& keys,
            core::errors::Error& error) const;
  bool Lookup(std::string_view class_name, std::string_view key, std::string& description,
              core::errors::Error& error) const;

  // Fails kUnknownClass when the class is absent, kUnknownKey when `value` is
  // not one of its keys.
  bool Validate(std::string_view class_name, std::string_view value,
                core::errors::Error& error) const;

  // Picks one key uniformly and sets it on `target.attr_name`.
  bool Random(std::string_view class_name, attributes::AttributeRegistry& target,
              std::string_view attr_name, std::string& chosen, core::errors::Error& error,
              core::logging::Logger* logger = nullptr);

  // Sets `key` only when the attribute is currently unset. `result` receives
  // the attribute's value afterwards, whichever branch was taken.
  bool ConditionalDefault(std::string_view class_name, attributes::AttributeRegistry& target,
                          std::string_view attr_name, std::string_view key,
                          attributes::AttributeValue& result, core::errors::Error& error,
                          core::logging::Logger* logger = nullptr);

  bool ForceSet(std::string_view class_name, attributes::AttributeRegistry& target,
                std::string_view attr_name, std::string_view key,
                attributes::AttributeValue& result, core::errors::Error& error,
                core::logging::Logger* logger = nullptr);

private:
  bool ValidateLocked(std::string_view class_name, std::string_view value,
                      core::errors::Error& error) const;

  mutable std::shared_mutex mu_;
  std::map<std::string, EnumEntries, std::less<>> classes_;
  std::unique_ptr<IChoiceSource> choice_source_;
};

// Process-wide registry used by executives that are not handed one explicitly.
// Created on first use and lives until process exit; tests construct their own
// EnumRegistry instances instead of sharing this one.
EnumRegistry& SharedEnumRegistry();

} // namespace batchexec::lov
