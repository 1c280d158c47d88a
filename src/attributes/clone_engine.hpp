#ifndef BATCHEXEC_ATTRIBUTES_CLONE_ENGINE_HPP_
#define BATCHEXEC_ATTRIBUTES_CLONE_ENGINE_HPP_

#include "attributes/attribute_registry.hpp"
#include "core/errors/error.hpp"
#include "core/logging/logger.hpp"

#include <cstddef>
#include <string_view>

namespace batchexec::attributes {

// How read-only destination attributes are treated during Clone.
enum class ClonePolicy {
  kNormal = 0,
  // Temporarily lift read-only, copy, then restore it.
  kForce,
  // Leave read-only destinations untouched and out of the copied count.
  kSkip,
};

const char* ToString(ClonePolicy policy);
bool ParseClonePolicy(std::string_view raw, ClonePolicy& policy, core::errors::Error& error);

struct CloneResult {
  std::size_t copied = 0;
  std::size_t skipped = 0;
  std::size_t forced = 0;
};

// Copies `source` values into `target` for every name in target's captured
// inheritable set. Any read-only destination fails the call before anything is
// written.
bool Inherit(AttributeRegistry& target, const AttributeRegistry& source, std::size_t& copied,
             core::errors::Error& error, core::logging::Logger* logger = nullptr);

// Copies `source` values into `target` for every public attribute target
// currently defines, applying `policy` to read-only destinations. Handle
// attributes are never copied.
//
// Validation (missing source names, read-only under kNormal, non-boolean
// values for boolean destinations) completes before the first write.
bool Clone(AttributeRegistry& target, const AttributeRegistry& source, ClonePolicy policy,
           CloneResult& result, core::errors::Error& error,
           core::logging::Logger* logger = nullptr);

} // namespace batchexec::attributes

#endif // BATCHEXEC_ATTRIBUTES_CLONE_ENGINE_HPP_
