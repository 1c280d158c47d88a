#include "attributes/clone_engine.hpp"

#include <string>
#include <vector>

namespace batchexec::attributes {

using core::errors::Error;
using core::errors::ErrorCode;
using core::errors::Fail;

namespace {

struct CopyStep {
  std::string name;
  AttributeValue value;
  bool read_only = false;
};

// Resolves every copy before any write so a failure leaves `target` as is.
bool PlanCopy(const AttributeRegistry& target, const AttributeRegistry& source,
              const std::vector<std::string>& names, ClonePolicy policy,
              std::vector<CopyStep>& plan, std::size_t& skipped, Error& error) {
  plan.clear();
  skipped = 0;

  for (const std::string& name : names) {
    const AttributeDescriptor* destination = target.Find(name);
    if (destination == nullptr) {
      return Fail(error, ErrorCode::kUnknownAttribute,
                  "attribute [" + name + "] does not exist on destination");
    }
    if (destination->kind == AttributeKind::kOpaqueHandle) {
      continue;
    }

    const AttributeDescriptor* origin = source.Find(name);
    if (origin == nullptr) {
      return Fail(error, ErrorCode::kUnknownAttribute,
                  "attribute [" + name + "] does not exist on source");
    }

    if (destination->read_only) {
      if (policy == ClonePolicy::kNormal) {
        return Fail(error, ErrorCode::kReadOnlyViolation,
                    "attribute [" + name + "] is read-only");
      }
      if (policy == ClonePolicy::kSkip) {
        ++skipped;
        continue;
      }
    }

    if (destination->kind == AttributeKind::kBoolean && origin->value.has_value() &&
        origin->value.value() != "0" && origin->value.value() != "1") {
      return Fail(error, ErrorCode::kInvalidKind,
                  "attribute [" + name + "] value is not boolean [" + origin->value.value() +
                      "], try: { 0, 1 }");
    }

    plan.push_back(CopyStep{name, origin->value, destination->read_only});
  }
  return true;
}

bool ApplyCopy(AttributeRegistry& target, const std::vector<CopyStep>& plan, CloneResult& result,
               Error& error, core::logging::Logger* logger) {
  for (const CopyStep& step : plan) {
    std::size_t touched = 0;
    if (step.read_only) {
      if (logger != nullptr) {
        logger->Info("forcing read-only attribute change", {{"attr", step.name}});
      }
      if (!target.MarkReadWrite({step.name}, touched, error)) {
        return false;
      }
    }

    const bool set_ok = target.Set(step.name, step.value, error);

    if (step.read_only) {
      Error restore_error;
      if (!target.MarkReadOnly({step.name}, touched, restore_error)) {
        error = restore_error;
        return false;
      }
      ++result.forced;
    }
    if (!set_ok) {
      return false;
    }
    ++result.copied;
  }
  return true;
}

} // namespace

const char* ToString(ClonePolicy policy) {
  switch (policy) {
  case ClonePolicy::kNormal:
    return "normal";
  case ClonePolicy::kForce:
    return "force";
  case ClonePolicy::kSkip:
    return "skip";
  }
  return "normal";
}

bool ParseClonePolicy(std::string_view raw, ClonePolicy& policy, Error& error) {
  error.Clear();
  if (raw == "normal") {
    policy = ClonePolicy::kNormal;
    return true;
  }
  if (raw == "force") {
    policy = ClonePolicy::kForce;
    return true;
  }
  if (raw == "skip") {
    policy = ClonePolicy::kSkip;
    return true;
  }
  return Fail(error, ErrorCode::kSyntax,
              "invalid clone policy [" + std::string(raw) + "], try: { normal, force, skip }");
}

bool Inherit(AttributeRegistry& target, const AttributeRegistry& source, std::size_t& copied,
             Error& error, core::logging::Logger* logger) {
  error.Clear();
  copied = 0;

  std::vector<CopyStep> plan;
  std::size_t skipped = 0;
  if (!PlanCopy(target, source, target.Inheritable(), ClonePolicy::kNormal, plan, skipped,
                error)) {
    return false;
  }

  CloneResult result;
  if (!ApplyCopy(target, plan, result, error, logger)) {
    return false;
  }
  copied = result.copied;

  if (logger != nullptr) {
    logger->Info("inherited attributes", {{"count", std::to_string(copied)}});
  }
  return true;
}

bool Clone(AttributeRegistry& target, const AttributeRegistry& source, ClonePolicy policy,
           CloneResult& result, Error& error, core::logging::Logger* logger) {
  error.Clear();
  result = CloneResult{};

  std::vector<CopyStep> plan;
  if (!PlanCopy(target, source, target.List(), policy, plan, result.skipped, error)) {
    return false;
  }
  if (logger != nullptr && result.skipped > 0U) {
    logger->Info("skipping read-only attributes", {{"count", std::to_string(result.skipped)}});
  }

  if (!ApplyCopy(target, plan, result, error, logger)) {
    return false;
  }

  if (logger != nullptr) {
    logger->Info("cloned attributes", {{"count", std::to_string(result.copied)},
                                       {"policy", ToString(policy)}});
  }
  return true;
}

} // namespace batchexec::attributes
