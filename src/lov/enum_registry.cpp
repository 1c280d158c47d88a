#include "lov/enum_registry.hpp"

#include <mutex>
#include <sstream>
#include <utility>

namespace batchexec::lov {

using attributes::AttributeRegistry;
using attributes::AttributeValue;
using core::errors::Error;
using core::errors::ErrorCode;
using core::errors::Fail;

namespace {

std::string JoinKeys(const EnumEntries& entries) {
  std::ostringstream out;
  out << '[';
  bool first = true;
  for (const auto& [key, _] : entries) {
    if (!first) {
      out << ", ";
    }
    out << key;
    first = false;
  }
  out << ']';
  return out.str();
}

bool RequireClassName(std::string_view class_name, Error& error) {
  if (class_name.empty()) {
    return Fail(error, ErrorCode::kSyntax, "LoV class name must not be empty");
  }
  return true;
}

bool RequireTargetAttribute(const AttributeRegistry& target, std::string_view attr_name,
                            Error& error) {
  if (attr_name.empty()) {
    return Fail(error, ErrorCode::kSyntax, "LoV assignment requires an attribute name");
  }
  if (!target.Has(attr_name)) {
    return Fail(error, ErrorCode::kUnknownAttribute,
                "object has no attribute [" + std::string(attr_name) + "]");
  }
  return true;
}

} // namespace

EnumRegistry::EnumRegistry(std::unique_ptr<IChoiceSource> choice_source)
    : choice_source_(std::move(choice_source)) {
  if (!choice_source_) {
    choice_source_ = std::make_unique<ShuffleChoiceSource>();
  }
}

bool EnumRegistry::Register(std::string_view class_name, const EnumEntries& entries,
                            std::size_t& count, Error& error,
                            core::logging::Logger* logger) {
  error.Clear();
  if (!RequireClassName(class_name, error)) {
    return false;
  }

  std::unique_lock<std::shared_mutex> lock(mu_);
  auto it = classes_.find(class_name);
  if (it == classes_.end()) {
    it = classes_.emplace(std::string(class_name), entries).first;
    if (logger != nullptr) {
      logger->Info("registering LoV", {{"class", class_name}});
    }
  } else {
    for (const auto& [key, description] : entries) {
      it->second[key] = description;
    }
    if (logger != nullptr) {
      logger->Info("merging LoV", {{"class", class_name}});
    }
  }
  count = it->second.size();
  return true;
}

std::size_t EnumRegistry::Clear(std::string_view class_name) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  const auto it = classes_.find(class_name);
  if (it == classes_.end()) {
    return 0;
  }
  const std::size_t previous = it->second.size();
  classes_.erase(it);
  return previous;
}

bool EnumRegistry::HasClass(std::string_view class_name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return classes_.find(class_name) != classes_.end();
}

bool EnumRegistry::Contains(std::string_view class_name, std::string_view key) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  const auto it = classes_.find(class_name);
  if (it == classes_.end()) {
    return false;
  }
  return it->second.find(std::string(key)) != it->second.end();
}

bool EnumRegistry::Keys(std::string_view class_name, std::vector<std::string>& keys,
                        Error& error) const {
  error.Clear();
  std::shared_lock<std::shared_mutex> lock(mu_);
  const auto it = classes_.find(class_name);
  if (it == classes_.end()) {
    return Fail(error, ErrorCode::kUnknownClass,
                "no such LoV exists [" + std::string(class_name) + "]");
  }
  keys.clear();
  keys.reserve(it->second.size());
  for (const auto& [key, _] : it->second) {
    keys.push_back(key);
  }
  return true;
}

bool EnumRegistry::Lookup(std::string_view class_name, std::string_view key,
                          std::string& description, Error& error) const {
  error.Clear();
  std::shared_lock<std::shared_mutex> lock(mu_);
  if (!ValidateLocked(class_name, key, error)) {
    return false;
  }
  description = classes_.find(class_name)->second.find(std::string(key))->second;
  return true;
}

bool EnumRegistry::Validate(std::string_view class_name, std::string_view value,
                            Error& error) const {
  error.Clear();
  std::shared_lock<std::shared_mutex> lock(mu_);
  return ValidateLocked(class_name, value, error);
}

bool EnumRegistry::ValidateLocked(std::string_view class_name, std::string_view value,
                                  Error& error) const {
  const auto it = classes_.find(class_name);
  if (it == classes_.end()) {
    return Fail(error, ErrorCode::kUnknownClass,
                "no such LoV exists [" + std::string(class_name) + "]");
  }
  if (it->second.find(std::string(value)) == it->second.end()) {
    return Fail(error, ErrorCode::kUnknownKey,
                "LoV [" + std::string(class_name) + "] contains no such value [" +
                    std::string(value) + "] " + JoinKeys(it->second));
  }
  return true;
}

bool EnumRegistry::Random(std::string_view class_name, AttributeRegistry& target,
                          std::string_view attr_name, std::string& chosen, Error& error,
                          core::logging::Logger* logger) {
  error.Clear();
  if (!RequireTargetAttribute(target, attr_name, error)) {
    return false;
  }

  std::vector<std::string> keys;
  if (!Keys(class_name, keys, error)) {
    return false;
  }
  if (keys.empty()) {
    return Fail(error, ErrorCode::kUnknownKey,
                "LoV [" + std::string(class_name) + "] has no values to choose from");
  }

  const std::size_t pick = choice_source_->Choose(keys.size());
  AttributeValue applied;
  if (!target.Set(attr_name, keys[pick], std::nullopt, applied, error)) {
    return false;
  }
  chosen = applied.value_or(keys[pick]);

  if (logger != nullptr) {
    logger->Info("randomising attribute", {{"attr", attr_name}, {"value", chosen}});
  }
  return true;
}

bool EnumRegistry::ConditionalDefault(std::string_view class_name, AttributeRegistry& target,
                                      std::string_view attr_name, std::string_view key,
                                      AttributeValue& result, Error& error,
                                      core::logging::Logger* logger) {
  error.Clear();
  if (!RequireTargetAttribute(target, attr_name, error) || !Validate(class_name, key, error)) {
    return false;
  }

  AttributeValue current;
  if (!target.Get(attr_name, current, error)) {
    return false;
  }
  if (current.has_value()) {
    if (logger != nullptr) {
      logger->Info("skipping attribute default", {{"attr", attr_name}});
    }
    result = std::move(current);
    return true;
  }

  if (!target.Set(attr_name, std::string(key), std::nullopt, result, error)) {
    return false;
  }
  if (logger != nullptr) {
    logger->Info("defaulting attribute", {{"attr", attr_name}, {"value", key}});
  }
  return true;
}

bool EnumRegistry::ForceSet(std::string_view class_name, AttributeRegistry& target,
                            std::string_view attr_name, std::string_view key,
                            AttributeValue& result, Error& error,
                            core::logging::Logger* logger) {
  error.Clear();
  if (!RequireTargetAttribute(target, attr_name, error) || !Validate(class_name, key, error)) {
    return false;
  }
  if (!target.Set(attr_name, std::string(key), std::nullopt, result, error)) {
    return false;
  }
  if (logger != nullptr) {
    logger->Info("setting attribute", {{"attr", attr_name}, {"value", key}});
  }
  return true;
}

EnumRegistry& SharedEnumRegistry() {
  static EnumRegistry registry;
  return registry;
}

} // namespace batchexec::lov
