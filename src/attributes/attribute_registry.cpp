#include "attributes/attribute_registry.hpp"

#include "core/text_utils.hpp"

#include <utility>

namespace batchexec::attributes {

using core::errors::Error;
using core::errors::ErrorCode;
using core::errors::Fail;

namespace {

template <typename ReadFunc>
bool WithAttributeForRead(
    const std::map<std::string, AttributeDescriptor, std::less<>>& attributes,
    std::string_view name, Error& error, ReadFunc&& reader) {
  error.Clear();
  if (name.empty()) {
    return Fail(error, ErrorCode::kSyntax, "attribute name must not be empty");
  }
  const auto it = attributes.find(name);
  if (it == attributes.end()) {
    return Fail(error, ErrorCode::kUnknownAttribute,
                "attribute [" + std::string(name) + "] does not exist");
  }
  return reader(it->second);
}

template <typename WriteFunc>
bool WithAttributeForWrite(std::map<std::string, AttributeDescriptor, std::less<>>& attributes,
                           std::string_view name, Error& error, WriteFunc&& writer) {
  error.Clear();
  if (name.empty()) {
    return Fail(error, ErrorCode::kSyntax, "attribute name must not be empty");
  }
  auto it = attributes.find(name);
  if (it == attributes.end()) {
    return Fail(error, ErrorCode::kUnknownAttribute,
                "attribute [" + std::string(name) + "] does not exist");
  }
  return writer(it->second);
}

std::string BoolText(bool value) {
  return value ? "1" : "0";
}

} // namespace

const char* ToString(AttributeKind kind) {
  switch (kind) {
  case AttributeKind::kAny:
    return "any";
  case AttributeKind::kBoolean:
    return "bool";
  case AttributeKind::kOpaqueHandle:
    return "handle";
  }
  return "any";
}

const char* ToString(AttributeField field) {
  switch (field) {
  case AttributeField::kOwnerClass:
    return "owner_class";
  case AttributeField::kDefault:
    return "default";
  case AttributeField::kName:
    return "name";
  case AttributeField::kReadOnly:
    return "read_only";
  case AttributeField::kKind:
    return "kind";
  case AttributeField::kValue:
    return "value";
  }
  return "value";
}

bool ParseAttributeKind(std::string_view raw, AttributeKind& kind, Error& error) {
  error.Clear();
  if (raw == "any") {
    kind = AttributeKind::kAny;
    return true;
  }
  if (raw == "bool" || raw == "boolean") {
    kind = AttributeKind::kBoolean;
    return true;
  }
  if (raw == "handle") {
    kind = AttributeKind::kOpaqueHandle;
    return true;
  }
  return Fail(error, ErrorCode::kInvalidKind,
              "kind [" + std::string(raw) + "] does not exist, try: { any, bool, handle }");
}

bool ParseAttributeField(std::string_view raw, AttributeField& field, Error& error) {
  error.Clear();
  for (const AttributeField candidate :
       {AttributeField::kOwnerClass, AttributeField::kDefault, AttributeField::kName,
        AttributeField::kReadOnly, AttributeField::kKind, AttributeField::kValue}) {
    if (raw == ToString(candidate)) {
      field = candidate;
      return true;
    }
  }
  return Fail(error, ErrorCode::kSyntax,
              "invalid property [" + std::string(raw) +
                  "], one of { default, kind, name, owner_class, read_only, value }");
}

bool IsPublicAttributeName(std::string_view name) {
  return !name.empty() && name.front() != '_';
}

AttributeRegistry::AttributeRegistry(std::string owner_class, core::logging::Logger* logger)
    : owner_class_(std::move(owner_class)), logger_(logger) {}

bool AttributeRegistry::CheckBoolean(std::string_view name, AttributeKind kind,
                                     AttributeValue& value, Error& error) const {
  if (kind != AttributeKind::kBoolean) {
    return true;
  }
  if (!value.has_value()) {
    if (logger_ != nullptr) {
      logger_->Warn("boolean attribute undefined, defaulting to 0",
                    {{"attr", name}});
    }
    value = "0";
    return true;
  }
  if (value.value() != "0" && value.value() != "1") {
    return Fail(error, ErrorCode::kInvalidKind,
                "attribute [" + std::string(name) + "] value is not boolean [" + value.value() +
                    "], try: { 0, 1 }");
  }
  return true;
}

bool AttributeRegistry::Define(std::string_view name, AttributeKind kind, AttributeValue value,
                               AttributeValue default_value, Error& error) {
  error.Clear();
  if (name.empty()) {
    return Fail(error, ErrorCode::kSyntax, "define requires an attribute name");
  }
  if (attributes_.find(name) != attributes_.end()) {
    return Fail(error, ErrorCode::kDuplicateAttribute,
                "attribute [" + std::string(name) + "] already exists");
  }
  if (kind == AttributeKind::kOpaqueHandle) {
    return Fail(error, ErrorCode::kInvalidKind,
                "attribute [" + std::string(name) + "] is a handle, use DefineHandle");
  }
  if (!CheckBoolean(name, kind, value, error) ||
      !CheckBoolean(name, kind, default_value, error)) {
    return false;
  }

  AttributeDescriptor descriptor;
  descriptor.name = std::string(name);
  descriptor.kind = kind;
  descriptor.value = std::move(value);
  descriptor.default_value = std::move(default_value);
  descriptor.owner_class = owner_class_;
  attributes_.emplace(descriptor.name, std::move(descriptor));

  if (logger_ != nullptr) {
    logger_->Trace("attribute defined", {{"attr", name}, {"kind", ToString(kind)}});
  }
  return true;
}

bool AttributeRegistry::Define(std::string_view name, std::string_view kind, AttributeValue value,
                               AttributeValue default_value, Error& error) {
  AttributeKind parsed = AttributeKind::kAny;
  if (!ParseAttributeKind(kind, parsed, error)) {
    return false;
  }
  return Define(name, parsed, std::move(value), std::move(default_value), error);
}

bool AttributeRegistry::DefineHandle(std::string_view name,
                                     std::shared_ptr<core::logging::Logger> handle,
                                     Error& error) {
  error.Clear();
  if (name.empty()) {
    return Fail(error, ErrorCode::kSyntax, "define requires an attribute name");
  }
  if (attributes_.find(name) != attributes_.end()) {
    return Fail(error, ErrorCode::kDuplicateAttribute,
                "attribute [" + std::string(name) + "] already exists");
  }

  AttributeDescriptor descriptor;
  descriptor.name = std::string(name);
  descriptor.kind = AttributeKind::kOpaqueHandle;
  descriptor.owner_class = owner_class_;
  descriptor.handle = std::move(handle);
  attributes_.emplace(descriptor.name, std::move(descriptor));
  return true;
}

bool AttributeRegistry::Has(std::string_view name) const {
  return attributes_.find(name) != attributes_.end();
}

const AttributeDescriptor* AttributeRegistry::Find(std::string_view name) const {
  const auto it = attributes_.find(name);
  if (it == attributes_.end()) {
    return nullptr;
  }
  return &it->second;
}

bool AttributeRegistry::Get(std::string_view name, AttributeValue& value, Error& error) const {
  return WithAttributeForRead(attributes_, name, error, [&](const AttributeDescriptor& attr) {
    value = attr.value;
    return true;
  });
}

bool AttributeRegistry::GetHandle(std::string_view name,
                                  std::shared_ptr<core::logging::Logger>& handle,
                                  Error& error) const {
  return WithAttributeForRead(attributes_, name, error, [&](const AttributeDescriptor& attr) {
    if (attr.kind != AttributeKind::kOpaqueHandle) {
      return Fail(error, ErrorCode::kInvalidKind,
                  "attribute [" + attr.name + "] is not a handle");
    }
    handle = attr.handle;
    return true;
  });
}

bool AttributeRegistry::Default(std::string_view name, AttributeValue& value,
                                Error& error) const {
  return WithAttributeForRead(attributes_, name, error, [&](const AttributeDescriptor& attr) {
    value = attr.default_value;
    return true;
  });
}

bool AttributeRegistry::Set(std::string_view name, AttributeValue value,
                            AttributeValue new_default, AttributeValue& applied, Error& error) {
  return WithAttributeForWrite(attributes_, name, error, [&](AttributeDescriptor& attr) {
    if (attr.read_only) {
      return Fail(error, ErrorCode::kReadOnlyViolation,
                  "attribute [" + attr.name + "] is read-only");
    }
    if (attr.kind == AttributeKind::kOpaqueHandle) {
      return Fail(error, ErrorCode::kInvalidKind,
                  "attribute [" + attr.name + "] is a handle and holds no value");
    }
    if (!CheckBoolean(attr.name, attr.kind, value, error)) {
      return false;
    }
    const bool replace_default = new_default.has_value();
    if (replace_default && !CheckBoolean(attr.name, attr.kind, new_default, error)) {
      return false;
    }

    attr.value = std::move(value);
    if (replace_default) {
      attr.default_value = std::move(new_default);
    }
    applied = attr.value;
    return true;
  });
}

bool AttributeRegistry::Set(std::string_view name, AttributeValue value, Error& error) {
  AttributeValue applied;
  return Set(name, std::move(value), std::nullopt, applied, error);
}

bool AttributeRegistry::Reset(std::string_view name, Error& error) {
  return WithAttributeForWrite(attributes_, name, error, [](AttributeDescriptor& attr) {
    attr.value = attr.default_value;
    return true;
  });
}

std::size_t AttributeRegistry::ResetAll() {
  for (auto& [_, attr] : attributes_) {
    attr.value = attr.default_value;
  }
  return attributes_.size();
}

bool AttributeRegistry::Sync(std::string_view name, Error& error) {
  return WithAttributeForWrite(attributes_, name, error, [](AttributeDescriptor& attr) {
    attr.default_value = attr.value;
    return true;
  });
}

std::size_t AttributeRegistry::SyncAll() {
  for (auto& [_, attr] : attributes_) {
    attr.default_value = attr.value;
  }
  return attributes_.size();
}

bool AttributeRegistry::SetReadOnlyFlag(const std::vector<std::string>& names, bool read_only,
                                        std::size_t& count, Error& error) {
  error.Clear();
  count = 0;
  if (names.empty()) {
    return Fail(error, ErrorCode::kSyntax,
                std::string(read_only ? "ro" : "rw") + " requires at least one attribute name");
  }
  for (const std::string& name : names) {
    if (!Has(name)) {
      return Fail(error, ErrorCode::kUnknownAttribute, "attribute [" + name + "] does not exist");
    }
  }

  for (const std::string& name : names) {
    attributes_.find(name)->second.read_only = read_only;
    ++count;
  }
  return true;
}

bool AttributeRegistry::MarkReadOnly(const std::vector<std::string>& names, std::size_t& count,
                                     Error& error) {
  return SetReadOnlyFlag(names, true, count, error);
}

bool AttributeRegistry::MarkReadWrite(const std::vector<std::string>& names, std::size_t& count,
                                      Error& error) {
  return SetReadOnlyFlag(names, false, count, error);
}

std::size_t AttributeRegistry::MarkReadOnlyAll() {
  for (auto& [_, attr] : attributes_) {
    attr.read_only = true;
  }
  return attributes_.size();
}

std::size_t AttributeRegistry::MarkReadWriteAll() {
  for (auto& [_, attr] : attributes_) {
    attr.read_only = false;
  }
  return attributes_.size();
}

bool AttributeRegistry::Prop(std::string_view name, AttributeField field, AttributeValue& out,
                             Error& error) const {
  return WithAttributeForRead(attributes_, name, error, [&](const AttributeDescriptor& attr) {
    switch (field) {
    case AttributeField::kOwnerClass:
      out = attr.owner_class;
      break;
    case AttributeField::kDefault:
      out = attr.default_value;
      break;
    case AttributeField::kName:
      out = attr.name;
      break;
    case AttributeField::kReadOnly:
      out = BoolText(attr.read_only);
      break;
    case AttributeField::kKind:
      out = std::string(ToString(attr.kind));
      break;
    case AttributeField::kValue:
      out = attr.value;
      break;
    }
    return true;
  });
}

bool AttributeRegistry::Prop(std::string_view name, std::string_view field, AttributeValue& out,
                             Error& error) const {
  if (!Has(name)) {
    return Fail(error, ErrorCode::kUnknownAttribute,
                "attribute [" + std::string(name) + "] does not exist");
  }
  AttributeField parsed = AttributeField::kValue;
  if (!ParseAttributeField(field, parsed, error)) {
    return false;
  }
  return Prop(name, parsed, out, error);
}

bool AttributeRegistry::Remove(std::string_view name, AttributeDescriptor& removed,
                               Error& error) {
  error.Clear();
  auto it = attributes_.find(name);
  if (it == attributes_.end()) {
    return Fail(error, ErrorCode::kUnknownAttribute,
                "attribute [" + std::string(name) + "] does not exist");
  }
  removed = std::move(it->second);
  attributes_.erase(it);

  if (logger_ != nullptr) {
    logger_->Debug("attribute removed", {{"attr", name}});
  }
  return true;
}

std::vector<std::string> AttributeRegistry::List(bool verbose) const {
  std::vector<std::string> names;
  for (const auto& [name, _] : attributes_) {
    if (IsPublicAttributeName(name)) {
      names.push_back(name);
    }
  }
  if (verbose) {
    Tabulate();
  }
  return names;
}

std::vector<std::string> AttributeRegistry::Names() const {
  std::vector<std::string> names;
  names.reserve(attributes_.size());
  for (const auto& [name, _] : attributes_) {
    names.push_back(name);
  }
  return names;
}

void AttributeRegistry::CaptureInheritable() {
  inheritable_ = List();
}

void AttributeRegistry::Tabulate() const {
  if (logger_ == nullptr) {
    return;
  }

  std::vector<core::TableRecord> records;
  records.reserve(attributes_.size());
  for (const auto& [name, attr] : attributes_) {
    core::TableRecord record;
    record["name"] = attr.name;
    record["kind"] = std::string(ToString(attr.kind));
    record["owner_class"] = attr.owner_class;
    record["read_only"] = BoolText(attr.read_only);
    if (attr.kind == AttributeKind::kOpaqueHandle) {
      record["value"] = attr.handle ? std::string("(handle)") : std::string("(null)");
      record["default"] = record["value"];
    } else {
      record["value"] = attr.value;
      record["default"] = attr.default_value;
    }
    records.push_back(std::move(record));
  }

  for (const std::string& line : core::Tabulate(records, "name")) {
    logger_->Info(line);
  }
}

} // namespace batchexec::attributes
