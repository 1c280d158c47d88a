#ifndef BATCHEXEC_ATTRIBUTES_ATTRIBUTE_REGISTRY_HPP_
#define BATCHEXEC_ATTRIBUTES_ATTRIBUTE_REGISTRY_HPP_

#include "core/errors/error.hpp"
#include "core/logging/logger.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace batchexec::attributes {

// Value shape an attribute is constrained to.
enum class AttributeKind {
  kAny = 0,
  kBoolean,
  kOpaqueHandle,
};

// Metadata fields readable through AttributeRegistry::Prop.
enum class AttributeField {
  kOwnerClass = 0,
  kDefault,
  kName,
  kReadOnly,
  kKind,
  kValue,
};

// Attribute values are strings; std::nullopt means "unset".
using AttributeValue = std::optional<std::string>;

const char* ToString(AttributeKind kind);
const char* ToString(AttributeField field);

// Accepts "any", "bool"/"boolean" and "handle". Anything else is kInvalidKind.
bool ParseAttributeKind(std::string_view raw, AttributeKind& kind, core::errors::Error& error);
bool ParseAttributeField(std::string_view raw, AttributeField& field, core::errors::Error& error);

// Names starting with '_' are private: excluded from List and from the
// inheritable set.
bool IsPublicAttributeName(std::string_view name);

struct AttributeDescriptor {
  std::string name;
  AttributeKind kind = AttributeKind::kAny;
  AttributeValue value;
  AttributeValue default_value;
  bool read_only = false;
  std::string owner_class;
  // Populated only for kOpaqueHandle attributes.
  std::shared_ptr<core::logging::Logger> handle;
};

// Per-object store of named, typed attributes with separate current/default
// values and a read-only flag.
//
// Contract:
// - every operation validates fully before mutating; a false return leaves the
//   registry exactly as it was
// - read-only gates only Set; Reset/Sync/Remove bypass it
// - boolean attributes hold "0" or "1"; an unset boolean becomes "0" with a
//   warning rather than failing
class AttributeRegistry {
public:
  explicit AttributeRegistry(std::string owner_class, core::logging::Logger* logger = nullptr);

  const std::string& OwnerClass() const {
    return owner_class_;
  }

  bool Define(std::string_view name, AttributeKind kind, AttributeValue value,
              AttributeValue default_value, core::errors::Error& error);
  bool Define(std::string_view name, std::string_view kind, AttributeValue value,
              AttributeValue default_value, core::errors::Error& error);
  bool DefineHandle(std::string_view name, std::shared_ptr<core::logging::Logger> handle,
                    core::errors::Error& error);

  bool Has(std::string_view name) const;
  const AttributeDescriptor* Find(std::string_view name) const;

  bool Get(std::string_view name, AttributeValue& value, core::errors::Error& error) const;
  bool GetHandle(std::string_view name, std::shared_ptr<core::logging::Logger>& handle,
                 core::errors::Error& error) const;
  bool Default(std::string_view name, AttributeValue& value, core::errors::Error& error) const;

  // Updates the current value. When `new_default` holds a value the default is
  // replaced as well. `applied` receives the stored value after coercion.
  bool Set(std::string_view name, AttributeValue value, AttributeValue new_default,
           AttributeValue& applied, core::errors::Error& error);
  bool Set(std::string_view name, AttributeValue value, core::errors::Error& error);

  bool Reset(std::string_view name, core::errors::Error& error);
  std::size_t ResetAll();
  bool Sync(std::string_view name, core::errors::Error& error);
  std::size_t SyncAll();

  // Bulk read-only toggles. Count includes names already in the target state.
  bool MarkReadOnly(const std::vector<std::string>& names, std::size_t& count,
                    core::errors::Error& error);
  bool MarkReadWrite(const std::vector<std::string>& names, std::size_t& count,
                     core::errors::Error& error);
  std::size_t MarkReadOnlyAll();
  std::size_t MarkReadWriteAll();

  bool Prop(std::string_view name, AttributeField field, AttributeValue& out,
            core::errors::Error& error) const;
  bool Prop(std::string_view name, std::string_view field, AttributeValue& out,
            core::errors::Error& error) const;

  bool Remove(std::string_view name, AttributeDescriptor& removed, core::errors::Error& error);

  // Sorted public names. With `verbose`, also tabulates every descriptor
  // through the logger at info level.
  std::vector<std::string> List(bool verbose = false) const;

  // Sorted names of every defined attribute, private ones included.
  std::vector<std::string> Names() const;

  // Snapshots the current public names as the inheritable set.
  void CaptureInheritable();
  const std::vector<std::string>& Inheritable() const {
    return inheritable_;
  }

private:
  bool SetReadOnlyFlag(const std::vector<std::string>& names, bool read_only, std::size_t& count,
                       core::errors::Error& error);
  bool CheckBoolean(std::string_view name, AttributeKind kind, AttributeValue& value,
                    core::errors::Error& error) const;
  void Tabulate() const;

  std::string owner_class_;
  core::logging::Logger* logger_ = nullptr;
  std::map<std::string, AttributeDescriptor, std::less<>> attributes_;
  std::vector<std::string> inheritable_;
};

} // namespace batchexec::attributes

#endif // BATCHEXEC_ATTRIBUTES_ATTRIBUTE_REGISTRY_HPP_
