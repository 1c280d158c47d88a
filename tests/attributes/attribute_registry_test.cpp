#include "attributes/attribute_registry.hpp"

#include <catch2/catch.hpp>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

using batchexec::attributes::AttributeDescriptor;
using batchexec::attributes::AttributeField;
using batchexec::attributes::AttributeKind;
using batchexec::attributes::AttributeRegistry;
using batchexec::attributes::AttributeValue;
using batchexec::core::errors::Error;
using batchexec::core::errors::ErrorCode;

TEST_CASE("Boolean attribute set and reset round through its default", "[attributes]") {
  AttributeRegistry registry("Job");
  Error error;

  REQUIRE(registry.Define("retries", AttributeKind::kBoolean, std::string("1"), std::string("1"),
                          error));

  AttributeValue value;
  REQUIRE(registry.Get("retries", value, error));
  REQUIRE(value == AttributeValue("1"));

  REQUIRE(registry.Set("retries", std::string("0"), error));
  REQUIRE(registry.Get("retries", value, error));
  REQUIRE(value == AttributeValue("0"));

  REQUIRE(registry.Reset("retries", error));
  REQUIRE(registry.Get("retries", value, error));
  REQUIRE(value == AttributeValue("1"));
}

TEST_CASE("Read-only attribute rejects set and re-marking is a no-op", "[attributes]") {
  AttributeRegistry registry("Job");
  Error error;
  REQUIRE(registry.Define("locked", AttributeKind::kAny, std::string("v"), std::nullopt, error));

  std::size_t count = 0;
  REQUIRE(registry.MarkReadOnly({"locked"}, count, error));
  REQUIRE(count == 1U);

  REQUIRE_FALSE(registry.Set("locked", std::string("x"), error));
  REQUIRE(error.code == ErrorCode::kReadOnlyViolation);

  AttributeValue value;
  REQUIRE(registry.Get("locked", value, error));
  REQUIRE(value == AttributeValue("v"));

  REQUIRE(registry.MarkReadOnly({"locked"}, count, error));
  REQUIRE(count == 1U);
}

TEST_CASE("Define rejects duplicates, empty names and unknown kinds", "[attributes]") {
  AttributeRegistry registry("Job");
  Error error;
  REQUIRE(registry.Define("name", AttributeKind::kAny, std::string("a"), std::nullopt, error));

  REQUIRE_FALSE(registry.Define("name", AttributeKind::kAny, std::string("b"), std::nullopt,
                                error));
  REQUIRE(error.code == ErrorCode::kDuplicateAttribute);

  AttributeValue value;
  REQUIRE(registry.Get("name", value, error));
  REQUIRE(value == AttributeValue("a"));

  REQUIRE_FALSE(registry.Define("", AttributeKind::kAny, std::nullopt, std::nullopt, error));
  REQUIRE(error.code == ErrorCode::kSyntax);

  REQUIRE_FALSE(registry.Define("other", "float", std::nullopt, std::nullopt, error));
  REQUIRE(error.code == ErrorCode::kInvalidKind);
  REQUIRE_FALSE(registry.Has("other"));

  REQUIRE(registry.Define("flag", "boolean", std::string("0"), std::nullopt, error));
  AttributeValue kind;
  REQUIRE(registry.Prop("flag", AttributeField::kKind, kind, error));
  REQUIRE(kind == AttributeValue("bool"));
}

TEST_CASE("Boolean attributes only hold 0 or 1", "[attributes]") {
  std::ostringstream sink;
  batchexec::core::logging::Logger logger(batchexec::core::logging::LogLevel::kWarn, sink);
  AttributeRegistry registry("Job", &logger);
  Error error;

  REQUIRE_FALSE(registry.Define("echo", AttributeKind::kBoolean, std::string("yes"),
                                std::nullopt, error));
  REQUIRE(error.code == ErrorCode::kInvalidKind);

  REQUIRE(registry.Define("echo", AttributeKind::kBoolean, std::nullopt, std::nullopt, error));
  AttributeValue value;
  REQUIRE(registry.Get("echo", value, error));
  REQUIRE(value == AttributeValue("0"));
  REQUIRE(sink.str().find("boolean attribute undefined") != std::string::npos);

  REQUIRE_FALSE(registry.Set("echo", std::string("2"), error));
  REQUIRE(error.code == ErrorCode::kInvalidKind);
  REQUIRE(registry.Get("echo", value, error));
  REQUIRE(value == AttributeValue("0"));
}

TEST_CASE("Unknown attribute access fails without side effects", "[attributes]") {
  AttributeRegistry registry("Job");
  Error error;
  AttributeValue value;

  REQUIRE_FALSE(registry.Get("missing", value, error));
  REQUIRE(error.code == ErrorCode::kUnknownAttribute);
  REQUIRE_FALSE(registry.Set("missing", std::string("x"), error));
  REQUIRE(error.code == ErrorCode::kUnknownAttribute);
  REQUIRE_FALSE(registry.Reset("missing", error));
  REQUIRE_FALSE(registry.Sync("missing", error));

  AttributeDescriptor removed;
  REQUIRE_FALSE(registry.Remove("missing", removed, error));
  REQUIRE(error.code == ErrorCode::kUnknownAttribute);
  REQUIRE(registry.Names().empty());
}

TEST_CASE("Set can replace the default alongside the value", "[attributes]") {
  AttributeRegistry registry("Job");
  Error error;
  REQUIRE(registry.Define("dir", AttributeKind::kAny, std::string("/a"), std::string("/a"),
                          error));

  AttributeValue applied;
  REQUIRE(registry.Set("dir", std::string("/b"), std::string("/c"), applied, error));
  REQUIRE(applied == AttributeValue("/b"));

  AttributeValue value;
  REQUIRE(registry.Default("dir", value, error));
  REQUIRE(value == AttributeValue("/c"));

  REQUIRE(registry.Reset("dir", error));
  REQUIRE(registry.Get("dir", value, error));
  REQUIRE(value == AttributeValue("/c"));

  REQUIRE(registry.Set("dir", std::nullopt, error));
  REQUIRE(registry.Get("dir", value, error));
  REQUIRE_FALSE(value.has_value());
}

TEST_CASE("Sync copies current values into defaults", "[attributes]") {
  AttributeRegistry registry("Job");
  Error error;
  REQUIRE(registry.Define("a", AttributeKind::kAny, std::string("1"), std::nullopt, error));
  REQUIRE(registry.Define("_hidden", AttributeKind::kAny, std::string("2"), std::nullopt, error));

  REQUIRE(registry.SyncAll() == 2U);
  AttributeValue value;
  REQUIRE(registry.Default("_hidden", value, error));
  REQUIRE(value == AttributeValue("2"));

  REQUIRE(registry.Set("a", std::string("9"), error));
  REQUIRE(registry.Sync("a", error));
  REQUIRE(registry.Set("a", std::string("10"), error));
  REQUIRE(registry.ResetAll() == 2U);
  REQUIRE(registry.Get("a", value, error));
  REQUIRE(value == AttributeValue("9"));
}

TEST_CASE("Bulk read-only toggles are all or nothing", "[attributes]") {
  AttributeRegistry registry("Job");
  Error error;
  REQUIRE(registry.Define("a", AttributeKind::kAny, std::nullopt, std::nullopt, error));
  REQUIRE(registry.Define("b", AttributeKind::kAny, std::nullopt, std::nullopt, error));

  std::size_t count = 0;
  REQUIRE_FALSE(registry.MarkReadOnly({"a", "missing"}, count, error));
  REQUIRE(error.code == ErrorCode::kUnknownAttribute);
  REQUIRE(count == 0U);
  REQUIRE(registry.Find("a")->read_only == false);

  REQUIRE_FALSE(registry.MarkReadOnly({}, count, error));
  REQUIRE(error.code == ErrorCode::kSyntax);

  REQUIRE(registry.MarkReadOnlyAll() == 2U);
  REQUIRE(registry.Find("b")->read_only);

  REQUIRE(registry.MarkReadWrite({"b"}, count, error));
  REQUIRE(count == 1U);
  REQUIRE(registry.Set("b", std::string("ok"), error));
  REQUIRE(registry.MarkReadWriteAll() == 2U);
}

TEST_CASE("Read-only does not gate reset or remove", "[attributes]") {
  AttributeRegistry registry("Job");
  Error error;
  REQUIRE(registry.Define("a", AttributeKind::kAny, std::string("now"), std::string("before"),
                          error));
  REQUIRE(registry.MarkReadOnlyAll() == 1U);

  REQUIRE(registry.Reset("a", error));
  AttributeValue value;
  REQUIRE(registry.Get("a", value, error));
  REQUIRE(value == AttributeValue("before"));

  AttributeDescriptor removed;
  REQUIRE(registry.Remove("a", removed, error));
  REQUIRE(removed.name == "a");
  REQUIRE(removed.read_only);
  REQUIRE_FALSE(registry.Has("a"));
}

TEST_CASE("Prop reports every metadata field", "[attributes]") {
  AttributeRegistry registry("batchexec::Executive");
  Error error;
  REQUIRE(registry.Define("leader", AttributeKind::kAny, std::string("#"), std::string(";"),
                          error));

  AttributeValue out;
  REQUIRE(registry.Prop("leader", "owner_class", out, error));
  REQUIRE(out == AttributeValue("batchexec::Executive"));
  REQUIRE(registry.Prop("leader", "default", out, error));
  REQUIRE(out == AttributeValue(";"));
  REQUIRE(registry.Prop("leader", "value", out, error));
  REQUIRE(out == AttributeValue("#"));
  REQUIRE(registry.Prop("leader", "name", out, error));
  REQUIRE(out == AttributeValue("leader"));
  REQUIRE(registry.Prop("leader", "read_only", out, error));
  REQUIRE(out == AttributeValue("0"));

  REQUIRE_FALSE(registry.Prop("leader", "colour", out, error));
  REQUIRE(error.code == ErrorCode::kSyntax);
  REQUIRE_FALSE(registry.Prop("missing", "value", out, error));
  REQUIRE(error.code == ErrorCode::kUnknownAttribute);
}

TEST_CASE("List returns sorted public names only", "[attributes]") {
  AttributeRegistry registry("Job");
  Error error;
  for (const char* name : {"zeta", "_private", "alpha", "mid"}) {
    REQUIRE(registry.Define(name, AttributeKind::kAny, std::nullopt, std::nullopt, error));
  }

  REQUIRE(registry.List() == std::vector<std::string>{"alpha", "mid", "zeta"});
  REQUIRE(registry.Names() == std::vector<std::string>{"_private", "alpha", "mid", "zeta"});

  registry.CaptureInheritable();
  REQUIRE(registry.Define("late", AttributeKind::kAny, std::nullopt, std::nullopt, error));
  REQUIRE(registry.Inheritable() == std::vector<std::string>{"alpha", "mid", "zeta"});
}

TEST_CASE("Verbose list tabulates descriptors through the logger", "[attributes]") {
  std::ostringstream sink;
  batchexec::core::logging::Logger logger(batchexec::core::logging::LogLevel::kInfo, sink);
  AttributeRegistry registry("Job", &logger);
  Error error;
  REQUIRE(registry.Define("leader", AttributeKind::kAny, std::string("#"), std::nullopt, error));

  REQUIRE(registry.List(true) == std::vector<std::string>{"leader"});
  const std::string logged = sink.str();
  REQUIRE(logged.find("owner_class") != std::string::npos);
  REQUIRE(logged.find("(undef)") != std::string::npos);
}

TEST_CASE("Handle attributes hold a logger and refuse values", "[attributes]") {
  AttributeRegistry registry("Job");
  Error error;
  auto logger = std::make_shared<batchexec::core::logging::Logger>();

  REQUIRE_FALSE(registry.Define("log", AttributeKind::kOpaqueHandle, std::nullopt, std::nullopt,
                                error));
  REQUIRE(error.code == ErrorCode::kInvalidKind);

  REQUIRE(registry.DefineHandle("log", logger, error));
  std::shared_ptr<batchexec::core::logging::Logger> handle;
  REQUIRE(registry.GetHandle("log", handle, error));
  REQUIRE(handle == logger);

  REQUIRE_FALSE(registry.Set("log", std::string("x"), error));
  REQUIRE(error.code == ErrorCode::kInvalidKind);

  REQUIRE(registry.Define("plain", AttributeKind::kAny, std::nullopt, std::nullopt, error));
  REQUIRE_FALSE(registry.GetHandle("plain", handle, error));
  REQUIRE(error.code == ErrorCode::kInvalidKind);
}
