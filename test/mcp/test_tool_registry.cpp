#include <catch2/catch_test_macros.hpp>

#include <apktool_mcp/mcp/tool_registry.hpp>

#include <stdexcept>
#include <string>

using namespace apktool_mcp;

namespace {

ToolHandler Noop() {
    return [](const ToolArguments&, JobHandle&) -> Result<ToolOutput, Error> {
        return Result<ToolOutput, Error>::Ok(ToolOutput{"ok", nullptr});
    };
}

ToolRegistry MakeTestRegistry() {
    ToolRegistry registry;
    registry.Register(
        {"decode_apk",
         "Decode an APK",
         {{"apk_path", ParameterType::String, true, "APK to decode", std::nullopt},
          {"force", ParameterType::Boolean, false, "Overwrite", ArgumentValue{false}},
          {"max_results", ParameterType::Integer, false, "Limit",
           ArgumentValue{std::int64_t{50}}},
          {"locale", ParameterType::String, false, "Locale", std::nullopt}},
         "decoded directory"},
        Noop());
    return registry;
}

} // anonymous namespace

// ===========================================================================
// Register / lookup
// ===========================================================================

TEST_CASE("ToolRegistry: register and find", "[mcp][registry]") {
    auto registry = MakeTestRegistry();
    CHECK(registry.HasTool("decode_apk"));
    CHECK_FALSE(registry.HasTool("build_apk"));
    REQUIRE(registry.Find("decode_apk") != nullptr);
    CHECK(registry.Find("decode_apk")->FindParameter("force") != nullptr);
    CHECK(registry.Find("decode_apk")->FindParameter("nope") == nullptr);
    CHECK(registry.FindHandler("decode_apk") != nullptr);
    CHECK(registry.FindHandler("build_apk") == nullptr);
    CHECK(registry.Descriptors().size() == 1);
}

TEST_CASE("ToolRegistry: duplicate and empty registrations throw", "[mcp][registry]") {
    auto registry = MakeTestRegistry();
    CHECK_THROWS_AS(registry.Register({"decode_apk", "again", {}, ""}, Noop()),
                    std::invalid_argument);
    CHECK_THROWS_AS(registry.Register({"", "nameless", {}, ""}, Noop()),
                    std::invalid_argument);
    CHECK_THROWS_AS(registry.Register({"no_handler", "x", {}, ""}, ToolHandler{}),
                    std::invalid_argument);
}

// ===========================================================================
// Validate
// ===========================================================================

TEST_CASE("Validate: defaults fill absent optional parameters", "[mcp][registry]") {
    auto registry = MakeTestRegistry();
    auto r = registry.Validate("decode_apk", {{"apk_path", "demo.apk"}});
    REQUIRE(r.IsOk());
    const auto& args = r.Value();
    CHECK(args.GetString("apk_path") == std::string("demo.apk"));
    CHECK(args.Has("force"));
    CHECK_FALSE(args.GetBool("force", true));
    CHECK(args.GetInt("max_results", 0) == 50);
    CHECK_FALSE(args.Has("locale"));
    CHECK_FALSE(args.GetString("locale").has_value());
}

TEST_CASE("Validate: coerces compatible values", "[mcp][registry]") {
    auto registry = MakeTestRegistry();
    auto r = registry.Validate(
        "decode_apk",
        {{"apk_path", 123}, {"force", "true"}, {"max_results", "7"}, {"locale", nullptr}});
    REQUIRE(r.IsOk());
    CHECK(r.Value().GetString("apk_path") == std::string("123"));
    CHECK(r.Value().GetBool("force"));
    CHECK(r.Value().GetInt("max_results", 0) == 7);
    CHECK_FALSE(r.Value().Has("locale"));

    auto whole_float = registry.Validate("decode_apk", {{"apk_path", "a"}, {"max_results", 5.0}});
    REQUIRE(whole_float.IsOk());
    CHECK(whole_float.Value().GetInt("max_results", 0) == 5);
}

TEST_CASE("Validate: schema errors", "[mcp][registry]") {
    auto registry = MakeTestRegistry();

    SECTION("unknown tool") {
        auto r = registry.Validate("nope", nlohmann::json::object());
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::Schema);
        CHECK(r.Error().message == "Unknown tool: nope");
    }
    SECTION("missing required") {
        auto r = registry.Validate("decode_apk", nullptr);
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "Missing required parameter: apk_path");
    }
    SECTION("wrong type") {
        auto r = registry.Validate("decode_apk", {{"apk_path", "a"}, {"force", "yes"}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::Schema);
        CHECK(r.Error().message == "Parameter 'force' must be of type boolean");
    }
    SECTION("fractional integer") {
        auto r = registry.Validate("decode_apk", {{"apk_path", "a"}, {"max_results", 2.5}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().message.find("integer") != std::string::npos);
    }
    SECTION("object as string") {
        auto r = registry.Validate("decode_apk", {{"apk_path", {{"x", 1}}}});
        REQUIRE(r.IsErr());
        CHECK(r.Error().category == ErrorCategory::Schema);
    }
    SECTION("arguments not an object") {
        auto r = registry.Validate("decode_apk", nlohmann::json::array({1, 2}));
        REQUIRE(r.IsErr());
        CHECK(r.Error().message == "arguments must be a JSON object");
    }
}

TEST_CASE("Validate: unknown parameter", "[mcp][registry]") {
    auto registry = MakeTestRegistry();
    auto r = registry.Validate("decode_apk", {{"apk_path", "a"}, {"frobnicate", true}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::UnknownParameter);
    CHECK(r.Error().message == "Unknown parameter: frobnicate");
}

// ===========================================================================
// InputSchema
// ===========================================================================

TEST_CASE("InputSchema: properties, required and defaults", "[mcp][registry]") {
    auto registry = MakeTestRegistry();
    auto schema = ToolRegistry::InputSchema(*registry.Find("decode_apk"));

    CHECK(schema["type"] == "object");
    CHECK(schema["additionalProperties"] == false);
    CHECK(schema["required"] == nlohmann::json::array({"apk_path"}));
    CHECK(schema["properties"]["apk_path"]["type"] == "string");
    CHECK(schema["properties"]["force"]["type"] == "boolean");
    CHECK(schema["properties"]["force"]["default"] == false);
    CHECK(schema["properties"]["max_results"]["type"] == "integer");
    CHECK(schema["properties"]["max_results"]["default"] == 50);
    CHECK_FALSE(schema["properties"]["locale"].contains("default"));
}

TEST_CASE("ParameterTypeName", "[mcp][registry]") {
    CHECK(std::string(ParameterTypeName(ParameterType::Integer)) == "integer");
    CHECK(std::string(ParameterTypeName(ParameterType::Boolean)) == "boolean");
}
