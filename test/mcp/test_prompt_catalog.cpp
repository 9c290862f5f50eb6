#include <catch2/catch_test_macros.hpp>

#include <apktool_mcp/mcp/prompt_catalog.hpp>

#include <string>

using namespace apktool_mcp;

TEST_CASE("RenderTemplate: substitutes known keys only", "[mcp][prompts]") {
    CHECK(RenderTemplate("APK: {{apk_path}} ({{apk_path}})", {{"apk_path", "a.apk"}}) ==
          "APK: a.apk (a.apk)");
    CHECK(RenderTemplate("keep {{other}}", {{"apk_path", "a.apk"}}) == "keep {{other}}");
    CHECK(RenderTemplate("open {{never closed", {}) == "open {{never closed");
    CHECK(RenderTemplate("", {}).empty());
}

TEST_CASE("PromptCatalog::Default: the three workflows", "[mcp][prompts]") {
    auto catalog = PromptCatalog::Default();
    REQUIRE(catalog.List().size() == 3);
    CHECK(catalog.Find("analyze_security") != nullptr);
    CHECK(catalog.Find("privacy_audit") != nullptr);
    const auto* guide = catalog.Find("reverse_engineer_guide");
    REQUIRE(guide != nullptr);
    REQUIRE(guide->arguments.size() == 2);
    CHECK(guide->arguments[0].required);
    CHECK_FALSE(guide->arguments[1].required);
    CHECK(catalog.Find("nope") == nullptr);
}

TEST_CASE("PromptCatalog::Get: renders the apk path", "[mcp][prompts]") {
    auto catalog = PromptCatalog::Default();
    auto r = catalog.Get("analyze_security", {{"apk_path", "apps/bank.apk"}});
    REQUIRE(r.IsOk());
    CHECK(r.Value().text.find("APK file: apps/bank.apk") != std::string::npos);
    CHECK(r.Value().text.find("{{") == std::string::npos);
    CHECK(r.Value().description == "APK analysis prompt for analyze_security");
}

TEST_CASE("PromptCatalog::Get: optional argument default", "[mcp][prompts]") {
    auto catalog = PromptCatalog::Default();

    auto defaulted = catalog.Get("reverse_engineer_guide", {{"apk_path", "a.apk"}});
    REQUIRE(defaulted.IsOk());
    CHECK(defaulted.Value().text.find("Target analysis: general functionality") !=
          std::string::npos);

    auto given = catalog.Get("reverse_engineer_guide",
                             {{"apk_path", "a.apk"}, {"target_feature", "license check"}});
    REQUIRE(given.IsOk());
    CHECK(given.Value().text.find("Target analysis: license check") != std::string::npos);
}

TEST_CASE("PromptCatalog::Get: errors", "[mcp][prompts]") {
    auto catalog = PromptCatalog::Default();

    auto unknown = catalog.Get("nope", {});
    REQUIRE(unknown.IsErr());
    CHECK(unknown.Error().category == ErrorCategory::NotFound);
    CHECK(unknown.Error().operation == "prompts/get");

    auto missing = catalog.Get("privacy_audit", {});
    REQUIRE(missing.IsErr());
    CHECK(missing.Error().category == ErrorCategory::Schema);
    CHECK(missing.Error().message == "Missing required argument: apk_path");

    auto empty = catalog.Get("privacy_audit", {{"apk_path", ""}});
    CHECK(empty.IsErr());
}
