#include <catch2/catch_test_macros.hpp>

#include <apktool_mcp/core/result.hpp>

#include <memory>
#include <string>
#include <utility>

using namespace apktool_mcp;

// ===========================================================================
// Result<T, E>
// ===========================================================================

TEST_CASE("Result: Ok result holds value", "[result]") {
    auto r = Result<int, std::string>::Ok(42);
    REQUIRE(r.IsOk());
    REQUIRE_FALSE(r.IsErr());
    CHECK(static_cast<bool>(r));
    CHECK(r.Value() == 42);
}

TEST_CASE("Result: Err result holds error", "[result]") {
    auto r = Result<int, std::string>::Err("apktool missing");
    REQUIRE(r.IsErr());
    CHECK_FALSE(static_cast<bool>(r));
    CHECK(r.Error() == "apktool missing");
}

TEST_CASE("Result: move-only value can be moved out", "[result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(3));
    auto ptr = std::move(r).Value();
    REQUIRE(ptr != nullptr);
    CHECK(*ptr == 3);
}

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, Error>::Ok();
    CHECK(ok.IsOk());
    auto err = Result<void, Error>::Err(
        Error::Make(ErrorCategory::Config, "ConfigLoader", "timeout must be positive"));
    REQUIRE(err.IsErr());
    CHECK(err.Error().category == ErrorCategory::Config);
}

// ===========================================================================
// ErrorCategory
// ===========================================================================

TEST_CASE("CategoryName: stable wire names", "[error]") {
    CHECK(std::string(CategoryName(ErrorCategory::Schema)) == "schema_error");
    CHECK(std::string(CategoryName(ErrorCategory::UnknownParameter)) == "unknown_parameter");
    CHECK(std::string(CategoryName(ErrorCategory::PathEscape)) == "path_escape");
    CHECK(std::string(CategoryName(ErrorCategory::ExternalTool)) == "external_tool_error");
    CHECK(std::string(CategoryName(ErrorCategory::Timeout)) == "timed_out");
    CHECK(std::string(CategoryName(ErrorCategory::UnsupportedResource)) ==
          "unsupported_resource");
    CHECK(std::string(CategoryName(ErrorCategory::NotFound)) == "not_found");
    CHECK(std::string(CategoryName(ErrorCategory::Config)) == "config_error");
    CHECK(std::string(CategoryName(ErrorCategory::Internal)) == "internal");
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: default category is Internal", "[error]") {
    Error e;
    CHECK(e.category == ErrorCategory::Internal);
    CHECK(e.CategoryName() == "internal");
}

TEST_CASE("Error: Make fills the fields", "[error]") {
    auto e = Error::Make(ErrorCategory::PathEscape, "decode_apk", "path escapes the workspace",
                         "../etc/passwd");
    CHECK(e.category == ErrorCategory::PathEscape);
    CHECK(e.operation == "decode_apk");
    CHECK(e.path == "../etc/passwd");
    CHECK(e.message == "path escapes the workspace");
    CHECK_FALSE(e.exit_code.has_value());
    CHECK_FALSE(e.detail.has_value());
}

TEST_CASE("Error: ToString includes path, exit code and detail", "[error]") {
    auto e = Error::FromExternalTool("decode_apk", "/ws/app.apk", 1,
                                     "Exception in thread \"main\" brut.AndrolibException");
    auto s = e.ToString();
    CHECK(s.find("decode_apk") != std::string::npos);
    CHECK(s.find("/ws/app.apk") != std::string::npos);
    CHECK(s.find("exit 1") != std::string::npos);
    CHECK(s.find("AndrolibException") != std::string::npos);
}

TEST_CASE("Error: ToString without optional fields", "[error]") {
    auto e = Error::Make(ErrorCategory::Schema, "tools/call", "bad arguments");
    auto s = e.ToString();
    CHECK(s == "tools/call: bad arguments");
}

TEST_CASE("FromExternalTool: keeps only the tail of stderr", "[error]") {
    std::string stderr_text;
    for (int i = 0; i < 100; ++i) {
        stderr_text += "line " + std::to_string(i) + "\n";
    }
    auto e = Error::FromExternalTool("build_apk", "", 2, stderr_text);
    CHECK(e.category == ErrorCategory::ExternalTool);
    REQUIRE(e.exit_code.has_value());
    CHECK(*e.exit_code == 2);
    REQUIRE(e.detail.has_value());
    CHECK(e.detail->find("line 99") != std::string::npos);
    CHECK(e.detail->find("line 0\n") == std::string::npos);
    CHECK(e.detail->find("earlier lines omitted") != std::string::npos);
}

TEST_CASE("FromExternalTool: empty stderr leaves no detail", "[error]") {
    auto e = Error::FromExternalTool("build_apk", "", 1, "\n\n");
    CHECK_FALSE(e.detail.has_value());
}

TEST_CASE("Error: ToJson contains the category and optional fields", "[error]") {
    auto e = Error::FromExternalTool("decode_apk", "/ws/a.apk", 1, "boom");
    auto json = e.ToJson();
    CHECK(json.find("{\"error\":{") == 0);
    CHECK(json.find("\"category\":\"external_tool_error\"") != std::string::npos);
    CHECK(json.find("\"operation\":\"decode_apk\"") != std::string::npos);
    CHECK(json.find("\"path\":\"/ws/a.apk\"") != std::string::npos);
    CHECK(json.find("\"exit_code\":1") != std::string::npos);
    CHECK(json.find("\"detail\":\"boom\"") != std::string::npos);
}

TEST_CASE("Error: ToJson omits absent fields", "[error]") {
    auto e = Error::Make(ErrorCategory::NotFound, "analyze_manifest", "missing");
    auto json = e.ToJson();
    CHECK(json.find("\"category\":\"not_found\"") != std::string::npos);
    CHECK(json.find("\"path\"") == std::string::npos);
    CHECK(json.find("\"exit_code\"") == std::string::npos);
    CHECK(json.find("\"detail\"") == std::string::npos);
}

TEST_CASE("Error: ToJson escapes special characters", "[error]") {
    auto e = Error::Make(ErrorCategory::Internal, "Op\"Quoted\"",
                         "line1\nline2\t\"quoted\"", "C:\\apks");
    e.detail = std::string("bell\x07");
    auto json = e.ToJson();
    CHECK(json.find("\\n") != std::string::npos);
    CHECK(json.find("\\t") != std::string::npos);
    CHECK(json.find("\\\"quoted\\\"") != std::string::npos);
    CHECK(json.find("C:\\\\apks") != std::string::npos);
    CHECK(json.find("\\u0007") != std::string::npos);
}

TEST_CASE("Error: equality includes category", "[error]") {
    auto e1 = Error::Make(ErrorCategory::Schema, "op", "msg");
    auto e2 = Error::Make(ErrorCategory::Schema, "op", "msg");
    auto e3 = Error::Make(ErrorCategory::Timeout, "op", "msg");
    CHECK(e1 == e2);
    CHECK(e1 != e3);
}
