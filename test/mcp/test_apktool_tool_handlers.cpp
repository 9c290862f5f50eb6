#include <catch2/catch_test_macros.hpp>

#include <apktool_mcp/mcp/apktool_tool_handlers.hpp>

#include "mocks/mock_process_runner.hpp"
#include "test_support.hpp"

#include <filesystem>
#include <string>
#include <vector>

using namespace apktool_mcp;
using namespace apktool_mcp::testing;
using namespace std::chrono_literals;

namespace fs = std::filesystem;

namespace {

struct Call {
    Result<ToolOutput, Error> result;
    JobHandle job;
};

struct Fixture {
    TempDir tmp;
    WorkspaceManager ws = WorkspaceManager::Open(tmp.Path() / "ws").Value();
    MockProcessRunner runner;
    ApktoolClient client{runner, ws, ApktoolSettings{}};
    ToolRegistry registry;

    Fixture() { RegisterApktoolTools(registry, ws, client); }

    Call Invoke(const std::string& tool, const nlohmann::json& arguments) {
        JobHandle job;
        job.tool = tool;
        auto args = registry.Validate(tool, arguments);
        if (args.IsErr()) {
            return {Result<ToolOutput, Error>::Err(args.Error()), job};
        }
        auto result = (*registry.FindHandler(tool))(args.Value(), job);
        return {std::move(result), job};
    }

    // A decoded directory as apktool would leave it.
    fs::path MakeDecoded(const std::string& name) {
        const auto dir = ws.Root() / name;
        WriteFile(dir / "AndroidManifest.xml", ReadTestData("AndroidManifest.xml"));
        WriteFile(dir / "apktool.yml", ReadTestData("apktool.yml"));
        WriteFile(dir / "res" / "values" / "strings.xml", ReadTestData("strings.xml"));
        WriteFile(dir / "res" / "values-es" / "strings.xml", ReadTestData("strings_es.xml"));
        WriteFile(dir / "smali" / "com" / "example" / "demo" / "MainActivity.smali",
                  ".class public Lcom/example/demo/MainActivity;\n"
                  "    const-string v0, \"https://api.example.com\"\n");
        return dir;
    }
};

// Side effect standing in for `apktool d`: writes the -o directory.
MockProcessRunner::SideEffect WriteDecodedOutput() {
    return [](const ProcessRequest& request) {
        const fs::path out = ArgValue(request.args, "-o");
        WriteFile(out / "AndroidManifest.xml", ReadTestData("AndroidManifest.xml"));
        WriteFile(out / "apktool.yml", ReadTestData("apktool.yml"));
    };
}

} // namespace

// ===========================================================================
// Registration
// ===========================================================================

TEST_CASE("RegisterApktoolTools: the eight tools", "[mcp][tools]") {
    Fixture f;
    std::vector<std::string> names;
    for (const auto& d : f.registry.Descriptors()) names.push_back(d.name);
    CHECK(names == std::vector<std::string>{"decode_apk", "build_apk", "install_framework",
                                            "analyze_manifest", "extract_strings",
                                            "list_permissions", "find_smali_references",
                                            "get_apk_info"});

    const auto* find = f.registry.Find("find_smali_references");
    REQUIRE(find != nullptr);
    auto schema = ToolRegistry::InputSchema(*find);
    CHECK(schema["required"] == nlohmann::json::array({"decompiled_dir", "pattern"}));
    CHECK(schema["properties"]["case_sensitive"]["default"] == true);
    CHECK(schema["properties"]["max_results"]["default"] == 50);
}

// ===========================================================================
// decode_apk
// ===========================================================================

TEST_CASE("decode_apk: default output is a fresh job directory", "[mcp][tools][decode]") {
    Fixture f;
    WriteFile(f.ws.Root() / "demo.apk", "PK");
    f.runner.EnqueueOutcome(
        MockProcessRunner::Completed("I: Using Apktool 2.9.3 on demo.apk\nW: odd attr\n"),
        WriteDecodedOutput());

    auto call = f.Invoke("decode_apk", {{"apk_path", "demo.apk"}});
    REQUIRE(call.result.IsOk());
    const auto expected = (f.ws.Root() / "demo").string();
    const auto& out = call.result.Value();
    CHECK(out.text.find("Successfully decompiled APK to: " + expected) == 0);
    CHECK(out.structured["output_dir"] == expected);
    CHECK(out.structured["workspace_relative"] == "demo");
    CHECK(out.structured["info"][0] == "Using Apktool 2.9.3 on demo.apk");
    CHECK(out.structured["warnings"][0] == "odd attr");
    CHECK(out.structured["resources"][0] == "apktool://apk/demo/manifest");
    CHECK(out.structured["resources"][1] == "apktool://apk/demo/apktool_yml");

    CHECK(call.job.workspace_path == expected);
    CHECK(call.job.pid == 4242);
    CHECK(call.job.deadline.has_value());

    const auto args = f.runner.Calls()[0].args;
    CHECK(args[0] == "d");
    CHECK(HasArg(args, "-f"));
    CHECK(ArgValue(args, "-o") == expected);
}

TEST_CASE("decode_apk: explicit output and flags", "[mcp][tools][decode]") {
    Fixture f;
    WriteFile(f.ws.Root() / "apps" / "demo.apk", "PK");
    f.runner.EnqueueOutcome(MockProcessRunner::Completed(), WriteDecodedOutput());

    auto call = f.Invoke("decode_apk", {{"apk_path", "apps/demo.apk"},
                                        {"output_dir", "out/demo"},
                                        {"no_res", true},
                                        {"no_src", true}});
    REQUIRE(call.result.IsOk());
    CHECK(call.result.Value().structured["workspace_relative"] == "out/demo");
    // Nested directories are not exposed as resources.
    CHECK_FALSE(call.result.Value().structured.contains("resources"));

    const auto args = f.runner.Calls()[0].args;
    CHECK_FALSE(HasArg(args, "-f"));
    CHECK(HasArg(args, "-r"));
    CHECK(HasArg(args, "-s"));
}

TEST_CASE("decode_apk: concurrent decodes of one APK get distinct directories",
          "[mcp][tools][decode]") {
    Fixture f;
    WriteFile(f.ws.Root() / "demo.apk", "PK");
    f.runner.EnqueueOutcome(MockProcessRunner::Completed(), WriteDecodedOutput());
    f.runner.EnqueueOutcome(MockProcessRunner::Completed(), WriteDecodedOutput());

    auto first = f.Invoke("decode_apk", {{"apk_path", "demo.apk"}});
    auto second = f.Invoke("decode_apk", {{"apk_path", "demo.apk"}});
    REQUIRE(first.result.IsOk());
    REQUIRE(second.result.IsOk());
    CHECK(first.result.Value().structured["workspace_relative"] == "demo");
    CHECK(second.result.Value().structured["workspace_relative"] == "demo-1");
}

TEST_CASE("decode_apk: argument errors never spawn", "[mcp][tools][decode]") {
    Fixture f;
    WriteFile(f.ws.Root() / "demo.apk", "PK");

    SECTION("missing apk_path") {
        auto call = f.Invoke("decode_apk", nlohmann::json::object());
        REQUIRE(call.result.IsErr());
        CHECK(call.result.Error().category == ErrorCategory::Schema);
    }
    SECTION("wrong type") {
        auto call = f.Invoke("decode_apk", {{"apk_path", "demo.apk"}, {"force", "maybe"}});
        REQUIRE(call.result.IsErr());
        CHECK(call.result.Error().category == ErrorCategory::Schema);
    }
    SECTION("unknown parameter") {
        auto call = f.Invoke("decode_apk", {{"apk_path", "demo.apk"}, {"verbose", true}});
        REQUIRE(call.result.IsErr());
        CHECK(call.result.Error().category == ErrorCategory::UnknownParameter);
    }
    SECTION("empty apk_path") {
        auto call = f.Invoke("decode_apk", {{"apk_path", ""}});
        REQUIRE(call.result.IsErr());
        CHECK(call.result.Error().category == ErrorCategory::Schema);
    }
    SECTION("apk outside the workspace") {
        auto call = f.Invoke("decode_apk", {{"apk_path", "../../etc/passwd"}});
        REQUIRE(call.result.IsErr());
        CHECK(call.result.Error().category == ErrorCategory::PathEscape);
        CHECK(call.result.Error().operation == "decode_apk");
    }
    SECTION("output outside the workspace") {
        auto call = f.Invoke("decode_apk", {{"apk_path", "demo.apk"}, {"output_dir", "/tmp/x"}});
        REQUIRE(call.result.IsErr());
        CHECK(call.result.Error().category == ErrorCategory::PathEscape);
    }
    SECTION("missing apk") {
        auto call = f.Invoke("decode_apk", {{"apk_path", "nope.apk"}});
        REQUIRE(call.result.IsErr());
        CHECK(call.result.Error().category == ErrorCategory::NotFound);
        CHECK(call.result.Error().message == "APK file not found");
    }
    CHECK(f.runner.CallCount() == 0);
}

TEST_CASE("decode_apk: failures remove the fresh job directory", "[mcp][tools][decode]") {
    Fixture f;
    WriteFile(f.ws.Root() / "demo.apk", "PK");

    SECTION("apktool exits non-zero") {
        f.runner.EnqueueOutcome(MockProcessRunner::Failed(1, "E: Invalid APK\n"));
        auto call = f.Invoke("decode_apk", {{"apk_path", "demo.apk"}});
        REQUIRE(call.result.IsErr());
        CHECK(call.result.Error().category == ErrorCategory::ExternalTool);
        CHECK(call.result.Error().operation == "decode_apk");
        CHECK(call.result.Error().message.find("Invalid APK") != std::string::npos);
    }
    SECTION("apktool times out") {
        f.runner.EnqueueOutcome(MockProcessRunner::TimedOut());
        auto call = f.Invoke("decode_apk", {{"apk_path", "demo.apk"}});
        REQUIRE(call.result.IsErr());
        CHECK(call.result.Error().category == ErrorCategory::Timeout);
    }
    SECTION("apktool succeeds without writing a manifest") {
        f.runner.EnqueueOutcome(MockProcessRunner::Completed());
        auto call = f.Invoke("decode_apk", {{"apk_path", "demo.apk"}});
        REQUIRE(call.result.IsErr());
        CHECK(call.result.Error().message ==
              "apktool finished but produced no AndroidManifest.xml");
    }
    CHECK_FALSE(fs::exists(f.ws.Root() / "demo"));
}

TEST_CASE("decode_apk: an explicit output directory is kept on failure",
          "[mcp][tools][decode]") {
    Fixture f;
    WriteFile(f.ws.Root() / "demo.apk", "PK");
    WriteFile(f.ws.Root() / "mine" / "notes.txt", "keep me");
    f.runner.EnqueueOutcome(MockProcessRunner::Failed(1, "E: Destination exists\n"));

    auto call = f.Invoke("decode_apk", {{"apk_path", "demo.apk"}, {"output_dir", "mine"}});
    REQUIRE(call.result.IsErr());
    CHECK(fs::exists(f.ws.Root() / "mine" / "notes.txt"));
}

// ===========================================================================
// build_apk
// ===========================================================================

TEST_CASE("build_apk: default output under dist", "[mcp][tools][build]") {
    Fixture f;
    const auto dir = f.MakeDecoded("demo");
    f.runner.EnqueueOutcome(
        MockProcessRunner::Completed("I: Building apk file...\n"),
        [dir](const ProcessRequest&) { WriteFile(dir / "dist" / "demo.apk", "PK"); });

    auto call = f.Invoke("build_apk", {{"source_dir", "demo"}});
    REQUIRE(call.result.IsOk());
    const auto& data = call.result.Value().structured;
    CHECK(data["output_apk"] == (dir / "dist" / "demo.apk").string());
    CHECK(data["output_exists"] == true);
    CHECK(data["info"][0] == "Building apk file...");
    CHECK_FALSE(HasArg(f.runner.Calls()[0].args, "-o"));
}

TEST_CASE("build_apk: explicit output", "[mcp][tools][build]") {
    Fixture f;
    f.MakeDecoded("demo");
    f.runner.EnqueueOutcome(MockProcessRunner::Completed());

    auto call = f.Invoke("build_apk",
                         {{"source_dir", "demo"}, {"output_apk", "out/rebuilt.apk"}, {"force", true}});
    REQUIRE(call.result.IsOk());
    CHECK(call.result.Value().structured["output_exists"] == false);
    const auto args = f.runner.Calls()[0].args;
    CHECK(ArgValue(args, "-o") == (f.ws.Root() / "out" / "rebuilt.apk").string());
    CHECK(HasArg(args, "-f"));
}

TEST_CASE("build_apk: source must be a decoded directory", "[mcp][tools][build]") {
    Fixture f;
    fs::create_directories(f.ws.Root() / "plain");

    auto missing = f.Invoke("build_apk", {{"source_dir", "ghost"}});
    REQUIRE(missing.result.IsErr());
    CHECK(missing.result.Error().category == ErrorCategory::NotFound);

    auto not_decoded = f.Invoke("build_apk", {{"source_dir", "plain"}});
    REQUIRE(not_decoded.result.IsErr());
    CHECK(not_decoded.result.Error().message.find("apktool.yml") != std::string::npos);
    CHECK(f.runner.CallCount() == 0);
}

// ===========================================================================
// install_framework
// ===========================================================================

TEST_CASE("install_framework: tag and framework directory", "[mcp][tools][framework]") {
    Fixture f;
    WriteFile(f.ws.Root() / "framework-res.apk", "PK");
    f.runner.EnqueueOutcome(MockProcessRunner::Completed(
        "I: Framework installed to: /ws/.apktool/framework/1-samsung.apk\n"));

    auto call = f.Invoke("install_framework",
                         {{"framework_apk", "framework-res.apk"}, {"framework_id", "samsung"}});
    REQUIRE(call.result.IsOk());
    const auto& data = call.result.Value().structured;
    CHECK(data["framework_id"] == "samsung");
    CHECK(data["framework_dir"] == (f.ws.Root() / ".apktool" / "framework").string());
    CHECK(ArgValue(f.runner.Calls()[0].args, "-t") == "samsung");
}

TEST_CASE("install_framework: invalid tag is a schema error", "[mcp][tools][framework]") {
    Fixture f;
    WriteFile(f.ws.Root() / "framework-res.apk", "PK");
    auto call = f.Invoke("install_framework",
                         {{"framework_apk", "framework-res.apk"}, {"framework_id", "-x; rm"}});
    REQUIRE(call.result.IsErr());
    CHECK(call.result.Error().category == ErrorCategory::Schema);
    CHECK(call.result.Error().message.find("Invalid framework_id") == 0);
    CHECK(f.runner.CallCount() == 0);
}

// ===========================================================================
// analyze_manifest / list_permissions
// ===========================================================================

TEST_CASE("analyze_manifest: merges apktool.yml versions", "[mcp][tools][manifest]") {
    Fixture f;
    f.MakeDecoded("demo");

    auto call = f.Invoke("analyze_manifest", {{"decompiled_dir", "demo"}});
    REQUIRE(call.result.IsOk());
    const auto& out = call.result.Value();
    CHECK(out.text.find("AndroidManifest.xml Analysis:") == 0);
    CHECK(out.text.find("Package: com.example.demo") != std::string::npos);

    const auto& data = out.structured;
    CHECK(data["package"] == "com.example.demo");
    CHECK(data["version_code"] == "42");
    CHECK(data["version_name"] == "1.4.2");
    CHECK(data["min_sdk"] == "21");
    CHECK(data["target_sdk"] == "34");
    CHECK(data["permissions"].size() == 4);
    CHECK(data["activities"].size() == 3);
    CHECK(data["launcher_activity"] == "com.example.demo.MainActivity");
    CHECK(data["debuggable"] == true);
    // MainActivity, ShareAlias, BootReceiver and NotesProvider.
    CHECK(data["exported_components"] == 4);
    CHECK(f.runner.CallCount() == 0);
}

TEST_CASE("analyze_manifest: points at the full manifest", "[mcp][tools][manifest]") {
    Fixture f;
    f.MakeDecoded("demo");
    WriteFile(f.ws.Root() / "nested" / "demo" / "AndroidManifest.xml",
              ReadTestData("AndroidManifest.xml"));

    auto top = f.Invoke("analyze_manifest", {{"decompiled_dir", "demo"}});
    REQUIRE(top.result.IsOk());
    CHECK(top.result.Value().structured["manifest_resource"] == "apktool://apk/demo/manifest");
    CHECK(top.result.Value().text.find("Full manifest: apktool://apk/demo/manifest") !=
          std::string::npos);

    // Only top-level directories are listed as resources.
    auto nested = f.Invoke("analyze_manifest", {{"decompiled_dir", "nested/demo"}});
    REQUIRE(nested.result.IsOk());
    CHECK(nested.result.Value().structured["manifest_resource"].is_null());
    CHECK(nested.result.Value().text.find("Full manifest:") == std::string::npos);
}

TEST_CASE("analyze_manifest: missing or binary manifest", "[mcp][tools][manifest]") {
    Fixture f;
    fs::create_directories(f.ws.Root() / "empty");
    WriteFile(f.ws.Root() / "raw" / "AndroidManifest.xml", std::string("\x03\x00\x08\x00", 4));

    auto missing = f.Invoke("analyze_manifest", {{"decompiled_dir", "empty"}});
    REQUIRE(missing.result.IsErr());
    CHECK(missing.result.Error().category == ErrorCategory::NotFound);
    CHECK(missing.result.Error().message ==
          "AndroidManifest.xml not found in decompiled directory");

    auto binary = f.Invoke("analyze_manifest", {{"decompiled_dir", "raw"}});
    REQUIRE(binary.result.IsErr());
    CHECK(binary.result.Error().message.find("no_res") != std::string::npos);

    auto nodir = f.Invoke("analyze_manifest", {{"decompiled_dir", "ghost"}});
    REQUIRE(nodir.result.IsErr());
    CHECK(nodir.result.Error().message == "decompiled directory not found");
}

TEST_CASE("list_permissions: requested and declared", "[mcp][tools][manifest]") {
    Fixture f;
    f.MakeDecoded("demo");

    auto call = f.Invoke("list_permissions", {{"decompiled_dir", "demo"}});
    REQUIRE(call.result.IsOk());
    const auto& out = call.result.Value();
    CHECK(out.text.find("Found 4 permissions:") == 0);
    CHECK(out.text.find("android.permission.CAMERA (API 23+)") != std::string::npos);
    CHECK(out.structured["count"] == 4);
    CHECK(out.structured["uses_permissions"][2]["max_sdk_version"] == 28);
    CHECK(out.structured["declared_permissions"][0]["protection_level"] == "signature");
}

TEST_CASE("list_permissions: none declared", "[mcp][tools][manifest]") {
    Fixture f;
    WriteFile(f.ws.Root() / "bare" / "AndroidManifest.xml", "<manifest package=\"a.b\"/>");
    auto call = f.Invoke("list_permissions", {{"decompiled_dir", "bare"}});
    REQUIRE(call.result.IsOk());
    CHECK(call.result.Value().text == "No permissions found in AndroidManifest.xml");
    CHECK(call.result.Value().structured["count"] == 0);
}

// ===========================================================================
// extract_strings
// ===========================================================================

TEST_CASE("extract_strings: all locales and one locale", "[mcp][tools][strings]") {
    Fixture f;
    f.MakeDecoded("demo");

    auto all = f.Invoke("extract_strings", {{"decompiled_dir", "demo"}});
    REQUIRE(all.result.IsOk());
    const auto& data = all.result.Value().structured;
    CHECK(data["locale"] == "default");
    CHECK(data["string_count"] == 6);
    CHECK(data["files"]["res/values/strings.xml"]["app_name"] == "Demo");

    auto es = f.Invoke("extract_strings", {{"decompiled_dir", "demo"}, {"locale", "es"}});
    REQUIRE(es.result.IsOk());
    CHECK(es.result.Value().structured["locale"] == "es");
    CHECK(es.result.Value().structured["files"].size() == 1);

    auto fr = f.Invoke("extract_strings", {{"decompiled_dir", "demo"}, {"locale", "fr"}});
    REQUIRE(fr.result.IsOk());
    CHECK(fr.result.Value().text == "No string files found for locale: fr");
}

TEST_CASE("extract_strings: a locale cannot traverse", "[mcp][tools][strings]") {
    Fixture f;
    f.MakeDecoded("demo");
    auto call = f.Invoke("extract_strings", {{"decompiled_dir", "demo"}, {"locale", "../../x"}});
    REQUIRE(call.result.IsErr());
    CHECK(call.result.Error().category == ErrorCategory::Schema);
    CHECK(call.result.Error().message.find("Invalid locale") == 0);
}

// ===========================================================================
// find_smali_references
// ===========================================================================

TEST_CASE("find_smali_references: matches and empty results", "[mcp][tools][smali]") {
    Fixture f;
    f.MakeDecoded("demo");

    auto hit = f.Invoke("find_smali_references",
                        {{"decompiled_dir", "demo"}, {"pattern", "https://"}});
    REQUIRE(hit.result.IsOk());
    CHECK(hit.result.Value().text.find("Found 1 matches for 'https://'") == 0);
    const auto& data = hit.result.Value().structured;
    CHECK(data["matches"][0]["file"] == "smali/com/example/demo/MainActivity.smali");
    CHECK(data["matches"][0]["line"] == 2);
    CHECK(data["truncated"] == false);

    auto miss = f.Invoke("find_smali_references",
                         {{"decompiled_dir", "demo"}, {"pattern", "HTTPS://"}});
    REQUIRE(miss.result.IsOk());
    CHECK(miss.result.Value().text == "Pattern 'HTTPS://' not found in smali code");

    auto insensitive = f.Invoke(
        "find_smali_references",
        {{"decompiled_dir", "demo"}, {"pattern", "HTTPS://"}, {"case_sensitive", false}});
    REQUIRE(insensitive.result.IsOk());
    CHECK(insensitive.result.Value().structured["total_matches"] == 1);
}

TEST_CASE("find_smali_references: no smali tree", "[mcp][tools][smali]") {
    Fixture f;
    fs::create_directories(f.ws.Root() / "nosrc" / "res");
    auto call = f.Invoke("find_smali_references", {{"decompiled_dir", "nosrc"}, {"pattern", "x"}});
    REQUIRE(call.result.IsOk());
    CHECK(call.result.Value().text == "No smali directories found");
}

TEST_CASE("find_smali_references: max_results bounds", "[mcp][tools][smali]") {
    Fixture f;
    f.MakeDecoded("demo");
    for (int bad : {0, -3, 10001}) {
        INFO(bad);
        auto call = f.Invoke("find_smali_references",
                             {{"decompiled_dir", "demo"}, {"pattern", "L"}, {"max_results", bad}});
        REQUIRE(call.result.IsErr());
        CHECK(call.result.Error().category == ErrorCategory::Schema);
    }
}

// ===========================================================================
// get_apk_info
// ===========================================================================

TEST_CASE("get_apk_info: badging from aapt", "[mcp][tools][info]") {
    Fixture f;
    WriteFile(f.ws.Root() / "demo.apk", std::string(100, 'x'));
    f.runner.EnqueueOutcome(MockProcessRunner::Completed(ReadTestData("badging.txt")));

    auto call = f.Invoke("get_apk_info", {{"apk_path", "demo.apk"}});
    REQUIRE(call.result.IsOk());
    const auto& data = call.result.Value().structured;
    CHECK(data["source"] == "aapt");
    CHECK(data["package"] == "com.example.demo");
    CHECK(data["size_bytes"] == 100);
    CHECK(data["native_code"].size() == 2);

    const auto calls = f.runner.Calls();
    CHECK(calls[0].executable == "aapt");
    CHECK(calls[0].timeout == ApktoolSettings{}.info_timeout);
}

TEST_CASE("get_apk_info: falls back to file facts", "[mcp][tools][info]") {
    Fixture f;
    WriteFile(f.ws.Root() / "demo.apk", std::string(100, 'x'));

    SECTION("aapt missing") {
        f.runner.EnqueueOutcome(MockProcessRunner::SpawnFailed("aapt: No such file"));
    }
    SECTION("aapt fails") {
        f.runner.EnqueueOutcome(MockProcessRunner::Failed(1, "ERROR: dump failed\n"));
    }
    SECTION("unparseable output") {
        f.runner.EnqueueOutcome(MockProcessRunner::Completed("garbage\n"));
    }

    auto call = f.Invoke("get_apk_info", {{"apk_path", "demo.apk"}});
    REQUIRE(call.result.IsOk());
    const auto& data = call.result.Value().structured;
    CHECK(data["source"] == "file");
    CHECK(data["note"] == "aapt not available for detailed analysis");
    CHECK(data["size_bytes"] == 100);
    CHECK(call.result.Value().text.find("Note: aapt not available") != std::string::npos);
}

TEST_CASE("get_apk_info: a timeout is reported, not masked", "[mcp][tools][info]") {
    Fixture f;
    WriteFile(f.ws.Root() / "demo.apk", "PK");
    f.runner.EnqueueOutcome(MockProcessRunner::TimedOut());
    auto call = f.Invoke("get_apk_info", {{"apk_path", "demo.apk"}});
    REQUIRE(call.result.IsErr());
    CHECK(call.result.Error().category == ErrorCategory::Timeout);
    CHECK(call.result.Error().operation == "get_apk_info");
}

TEST_CASE("get_apk_info: repeated calls agree", "[mcp][tools][info]") {
    Fixture f;
    WriteFile(f.ws.Root() / "demo.apk", "PK");
    f.runner.EnqueueOutcome(MockProcessRunner::Completed(ReadTestData("badging.txt")));
    f.runner.EnqueueOutcome(MockProcessRunner::Completed(ReadTestData("badging.txt")));

    auto first = f.Invoke("get_apk_info", {{"apk_path", "demo.apk"}});
    auto second = f.Invoke("get_apk_info", {{"apk_path", "demo.apk"}});
    REQUIRE(first.result.IsOk());
    REQUIRE(second.result.IsOk());
    CHECK(first.result.Value().structured == second.result.Value().structured);
    CHECK(first.result.Value().text == second.result.Value().text);
}
