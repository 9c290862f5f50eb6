#include <apktool_mcp/apktool/string_resources.hpp>

#include <apktool_mcp/core/log.hpp>

#include "xml_utils.hpp"

#include <tinyxml2.h>

#include <filesystem>

namespace apktool_mcp {

namespace {

// "values" or "values-<qualifiers>"
bool IsValuesDirectory(const std::string& name) {
    return name == "values" || name.rfind("values-", 0) == 0;
}

} // anonymous namespace

Result<std::vector<StringResource>, Error> ParseStringsXml(std::string_view xml) {
    tinyxml2::XMLDocument doc;
    if (doc.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS) {
        return Result<std::vector<StringResource>, Error>::Err(Error::Make(
            ErrorCategory::ExternalTool, "ParseStringsXml",
            std::string("malformed XML: ") + (doc.ErrorStr() ? doc.ErrorStr() : "")));
    }

    std::vector<StringResource> strings;
    const auto* root = doc.RootElement();
    if (!root || !xml_utils::NameIs(root, "resources")) {
        return Result<std::vector<StringResource>, Error>::Ok(std::move(strings));
    }

    for (auto* element = root->FirstChildElement("string"); element;
         element = element->NextSiblingElement("string")) {
        auto name = xml_utils::Attr(element, "name");
        if (name.empty()) continue;
        strings.push_back({std::move(name), xml_utils::DeepText(element)});
    }
    return Result<std::vector<StringResource>, Error>::Ok(std::move(strings));
}

Result<StringTable, Error> ExtractStrings(const WorkspaceManager& workspace,
                                          const ResolvedPath& decoded_dir,
                                          const std::optional<Locale>& locale) {
    auto res_dir = workspace.ResolveUnder(decoded_dir, "res");
    if (res_dir.IsErr()) {
        return Result<StringTable, Error>::Err(res_dir.Error());
    }
    std::error_code ec;
    if (!std::filesystem::is_directory(res_dir.Value().Path(), ec)) {
        return Result<StringTable, Error>::Err(Error::Make(
            ErrorCategory::NotFound, "extract_strings", "resources directory not found",
            res_dir.Value().String()));
    }

    std::vector<std::string> candidates;
    if (locale) {
        candidates.push_back(locale->ValuesDirectory());
    } else {
        std::filesystem::directory_iterator it(res_dir.Value().Path(), ec), end;
        for (; !ec && it != end; it.increment(ec)) {
            std::error_code type_ec;
            if (!it->is_directory(type_ec)) continue;
            auto name = it->path().filename().string();
            if (IsValuesDirectory(name)) {
                candidates.push_back(std::move(name));
            }
        }
        if (ec) {
            return Result<StringTable, Error>::Err(Error::Make(
                ErrorCategory::Internal, "extract_strings",
                "cannot list resources directory: " + ec.message(),
                res_dir.Value().String()));
        }
    }

    StringTable table;
    for (const auto& values_dir : candidates) {
        auto file = workspace.ResolveUnder(res_dir.Value(), values_dir + "/strings.xml");
        if (file.IsErr()) {
            // A symlinked values directory pointing out of the workspace.
            LogWarn("strings", file.Error().ToString());
            continue;
        }
        auto text = workspace.ReadFile(file.Value());
        if (text.IsErr()) {
            if (text.Error().category != ErrorCategory::NotFound) {
                return Result<StringTable, Error>::Err(text.Error());
            }
            continue;
        }
        auto parsed = ParseStringsXml(text.Value());
        if (parsed.IsErr()) {
            auto error = parsed.Error();
            error.path = file.Value().String();
            return Result<StringTable, Error>::Err(std::move(error));
        }
        table.emplace("res/" + values_dir + "/strings.xml", std::move(parsed).Value());
    }

    return Result<StringTable, Error>::Ok(std::move(table));
}

} // namespace apktool_mcp
