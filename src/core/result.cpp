#include <apktool_mcp/core/result.hpp>

#include <iomanip>
#include <sstream>
#include <vector>

namespace apktool_mcp {

namespace {

constexpr std::size_t kMaxDetailLines = 40;

// No nlohmann dependency here; core/ stays free of protocol libraries.
void AppendJsonString(std::ostringstream& out, const std::string& s) {
    out << '"';
    for (char c : s) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n";  break;
            case '\r': out << "\\r";  break;
            case '\t': out << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c))
                        << std::dec << std::setfill(' ');
                } else {
                    out << c;
                }
        }
    }
    out << '"';
}

std::string TailLines(const std::string& text, std::size_t max_lines) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }
    while (!lines.empty() && lines.back().empty()) {
        lines.pop_back();
    }

    std::size_t first = lines.size() > max_lines ? lines.size() - max_lines : 0;
    std::string out;
    if (first > 0) {
        out = "... (" + std::to_string(first) + " earlier lines omitted)\n";
    }
    for (std::size_t i = first; i < lines.size(); ++i) {
        out += lines[i];
        if (i + 1 < lines.size()) out += '\n';
    }
    return out;
}

} // anonymous namespace

const char* CategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Schema:              return "schema_error";
        case ErrorCategory::UnknownParameter:    return "unknown_parameter";
        case ErrorCategory::PathEscape:          return "path_escape";
        case ErrorCategory::ExternalTool:        return "external_tool_error";
        case ErrorCategory::Timeout:             return "timed_out";
        case ErrorCategory::UnsupportedResource: return "unsupported_resource";
        case ErrorCategory::NotFound:            return "not_found";
        case ErrorCategory::Config:              return "config_error";
        case ErrorCategory::Internal:            return "internal";
    }
    return "internal";
}

Error Error::Make(ErrorCategory category,
                  std::string operation,
                  std::string message,
                  std::string path) {
    Error e;
    e.operation = std::move(operation);
    e.path = std::move(path);
    e.message = std::move(message);
    e.category = category;
    return e;
}

Error Error::FromExternalTool(const std::string& operation,
                              const std::string& path,
                              int exit_code,
                              const std::string& stderr_text) {
    Error e = Make(ErrorCategory::ExternalTool, operation,
                   "external tool exited with status " + std::to_string(exit_code),
                   path);
    e.exit_code = exit_code;
    auto tail = TailLines(stderr_text, kMaxDetailLines);
    if (!tail.empty()) {
        e.detail = std::move(tail);
    }
    return e;
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    if (exit_code.has_value()) {
        oss << " (exit " << *exit_code << ")";
    }
    oss << ": " << message;
    if (detail.has_value() && !detail->empty()) {
        oss << "\n" << *detail;
    }
    return oss.str();
}

std::string Error::ToJson() const {
    std::ostringstream oss;
    oss << R"({"error":{"category":)";
    AppendJsonString(oss, CategoryName());
    oss << R"(,"operation":)";
    AppendJsonString(oss, operation);
    if (!path.empty()) {
        oss << R"(,"path":)";
        AppendJsonString(oss, path);
    }
    oss << R"(,"message":)";
    AppendJsonString(oss, message);
    if (exit_code.has_value()) {
        oss << R"(,"exit_code":)" << *exit_code;
    }
    if (detail.has_value() && !detail->empty()) {
        oss << R"(,"detail":)";
        AppendJsonString(oss, *detail);
    }
    oss << "}}";
    return oss.str();
}

} // namespace apktool_mcp
