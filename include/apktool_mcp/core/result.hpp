#pragma once

#include <cassert>
#include <optional>
#include <ostream>
#include <string>
#include <utility>
#include <variant>

namespace apktool_mcp {

// ---------------------------------------------------------------------------
// Result<T, E>: either a value or an error, never both.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E>: success carries no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(); }
    static Result Err(const E& error) { return Result(error); }
    static Result Err(E&& error) { return Result(std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    Result() = default;
    explicit Result(const E& error) : error_(error) {}
    explicit Result(E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory: the failure taxonomy reported to MCP clients.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Schema,
    UnknownParameter,
    PathEscape,
    ExternalTool,
    Timeout,
    UnsupportedResource,
    NotFound,
    Config,
    Internal,
};

const char* CategoryName(ErrorCategory category);

// ---------------------------------------------------------------------------
// Error: structured failure of a single operation.
//
// Every failure is scoped to one call: it is serialized back to the client
// and never terminates the server.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string path;
    std::string message;
    std::optional<std::string> detail;   // captured stderr or underlying cause
    std::optional<int> exit_code;        // external process exit status
    ErrorCategory category = ErrorCategory::Internal;

    static Error Make(ErrorCategory category,
                      std::string operation,
                      std::string message,
                      std::string path = "");

    /// Non-zero exit of an external tool. Keeps only the tail of stderr,
    /// which is where apktool and the JVM put the actual failure.
    static Error FromExternalTool(const std::string& operation,
                                  const std::string& path,
                                  int exit_code,
                                  const std::string& stderr_text);

    [[nodiscard]] std::string CategoryName() const {
        return apktool_mcp::CategoryName(category);
    }

    [[nodiscard]] std::string ToString() const;

    /// {"error":{"category":...,"operation":...,"message":...}}
    [[nodiscard]] std::string ToJson() const;

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation && path == other.path &&
               message == other.message && detail == other.detail &&
               exit_code == other.exit_code && category == other.category;
    }

    bool operator!=(const Error& other) const { return !(*this == other); }
};

} // namespace apktool_mcp
