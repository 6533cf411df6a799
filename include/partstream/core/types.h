#pragma once

#include <cstddef>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace partstream {

using ByteVector = std::vector<std::byte>;
using ByteSpan = std::span<const std::byte>;

/**
 * Failure categories.
 *
 * InvalidConfiguration, InvalidArgument and InvalidRange are caller errors found before any
 * network traffic. NetworkError, NotFound, PermissionDenied, Timeout and InvalidData come
 * from the object store (fetch errors). The rest are local.
 */
enum class ErrorCode {
    Success = 0,
    InvalidConfiguration,
    InvalidArgument,
    InvalidRange,
    InvalidState,
    NetworkError,
    NotFound,
    PermissionDenied,
    Timeout,
    InvalidData,
    IoError,
    InternalError,
    Unknown
};

constexpr const char* errorToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::InvalidConfiguration:
            return "Invalid configuration";
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InvalidRange:
            return "Invalid range";
        case ErrorCode::InvalidState:
            return "Invalid state";
        case ErrorCode::NetworkError:
            return "Network error";
        case ErrorCode::NotFound:
            return "Not found";
        case ErrorCode::PermissionDenied:
            return "Permission denied";
        case ErrorCode::Timeout:
            return "Timed out";
        case ErrorCode::InvalidData:
            return "Invalid data";
        case ErrorCode::IoError:
            return "I/O error";
        case ErrorCode::InternalError:
            return "Internal error";
        case ErrorCode::Unknown:
            break;
    }
    return "Unknown error";
}

struct Error {
    ErrorCode code{ErrorCode::Success};
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }
};

/**
 * Value or Error. Accessing the wrong alternative throws std::logic_error.
 */
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::in_place_index<0>, std::move(value)) {}
    Result(const T& value) : data_(std::in_place_index<0>, value) {}
    Result(Error error) : data_(std::in_place_index<1>, std::move(error)) {}
    Result(ErrorCode code) : Result(Error{code}) {}

    [[nodiscard]] bool has_value() const noexcept { return data_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& { return std::get<0>(checked()); }
    T& value() & { return std::get<0>(checked()); }
    T&& value() && { return std::get<0>(std::move(checked())); }

    const Error& error() const {
        if (has_value())
            throw std::logic_error("Result holds a value");
        return std::get<1>(data_);
    }

private:
    std::variant<T, Error>& checked() {
        if (!has_value())
            throw std::logic_error("Result holds an error: " + std::get<1>(data_).message);
        return data_;
    }
    const std::variant<T, Error>& checked() const {
        return const_cast<Result*>(this)->checked();
    }

    std::variant<T, Error> data_;
};

template <> class Result<void> {
public:
    Result() = default;
    Result(Error error) : error_(std::move(error)) {}
    Result(ErrorCode code) : error_(code) {}

    [[nodiscard]] bool has_value() const noexcept { return error_.code == ErrorCode::Success; }
    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value())
            throw std::logic_error("Result holds an error: " + error_.message);
    }

    const Error& error() const {
        if (has_value())
            throw std::logic_error("Result holds a value");
        return error_;
    }

private:
    Error error_;
};

} // namespace partstream

// spdlog/fmt support
#if defined(SPDLOG_FMT_EXTERNAL) || defined(FMT_VERSION)
#include <fmt/format.h>
template <> struct fmt::formatter<partstream::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(partstream::ErrorCode code, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", partstream::errorToString(code));
    }
};
#endif
