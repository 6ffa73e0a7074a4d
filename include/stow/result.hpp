#pragma once

#include <stow/error.hpp>
#include <cstddef>
#include <string>
#include <utility>
#include <variant>

namespace stow {

// A value or the StowError that prevented it. Errors convert implicitly, so
// STOW_TRY can hand an error from one Result type to another.
template<typename T>
class Result {
public:
    Result(StowError err) : data_(std::in_place_index<1>, std::move(err)) {}

    static Result ok(T val) { return Result(std::in_place_index<0>, std::move(val)); }
    static Result err(StowError e) { return Result(std::move(e)); }

    bool is_ok() const { return data_.index() == 0; }
    bool is_err() const { return data_.index() == 1; }
    explicit operator bool() const { return is_ok(); }

    // std::bad_variant_access on the wrong alternative
    T& value() & { return std::get<0>(data_); }
    const T& value() const& { return std::get<0>(data_); }
    T&& value() && { return std::get<0>(std::move(data_)); }

    StowError& error() & { return std::get<1>(data_); }
    const StowError& error() const& { return std::get<1>(data_); }
    StowError&& error() && { return std::get<1>(std::move(data_)); }

    T value_or(T fallback) const& {
        return is_ok() ? value() : std::move(fallback);
    }

    // Attribute an error to the file it was read from, unless it already
    // names one.
    Result in_file(const std::string& path) && {
        if (is_err() && error().file.empty()) error().file = path;
        return std::move(*this);
    }

private:
    template<std::size_t I, typename V>
    Result(std::in_place_index_t<I> tag, V&& v) : data_(tag, std::forward<V>(v)) {}

    std::variant<T, StowError> data_;
};

using Status = Result<std::monostate>;

inline Status ok_status() {
    return Status::ok(std::monostate{});
}

#define STOW_TRY(expr) \
    do { \
        auto _stow_result = (expr); \
        if (_stow_result.is_err()) return std::move(_stow_result).error(); \
    } while(0)

} // namespace stow
