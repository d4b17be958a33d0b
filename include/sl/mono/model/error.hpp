//
// Created by usatiynyan.
// Errors the library itself originates, they are mapped into the user's error type via `protocol_error`.
//

#pragma once

#include <concepts>
#include <exception>
#include <system_error>
#include <type_traits>

namespace sl::mono {

enum class errc {
    invalid_demand = 1, // request(n) with n <= 0
    timed_out, // blocking wait reached its deadline
    duplicate_subscription, // second on_subscribe while the first one is still held
};

const std::error_category& mono_category() noexcept;

std::error_code make_error_code(errc e) noexcept;

template <typename ErrorT>
struct protocol_error;

template <typename ErrorT>
    requires std::constructible_from<ErrorT, std::error_code>
struct protocol_error<ErrorT> {
    static ErrorT make(std::error_code ec) { return ErrorT{ ec }; }
};

template <>
struct protocol_error<std::exception_ptr> {
    static std::exception_ptr make(std::error_code ec) { return std::make_exception_ptr(std::system_error{ ec }); }
};

template <typename ErrorT>
concept ProtocolError = requires(std::error_code ec) {
    { protocol_error<ErrorT>::make(ec) } -> std::same_as<ErrorT>;
};

template <ProtocolError ErrorT>
ErrorT make_protocol_error(errc e) {
    return protocol_error<ErrorT>::make(make_error_code(e));
}

} // namespace sl::mono

template <>
struct std::is_error_code_enum<sl::mono::errc> : std::true_type {};
