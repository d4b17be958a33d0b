//
// Created by usatiynyan.
//

#include "sl/mono/model/error.hpp"

#include <string>

namespace sl::mono {
namespace {

struct mono_category_impl final : std::error_category {
    const char* name() const noexcept override { return "sl::mono"; }

    std::string message(int condition) const override {
        switch (static_cast<errc>(condition)) {
        case errc::invalid_demand:
            return "request amount must be positive";
        case errc::timed_out:
            return "timed out waiting for resolution";
        case errc::duplicate_subscription:
            return "subscription already set";
        }
        return "unknown sl::mono error";
    }

    std::error_condition default_error_condition(int condition) const noexcept override {
        switch (static_cast<errc>(condition)) {
        case errc::invalid_demand:
            return std::errc::invalid_argument;
        case errc::timed_out:
            return std::errc::timed_out;
        case errc::duplicate_subscription:
            return std::errc::operation_not_permitted;
        }
        return std::error_condition{ condition, *this };
    }
};

} // namespace

const std::error_category& mono_category() noexcept {
    static const mono_category_impl instance;
    return instance;
}

std::error_code make_error_code(errc e) noexcept { return std::error_code{ static_cast<int>(e), mono_category() }; }

} // namespace sl::mono
