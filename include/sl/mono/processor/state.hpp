//
// Created by usatiynyan.
//

#pragma once

#include <cstdint>
#include <string_view>

namespace sl::mono {

// order matters: everything past post_subscribed is terminal
enum class mono_state : std::int32_t {
    cancelled = -1,
    ready = 0,
    subscribed,
    post_subscribed,
    resolved_value,
    resolved_empty,
    errored,
};

constexpr bool is_pending_state(mono_state state) {
    return state == mono_state::ready || state == mono_state::subscribed || state == mono_state::post_subscribed;
}

constexpr bool is_terminal_state(mono_state state) { return state > mono_state::post_subscribed; }

std::string_view to_string(mono_state state);

} // namespace sl::mono
