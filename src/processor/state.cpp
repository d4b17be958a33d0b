//
// Created by usatiynyan.
//

#include "sl/mono/processor/state.hpp"

#include <libassert/assert.hpp>

namespace sl::mono {

std::string_view to_string(mono_state state) {
    switch (state) {
    case mono_state::cancelled:
        return "cancelled";
    case mono_state::ready:
        return "ready";
    case mono_state::subscribed:
        return "subscribed";
    case mono_state::post_subscribed:
        return "post_subscribed";
    case mono_state::resolved_value:
        return "resolved_value";
    case mono_state::resolved_empty:
        return "resolved_empty";
    case mono_state::errored:
        return "errored";
    }
    UNREACHABLE();
}

} // namespace sl::mono
