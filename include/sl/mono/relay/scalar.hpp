//
// Created by usatiynyan.
// Emits a single cached value on first demand, then completes.
// Once the subscriber got its terminal signal, or cancelled, it must not call back into it.
//

#pragma once

#include "sl/mono/model/concept.hpp"
#include "sl/mono/model/error.hpp"
#include "sl/mono/thread/detail/config.hpp"

#include <sl/meta/intrusive/forward_list.hpp>
#include <sl/meta/traits/unique.hpp>

#include <cstdint>
#include <tuple>
#include <utility>

namespace sl::mono {

template <typename ValueT, ProtocolError ErrorT, template <typename> typename Atomic = detail::atomic>
struct scalar_subscription final
    : subscription
    , meta::intrusive_forward_list_node<scalar_subscription<ValueT, ErrorT, Atomic>>
    , meta::immovable {
    enum scalar_state : std::uint32_t {
        scalar_state_ready = 0,
        scalar_state_emitting,
        scalar_state_cancelled, // while emitting
        scalar_state_finished,
    };

public:
    // value is referenced, not copied, it has to outlive the subscription
    scalar_subscription(subscriber<ValueT, ErrorT>& a_subscriber, const ValueT& value)
        : subscriber_{ a_subscriber }, value_{ value } {}

    void start() & { subscriber_.on_subscribe(*this); }

    void request(std::int64_t n) & override {
        std::uint32_t expected = scalar_state_ready;
        if (!state_.compare_exchange_strong(
                expected, scalar_state_emitting, std::memory_order::acq_rel, std::memory_order::acquire
            )) {
            return;
        }

        if (n <= 0) [[unlikely]] {
            subscriber_.on_error(make_protocol_error<ErrorT>(errc::invalid_demand));
        } else {
            ValueT value_copy{ value_ };
            subscriber_.on_next(std::move(value_copy));
            if (state_.load(std::memory_order::acquire) != scalar_state_cancelled) {
                subscriber_.on_complete();
            }
        }

        // last touch, the owner may reclaim it from here on
        state_.store(scalar_state_finished, std::memory_order::release);
    }

    void cancel() & override {
        std::uint32_t expected = scalar_state_ready;
        if (state_.compare_exchange_strong(
                expected, scalar_state_finished, std::memory_order::acq_rel, std::memory_order::acquire
            )) {
            return;
        }
        if (expected == scalar_state_emitting) {
            std::ignore = state_.compare_exchange_strong(
                expected, scalar_state_cancelled, std::memory_order::acq_rel, std::memory_order::acquire
            );
        }
    }

    // neither emits nor expects calls anymore
    [[nodiscard]] bool is_finished() const {
        return state_.load(std::memory_order::acquire) == scalar_state_finished;
    }

private:
    subscriber<ValueT, ErrorT>& subscriber_;
    const ValueT& value_;
    Atomic<std::uint32_t> state_{ scalar_state_ready };
};

} // namespace sl::mono
