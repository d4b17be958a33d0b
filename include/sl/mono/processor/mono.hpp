//
// Created by usatiynyan.
// usage:
//  - `mono_processor<T> cell;` and feed it via on_next/on_complete/on_error, or
//  - `mono_processor<T> cell{ source };` and the source gets subscribed on first demand
//  - attach any number of subscribers via `cell.subscribe(s)`, before or after resolution
//  - `cell.get(timeout)` / `cell.peek()` for callers that don't stream
// Resolves at most once, the outcome is cached forever.
// Lifetime: the source and any subscription passed to on_subscribe must outlive the cell,
// a cell discarded before resolution cancels the upstream it still holds.
// Subscribers must be done with their subscriptions before the cell goes away.
//

#pragma once

#include "sl/mono/model/concept.hpp"
#include "sl/mono/model/drop_sink.hpp"
#include "sl/mono/model/error.hpp"
#include "sl/mono/processor/config.hpp"
#include "sl/mono/processor/state.hpp"
#include "sl/mono/relay/empty.hpp"
#include "sl/mono/relay/noop.hpp"
#include "sl/mono/relay/replay.hpp"
#include "sl/mono/relay/scalar.hpp"
#include "sl/mono/thread/detail/config.hpp"
#include "sl/mono/thread/detail/lock_free_stack.hpp"

#include <sl/meta/monad/maybe.hpp>
#include <sl/meta/monad/result.hpp>
#include <sl/meta/traits/unique.hpp>

#include <libassert/assert.hpp>

#include <chrono>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <system_error>
#include <thread>
#include <tuple>
#include <utility>

namespace sl::mono {

template <
    std::copy_constructible ValueT,
    ProtocolError ErrorT = std::error_code,
    template <typename> typename Atomic = detail::atomic>
struct mono_processor final
    : processor<ValueT, ErrorT>
    , subscription
    , meta::immovable {
    using result_type = meta::result<meta::maybe<ValueT>, ErrorT>;
    using broadcaster_type = processor<ValueT, ErrorT>;
    using relay_type = replay_processor<ValueT, ErrorT, detail::mutex, Atomic>;
    using sentinel_type = noop_processor<ValueT, ErrorT>;
    using scalar_type = scalar_subscription<ValueT, ErrorT, Atomic>;
    using drop_sink_type = drop_sink<ValueT, ErrorT>;

    enum requested_state : std::uint32_t {
        requested_none = 0,
        requested_pending,
        requested_forwarded,
    };

    enum claim_state : std::uint32_t {
        claim_free = 0,
        claim_taken,
    };

public:
    mono_processor() : mono_processor{ default_drop_sink<ValueT, ErrorT>() } {}

    explicit mono_processor(drop_sink_type& a_drop_sink) : source_{ nullptr }, drop_sink_{ a_drop_sink } {}

    explicit mono_processor(
        publisher<ValueT, ErrorT>& source,
        drop_sink_type& a_drop_sink = default_drop_sink<ValueT, ErrorT>()
    )
        : source_{ &source }, drop_sink_{ a_drop_sink } {}

    ~mono_processor() override {
        // discarded before resolution
        if (auto* upstream = upstream_.exchange(nullptr, std::memory_order::acq_rel); upstream != nullptr) {
            upstream->cancel();
        }
        if (auto* broadcaster = broadcaster_.load(std::memory_order::acquire); is_real(broadcaster)) {
            delete broadcaster;
        }
        late_subscriptions_.clear();
    }

public: // upstream-facing
    void on_subscribe(subscription& upstream) & override {
        subscription* expected = nullptr;
        if (!upstream_.compare_exchange_strong(
                expected, &upstream, std::memory_order::acq_rel, std::memory_order::acquire
            )) {
            upstream.cancel();
            drop_sink_.on_error_dropped(make_protocol_error<ErrorT>(errc::duplicate_subscription));
            return;
        }

        if (!is_pending_state(state_.load(std::memory_order::acquire))) {
            release_upstream_and_cancel();
            return;
        }

        mono_state expected_state = mono_state::ready;
        if (!state_.compare_exchange_strong(
                expected_state, mono_state::subscribed, std::memory_order::acq_rel, std::memory_order::acquire
            )) {
            // lost to a signal that is settling the cell right now
            release_upstream_and_cancel();
            if (expected_state == mono_state::subscribed || expected_state == mono_state::post_subscribed) {
                // an earlier upstream existed and got released by that signal
                drop_sink_.on_error_dropped(make_protocol_error<ErrorT>(errc::duplicate_subscription));
            }
            return;
        }

        drain();
    }

    void on_next(ValueT&& value) & override {
        if (!has_legitimate_upstream() || !try_claim()) {
            drop_sink_.on_next_dropped(std::move(value));
            return;
        }

        // single value is all we ever want
        release_upstream_and_cancel();

        value_.emplace(std::move(value));
        if (!try_resolve(mono_state::resolved_value)) {
            drop_sink_.on_next_dropped(std::move(value_).value());
            value_.reset();
            return;
        }

        drain();
    }

    void on_error(ErrorT&& error) & override { fail(std::move(error), /* cancel_upstream = */ false); }

    void on_complete() & override {
        if (!try_claim()) {
            return;
        }

        upstream_.store(nullptr, std::memory_order::release);

        if (!try_resolve(mono_state::resolved_empty)) {
            return;
        }

        drain();
    }

public: // downstream-facing
    void request(std::int64_t n) & override {
        if (n <= 0) [[unlikely]] {
            fail(make_protocol_error<ErrorT>(errc::invalid_demand), /* cancel_upstream = */ true);
        } else {
            std::uint32_t expected = requested_none;
            std::ignore = requested_.compare_exchange_strong(
                expected, requested_pending, std::memory_order::acq_rel, std::memory_order::acquire
            );
        }

        drain();
    }

    void cancel() & override {
        mono_state state = state_.load(std::memory_order::acquire);
        do {
            if (!is_pending_state(state)) {
                return;
            }
        } while (!state_.compare_exchange_weak(
            state, mono_state::cancelled, std::memory_order::acq_rel, std::memory_order::acquire
        ));

        drain();
    }

    void subscribe(subscriber<ValueT, ErrorT>& a_subscriber) & override {
        if (try_subscribe_settled(a_subscriber)) {
            return;
        }

        broadcaster_type* broadcaster = ensure_broadcaster();
        if (broadcaster == sentinel()) {
            // sentinel is only installed once the state has settled
            [[maybe_unused]] const bool settled = try_subscribe_settled(a_subscriber);
            DEBUG_ASSERT(settled);
            return;
        }

        broadcaster->subscribe(a_subscriber);
        drain();
    }

public: // blocking
    // blocks at most for `timeout`, deadline results in `errc::timed_out` and leaves the state as is
    result_type get(std::chrono::milliseconds timeout, wait_config config = {}) & {
        connect();
        request(1);

        if (!is_pending()) {
            return settled_result();
        }

        const auto deadline = deadline_after(timeout);
        while (true) {
            if (!is_pending_state(state_.load(std::memory_order::acquire))) {
                return settled_result();
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                return meta::err(make_protocol_error<ErrorT>(errc::timed_out));
            }
            std::this_thread::sleep_for(config.poll_interval);
        }
    }

    // never blocks, empty while pending
    result_type peek() & {
        connect();
        request(1);
        return settled_result();
    }

public: // introspection
    [[nodiscard]] mono_state state() const& { return state_.load(std::memory_order::acquire); }

    [[nodiscard]] bool is_pending() const& { return is_pending_state(state()); }
    [[nodiscard]] bool is_started() const& {
        const mono_state a_state = state();
        return a_state == mono_state::subscribed || a_state == mono_state::post_subscribed;
    }
    [[nodiscard]] bool is_success() const& {
        const mono_state a_state = state();
        return a_state == mono_state::resolved_value || a_state == mono_state::resolved_empty;
    }
    [[nodiscard]] bool is_error() const& { return state() == mono_state::errored; }
    [[nodiscard]] bool is_cancelled() const& { return state() == mono_state::cancelled; }
    [[nodiscard]] bool is_terminated() const& { return is_terminal_state(state()); }

    [[nodiscard]] meta::maybe<ErrorT> current_error() const& {
        if (state() != mono_state::errored) {
            return meta::null;
        }
        return error_.value();
    }

    [[nodiscard]] subscription* upstream() const& { return upstream_.load(std::memory_order::acquire); }

    // late subscriptions handed out on a resolved value and not reclaimed yet
    [[nodiscard]] std::size_t late_subscription_count() const& {
        return late_subscription_count_.load(std::memory_order::relaxed);
    }

private:
    static broadcaster_type* sentinel() { return &sentinel_type::instance(); }
    static bool is_real(broadcaster_type* broadcaster) { return broadcaster != nullptr && broadcaster != sentinel(); }

    // saturates instead of overflowing, `milliseconds::max()` means no deadline at all
    static std::chrono::steady_clock::time_point deadline_after(std::chrono::milliseconds timeout) {
        using clock = std::chrono::steady_clock;
        const clock::time_point now = clock::now();
        if (timeout <= std::chrono::milliseconds::zero()) {
            return now;
        }
        const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(clock::time_point::max() - now);
        if (timeout >= headroom) {
            return clock::time_point::max();
        }
        return now + timeout;
    }

    bool has_legitimate_upstream() const {
        return source_ == nullptr || upstream_.load(std::memory_order::acquire) != nullptr;
    }

    bool try_claim() { return claim_.exchange(claim_taken, std::memory_order::acq_rel) == claim_free; }

    bool try_resolve(mono_state target) {
        mono_state state = state_.load(std::memory_order::acquire);
        do {
            if (!is_pending_state(state)) {
                return false;
            }
        } while (!state_.compare_exchange_weak(state, target, std::memory_order::acq_rel, std::memory_order::acquire));
        return true;
    }

    void fail(ErrorT&& error, bool cancel_upstream) {
        if (!has_legitimate_upstream() || !try_claim()) {
            drop_sink_.on_error_dropped(std::move(error));
            return;
        }

        // a failing upstream is done already, it must not be called back
        auto* upstream = upstream_.exchange(nullptr, std::memory_order::acq_rel);
        if (cancel_upstream && upstream != nullptr) {
            upstream->cancel();
        }

        error_.emplace(std::move(error));
        if (!try_resolve(mono_state::errored)) {
            drop_sink_.on_error_dropped(std::move(error_).value());
            error_.reset();
            return;
        }

        drain();
    }

    void release_upstream_and_cancel() {
        if (auto* upstream = upstream_.exchange(nullptr, std::memory_order::acq_rel); upstream != nullptr) {
            upstream->cancel();
        }
    }

    // starts a bound source without a subscriber, so that blocking accessors have something to wait for
    void connect() {
        if (source_ != nullptr && is_pending()) {
            std::ignore = ensure_broadcaster();
        }
    }

    [[nodiscard]] broadcaster_type* ensure_broadcaster() {
        broadcaster_type* broadcaster = broadcaster_.load(std::memory_order::acquire);
        if (broadcaster != nullptr) {
            return broadcaster;
        }

        auto candidate = std::make_unique<relay_type>();
        if (!broadcaster_.compare_exchange_strong(
                broadcaster, candidate.get(), std::memory_order::acq_rel, std::memory_order::acquire
            )) {
            return broadcaster;
        }

        broadcaster = candidate.release();
        if (source_ != nullptr) {
            source_->subscribe(*this);
        }
        return broadcaster;
    }

    bool try_subscribe_settled(subscriber<ValueT, ErrorT>& a_subscriber) {
        switch (state_.load(std::memory_order::acquire)) {
        case mono_state::resolved_empty:
            empty_subscription::complete(a_subscriber);
            return true;
        case mono_state::resolved_value: {
            const std::size_t reclaimed = late_subscriptions_.reclaim([](scalar_type& a_scalar) {
                return a_scalar.is_finished();
            });
            late_subscription_count_.fetch_sub(reclaimed, std::memory_order::relaxed);

            auto* scalar = new scalar_type{ a_subscriber, value_.value() };
            late_subscriptions_.push(scalar);
            late_subscription_count_.fetch_add(1, std::memory_order::relaxed);
            scalar->start();
            return true;
        }
        case mono_state::errored:
            empty_subscription::error(a_subscriber, ErrorT{ error_.value() });
            return true;
        case mono_state::cancelled:
            empty_subscription::inert(a_subscriber);
            return true;
        default:
            return false;
        }
    }

    result_type settled_result() const {
        switch (state_.load(std::memory_order::acquire)) {
        case mono_state::resolved_value:
            return result_type{ meta::maybe<ValueT>{ value_.value() } };
        case mono_state::errored:
            return meta::err(error_.value());
        default:
            return result_type{};
        }
    }

    // whoever moves wip_ from 0 drains on behalf of everyone who signalled meanwhile
    void drain() {
        if (wip_.fetch_add(1, std::memory_order::acq_rel) != 0) {
            return;
        }

        std::uint32_t missed = 1;
        while (true) {
            const mono_state state = state_.load(std::memory_order::acquire);

            if (is_terminal_state(state)) {
                broadcaster_type* broadcaster = broadcaster_.exchange(sentinel(), std::memory_order::acq_rel);
                if (is_real(broadcaster)) {
                    retired_broadcaster_.reset(broadcaster);
                    deliver_terminal(*broadcaster, state);
                    // nothing is left to serialize, wip_ stays claimed for good
                    return;
                }
            }

            if (state == mono_state::cancelled) {
                broadcaster_type* broadcaster = broadcaster_.exchange(sentinel(), std::memory_order::acq_rel);
                if (is_real(broadcaster)) {
                    retired_broadcaster_.reset(broadcaster);
                }
                release_upstream_and_cancel();
            }

            if (auto* upstream = upstream_.load(std::memory_order::acquire); upstream != nullptr) {
                std::uint32_t expected = requested_pending;
                if (requested_.load(std::memory_order::acquire) == requested_pending
                    && requested_.compare_exchange_strong(
                        expected, requested_forwarded, std::memory_order::acq_rel, std::memory_order::acquire
                    )) {
                    upstream->request(1);
                }
            }

            if (state == mono_state::subscribed) {
                broadcaster_type* broadcaster = broadcaster_.load(std::memory_order::acquire);
                mono_state expected = mono_state::subscribed;
                if (is_real(broadcaster)
                    && state_.compare_exchange_strong(
                        expected, mono_state::post_subscribed, std::memory_order::acq_rel, std::memory_order::acquire
                    )) {
                    hand_off(*broadcaster);
                }
            }

            const std::uint32_t prev = wip_.fetch_sub(missed, std::memory_order::acq_rel);
            missed = prev - missed;
            if (missed == 0) {
                break;
            }
        }
    }

    // only ever called from drain
    void hand_off(broadcaster_type& broadcaster) {
        if (!std::exchange(handed_off_, true)) {
            broadcaster.on_subscribe(*this);
        }
    }

    // only ever called from drain
    void deliver_terminal(broadcaster_type& broadcaster, mono_state state) {
        hand_off(broadcaster);

        switch (state) {
        case mono_state::resolved_value: {
            ValueT value_copy{ value_.value() };
            broadcaster.on_next(std::move(value_copy));
            broadcaster.on_complete();
            break;
        }
        case mono_state::resolved_empty:
            broadcaster.on_complete();
            break;
        case mono_state::errored: {
            ErrorT error_copy{ error_.value() };
            broadcaster.on_error(std::move(error_copy));
            break;
        }
        default:
            UNREACHABLE();
        }
    }

private:
    publisher<ValueT, ErrorT>* const source_;
    drop_sink_type& drop_sink_;

    // written once by whoever wins claim_, published by the release into a terminal state_
    meta::maybe<ValueT> value_{};
    meta::maybe<ErrorT> error_{};

    // touched only by the drain owner
    std::unique_ptr<broadcaster_type> retired_broadcaster_{};
    bool handed_off_ = false;

    detail::lock_free_stack<scalar_type, Atomic> late_subscriptions_{};
    Atomic<std::size_t> late_subscription_count_{ 0 };

    Atomic<subscription*> upstream_{ nullptr };
    Atomic<broadcaster_type*> broadcaster_{ nullptr };
    Atomic<std::uint32_t> requested_{ requested_none };
    Atomic<std::uint32_t> claim_{ claim_free };
    alignas(detail::hardware_destructive_interference_size) Atomic<mono_state> state_{ mono_state::ready };
    alignas(detail::hardware_destructive_interference_size) Atomic<std::uint32_t> wip_{ 0 };
};

} // namespace sl::mono
