//
// Created by usatiynyan.
// Multicast relay that caches the last value and the terminal signal:
//  - every subscriber gets on_subscribe first, then the value on demand, then the terminal signal
//  - late subscribers get the cached outcome replayed
//  - single unit of demand is forwarded upstream, once any subscriber requests
//  - when all attached subscribers cancel before termination, upstream gets cancelled
//

#pragma once

#include "sl/mono/model/concept.hpp"
#include "sl/mono/model/error.hpp"
#include "sl/mono/thread/detail/config.hpp"

#include <sl/meta/monad/maybe.hpp>
#include <sl/meta/traits/unique.hpp>

#include <libassert/assert.hpp>

#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <utility>
#include <vector>

namespace sl::mono {

template <
    typename ValueT,
    ProtocolError ErrorT,
    typename Mutex = detail::mutex,
    template <typename> typename Atomic = detail::atomic>
struct replay_processor final
    : processor<ValueT, ErrorT>
    , meta::immovable {
private:
    struct inner_subscription final
        : subscription
        , meta::immovable {
        inner_subscription(replay_processor& self, subscriber<ValueT, ErrorT>& a_subscriber)
            : self_{ self }, subscriber_{ a_subscriber } {}

        void request(std::int64_t n) & override { self_.request_impl(*this, n); }
        void cancel() & override { self_.cancel_impl(*this); }

    private:
        friend replay_processor;

        replay_processor& self_;
        subscriber<ValueT, ErrorT>& subscriber_;
        Atomic<std::uint32_t> wip_{ 0 };

        // guarded by self_.m_
        std::int64_t demand_ = 0;
        bool subscribed_ = false;
        bool value_sent_ = false;
        bool invalid_demand_ = false;
        bool done_ = false;
    };

    enum class emission { none, subscribe, next, complete, error };

public:
    replay_processor() = default;

    void subscribe(subscriber<ValueT, ErrorT>& a_subscriber) & override {
        inner_subscription* inner = nullptr;
        {
            std::lock_guard lock{ m_ };
            inner = inners_.emplace_back(std::make_unique<inner_subscription>(*this, a_subscriber)).get();
            if (!terminated_) {
                ++live_;
            }
        }
        signal(*inner);
    }

    void on_subscribe(subscription& upstream) & override {
        bool forward_demand = false;
        {
            std::unique_lock lock{ m_ };
            if (upstream_seen_ || terminated_) {
                lock.unlock();
                upstream.cancel();
                return;
            }
            upstream_seen_ = true;
            upstream_ = &upstream;
            forward_demand = try_claim_upstream_demand();
        }
        if (forward_demand) {
            upstream.request(1);
        }
    }

    void on_next(ValueT&& value) & override {
        std::vector<inner_subscription*> snapshot;
        {
            std::lock_guard lock{ m_ };
            if (terminated_ || value_.has_value()) {
                return;
            }
            value_.emplace(std::move(value));
            snapshot = make_snapshot();
        }
        signal_all(snapshot);
    }

    void on_error(ErrorT&& error) & override {
        std::vector<inner_subscription*> snapshot;
        {
            std::lock_guard lock{ m_ };
            if (terminated_) {
                return;
            }
            terminated_ = true;
            upstream_ = nullptr;
            error_.emplace(std::move(error));
            snapshot = make_snapshot();
        }
        signal_all(snapshot);
    }

    void on_complete() & override {
        std::vector<inner_subscription*> snapshot;
        {
            std::lock_guard lock{ m_ };
            if (terminated_) {
                return;
            }
            terminated_ = true;
            upstream_ = nullptr;
            snapshot = make_snapshot();
        }
        signal_all(snapshot);
    }

public:
    [[nodiscard]] bool is_terminated() const& {
        std::lock_guard lock{ m_ };
        return terminated_;
    }

    [[nodiscard]] std::size_t subscriber_count() const& {
        std::lock_guard lock{ m_ };
        return live_;
    }

private:
    void request_impl(inner_subscription& inner, std::int64_t n) {
        subscription* upstream = nullptr;
        {
            std::lock_guard lock{ m_ };
            if (inner.done_) {
                return;
            }
            if (n <= 0) [[unlikely]] {
                inner.invalid_demand_ = true;
            } else {
                constexpr std::int64_t max_demand = std::numeric_limits<std::int64_t>::max();
                inner.demand_ = inner.demand_ > max_demand - n ? max_demand : inner.demand_ + n;
                if (try_claim_upstream_demand()) {
                    upstream = upstream_;
                }
            }
        }
        if (upstream != nullptr) {
            upstream->request(1);
        }
        signal(inner);
    }

    void cancel_impl(inner_subscription& inner) {
        subscription* upstream = nullptr;
        {
            std::lock_guard lock{ m_ };
            if (std::exchange(inner.done_, true)) {
                return;
            }
            if (!terminated_) {
                DEBUG_ASSERT(live_ > 0);
                if (--live_ == 0) {
                    upstream = std::exchange(upstream_, nullptr);
                }
            }
        }
        if (upstream != nullptr) {
            upstream->cancel();
        }
    }

    // guarded by m_
    bool try_claim_upstream_demand() {
        if (upstream_ == nullptr || upstream_requested_ || terminated_) {
            return false;
        }
        for (const auto& inner : inners_) {
            if (!inner->done_ && inner->demand_ > 0) {
                upstream_requested_ = true;
                return true;
            }
        }
        return false;
    }

    // guarded by m_
    std::vector<inner_subscription*> make_snapshot() const {
        std::vector<inner_subscription*> snapshot;
        snapshot.reserve(inners_.size());
        for (const auto& inner : inners_) {
            snapshot.push_back(inner.get());
        }
        return snapshot;
    }

    void signal_all(const std::vector<inner_subscription*>& snapshot) {
        for (inner_subscription* inner : snapshot) {
            signal(*inner);
        }
    }

    // serializes emissions per subscriber, whoever increments from 0 emits on behalf of everyone else
    void signal(inner_subscription& inner) {
        if (inner.wip_.fetch_add(1, std::memory_order::acq_rel) != 0) {
            return;
        }

        std::uint32_t missed = 1;
        while (true) {
            while (emit_one(inner)) {}

            const std::uint32_t prev = inner.wip_.fetch_sub(missed, std::memory_order::acq_rel);
            missed = prev - missed;
            if (missed == 0) {
                break;
            }
        }
    }

    bool emit_one(inner_subscription& inner) {
        emission what = emission::none;
        meta::maybe<ValueT> maybe_value;
        meta::maybe<ErrorT> maybe_error;
        {
            std::lock_guard lock{ m_ };
            what = next_emission(inner, maybe_value, maybe_error);
        }

        switch (what) {
        case emission::none:
            return false;
        case emission::subscribe:
            inner.subscriber_.on_subscribe(inner);
            return true;
        case emission::next:
            inner.subscriber_.on_next(std::move(maybe_value).value());
            return true;
        case emission::complete:
            inner.subscriber_.on_complete();
            return false;
        case emission::error:
            inner.subscriber_.on_error(std::move(maybe_error).value());
            return false;
        }
        UNREACHABLE();
    }

    // guarded by m_
    emission
        next_emission(inner_subscription& inner, meta::maybe<ValueT>& maybe_value, meta::maybe<ErrorT>& maybe_error) {
        if (inner.done_) {
            return emission::none;
        }
        if (!inner.subscribed_) {
            inner.subscribed_ = true;
            return emission::subscribe;
        }
        if (inner.invalid_demand_) {
            finish(inner);
            maybe_error.emplace(make_protocol_error<ErrorT>(errc::invalid_demand));
            return emission::error;
        }
        if (value_.has_value() && !inner.value_sent_ && inner.demand_ > 0) {
            inner.value_sent_ = true;
            --inner.demand_;
            maybe_value.emplace(value_.value()); // copy, every subscriber gets its own
            return emission::next;
        }
        if (error_.has_value()) {
            finish(inner);
            maybe_error.emplace(error_.value());
            return emission::error;
        }
        if (terminated_ && (!value_.has_value() || inner.value_sent_)) {
            finish(inner);
            return emission::complete;
        }
        return emission::none;
    }

    // guarded by m_
    void finish(inner_subscription& inner) {
        inner.done_ = true;
        if (!terminated_) {
            DEBUG_ASSERT(live_ > 0);
            --live_;
        }
    }

private:
    mutable Mutex m_{};
    std::vector<std::unique_ptr<inner_subscription>> inners_{};
    std::size_t live_ = 0;
    subscription* upstream_ = nullptr;
    bool upstream_seen_ = false;
    bool upstream_requested_ = false;
    bool terminated_ = false;
    meta::maybe<ValueT> value_{};
    meta::maybe<ErrorT> error_{};
};

} // namespace sl::mono
