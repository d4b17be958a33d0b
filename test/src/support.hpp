//
// Created by usatiynyan.
// Hand-driven publisher, recording subscriber and recording drop sink shared by the tests.
//

#pragma once

#include "sl/mono/model.hpp"

#include <sl/meta/monad/maybe.hpp>

#include <function2/function2.hpp>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <system_error>
#include <utility>
#include <vector>

namespace sl::mono::test {

// records every interaction, emits only when told to
template <typename ValueT, typename ErrorT = std::error_code>
struct manual_source final
    : publisher<ValueT, ErrorT>
    , subscription {
    // `start_on_subscribe == false` lets the test choose when on_subscribe happens
    explicit manual_source(bool start_on_subscribe = true) : start_on_subscribe_{ start_on_subscribe } {}

    void subscribe(subscriber<ValueT, ErrorT>& a_subscriber) & override {
        subscribe_count.fetch_add(1);
        subscriber_ = &a_subscriber;
        if (start_on_subscribe_) {
            a_subscriber.on_subscribe(*this);
        }
    }

    void request(std::int64_t n) & override {
        request_count.fetch_add(1);
        last_request.store(n);
    }

    void cancel() & override {
        cancel_count.fetch_add(1);
        if (on_cancel) {
            on_cancel();
        }
    }

public:
    void start() { subscriber_->on_subscribe(*this); }
    void emit_next(ValueT value) { subscriber_->on_next(std::move(value)); }
    void emit_error(ErrorT error) { subscriber_->on_error(std::move(error)); }
    void emit_complete() { subscriber_->on_complete(); }

    [[nodiscard]] bool is_subscribed() const { return subscriber_ != nullptr; }

public:
    std::atomic<int> subscribe_count{ 0 };
    std::atomic<int> request_count{ 0 };
    std::atomic<int> cancel_count{ 0 };
    std::atomic<std::int64_t> last_request{ 0 };
    fu2::unique_function<void()> on_cancel{};

private:
    bool start_on_subscribe_;
    subscriber<ValueT, ErrorT>* subscriber_ = nullptr;
};

// answers the first request with a value, or with completion if there is none
template <typename ValueT, typename ErrorT = std::error_code>
struct just_source final
    : publisher<ValueT, ErrorT>
    , subscription {
    explicit just_source(meta::maybe<ValueT> maybe_value) : maybe_value_{ std::move(maybe_value) } {}

    void subscribe(subscriber<ValueT, ErrorT>& a_subscriber) & override {
        subscribe_count.fetch_add(1);
        subscriber_ = &a_subscriber;
        a_subscriber.on_subscribe(*this);
    }

    void request(std::int64_t) & override {
        request_count.fetch_add(1);
        if (std::exchange(done_, true)) {
            return;
        }
        if (maybe_value_.has_value()) {
            subscriber_->on_next(ValueT{ maybe_value_.value() });
        }
        subscriber_->on_complete();
    }

    void cancel() & override { cancel_count.fetch_add(1); }

public:
    std::atomic<int> subscribe_count{ 0 };
    std::atomic<int> request_count{ 0 };
    std::atomic<int> cancel_count{ 0 };

private:
    meta::maybe<ValueT> maybe_value_;
    subscriber<ValueT, ErrorT>* subscriber_ = nullptr;
    bool done_ = false;
};

template <typename ValueT, typename ErrorT = std::error_code>
struct recording_subscriber final : subscriber<ValueT, ErrorT> {
    explicit recording_subscriber(std::int64_t initial_request = 1) : initial_request_{ initial_request } {}

    void on_subscribe(subscription& a_subscription) & override {
        {
            std::lock_guard lock{ m_ };
            ++subscribe_count_;
            subscription_ = &a_subscription;
        }
        if (initial_request_ != 0) {
            a_subscription.request(initial_request_);
        }
    }

    void on_next(ValueT&& value) & override {
        std::lock_guard lock{ m_ };
        values_.push_back(std::move(value));
    }

    void on_error(ErrorT&& error) & override {
        std::lock_guard lock{ m_ };
        errors_.push_back(std::move(error));
    }

    void on_complete() & override {
        std::lock_guard lock{ m_ };
        ++complete_count_;
    }

public:
    [[nodiscard]] int subscribe_count() const {
        std::lock_guard lock{ m_ };
        return subscribe_count_;
    }
    [[nodiscard]] std::vector<ValueT> values() const {
        std::lock_guard lock{ m_ };
        return values_;
    }
    [[nodiscard]] std::vector<ErrorT> errors() const {
        std::lock_guard lock{ m_ };
        return errors_;
    }
    [[nodiscard]] int complete_count() const {
        std::lock_guard lock{ m_ };
        return complete_count_;
    }
    [[nodiscard]] subscription* get_subscription() const {
        std::lock_guard lock{ m_ };
        return subscription_;
    }
    [[nodiscard]] int terminal_count() const {
        std::lock_guard lock{ m_ };
        return complete_count_ + static_cast<int>(errors_.size());
    }

private:
    std::int64_t initial_request_;
    mutable std::mutex m_;
    int subscribe_count_ = 0;
    std::vector<ValueT> values_;
    std::vector<ErrorT> errors_;
    int complete_count_ = 0;
    subscription* subscription_ = nullptr;
};

template <typename ValueT, typename ErrorT = std::error_code>
struct recording_drop_sink final : drop_sink<ValueT, ErrorT> {
    void on_next_dropped(ValueT&& value) & override {
        std::lock_guard lock{ m_ };
        values_.push_back(std::move(value));
    }

    void on_error_dropped(ErrorT&& error) & override {
        std::lock_guard lock{ m_ };
        errors_.push_back(std::move(error));
    }

public:
    [[nodiscard]] std::vector<ValueT> values() const {
        std::lock_guard lock{ m_ };
        return values_;
    }
    [[nodiscard]] std::vector<ErrorT> errors() const {
        std::lock_guard lock{ m_ };
        return errors_;
    }

private:
    mutable std::mutex m_;
    std::vector<ValueT> values_;
    std::vector<ErrorT> errors_;
};

} // namespace sl::mono::test
