//
// Created by usatiynyan.
//

#pragma once

#include "sl/mono/model/concept.hpp"

#include <function2/function2.hpp>

#include <cstdint>
#include <utility>

namespace sl::mono {

template <typename ValueT, typename ErrorT>
struct functor_subscriber final : subscriber<ValueT, ErrorT> {
    using next_function = fu2::unique_function<void(ValueT&&)>;
    using error_function = fu2::unique_function<void(ErrorT&&)>;
    using complete_function = fu2::unique_function<void()>;

public:
    // `initial_request == 0` leaves demand to the owner, see `get_subscription`
    functor_subscriber(
        next_function on_next,
        error_function on_error,
        complete_function on_complete,
        std::int64_t initial_request = 1
    )
        : on_next_{ std::move(on_next) }, on_error_{ std::move(on_error) }, on_complete_{ std::move(on_complete) },
          initial_request_{ initial_request } {}

    void on_subscribe(subscription& a_subscription) & override {
        subscription_ = &a_subscription;
        if (initial_request_ > 0) {
            a_subscription.request(initial_request_);
        }
    }
    void on_next(ValueT&& value) & override { on_next_(std::move(value)); }
    void on_error(ErrorT&& error) & override { on_error_(std::move(error)); }
    void on_complete() & override { on_complete_(); }

    [[nodiscard]] subscription* get_subscription() const& { return subscription_; }

private:
    next_function on_next_;
    error_function on_error_;
    complete_function on_complete_;
    std::int64_t initial_request_;
    subscription* subscription_ = nullptr;
};

template <typename ValueT, typename ErrorT, typename NextF, typename ErrorF, typename CompleteF>
functor_subscriber<ValueT, ErrorT>
    as_subscriber(NextF&& on_next, ErrorF&& on_error, CompleteF&& on_complete, std::int64_t initial_request = 1) {
    return functor_subscriber<ValueT, ErrorT>{
        /* .on_next = */ std::forward<NextF>(on_next),
        /* .on_error = */ std::forward<ErrorF>(on_error),
        /* .on_complete = */ std::forward<CompleteF>(on_complete),
        /* .initial_request = */ initial_request,
    };
}

} // namespace sl::mono
