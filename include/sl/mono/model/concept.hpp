//
// Created by usatiynyan.
// Push-based protocol with demand:
//  - publisher::subscribe hands a subscriber over
//  - subscriber::on_subscribe is always the first signal, it carries the subscription
//  - demand is driven via subscription::request, at most one of on_complete/on_error ends it
//

#pragma once

#include <concepts>
#include <cstdint>

namespace sl::mono {

struct subscription {
    virtual ~subscription() = default;

    virtual void request(std::int64_t n) & = 0;
    virtual void cancel() & = 0;
};

template <typename ValueT, typename ErrorT>
struct subscriber {
    virtual ~subscriber() = default;

    virtual void on_subscribe(subscription&) & = 0;
    virtual void on_next(ValueT&&) & = 0;
    virtual void on_error(ErrorT&&) & = 0;
    virtual void on_complete() & = 0;
};

template <typename ValueT, typename ErrorT>
struct publisher {
    using value_type = ValueT;
    using error_type = ErrorT;

    virtual ~publisher() = default;

    virtual void subscribe(subscriber<ValueT, ErrorT>&) & = 0;
};

template <typename ValueT, typename ErrorT>
struct processor
    : subscriber<ValueT, ErrorT>
    , publisher<ValueT, ErrorT> {};

template <typename ValueT, typename ErrorT>
struct dummy_subscriber final : subscriber<ValueT, ErrorT> {
    explicit dummy_subscriber() = default;

    void on_subscribe(subscription&) & override {}
    void on_next(ValueT&&) & override {}
    void on_error(ErrorT&&) & override {}
    void on_complete() & override {}
};

template <typename PublisherT>
concept Publisher = requires {
    typename PublisherT::value_type;
    typename PublisherT::error_type;
} && std::derived_from<PublisherT, publisher<typename PublisherT::value_type, typename PublisherT::error_type>>;

template <typename SubscriberT, typename ValueT, typename ErrorT>
concept SubscriberOf = std::derived_from<SubscriberT, subscriber<ValueT, ErrorT>>;

template <Publisher PublisherT>
using ISubscriberFor = subscriber<typename PublisherT::value_type, typename PublisherT::error_type>;

} // namespace sl::mono
