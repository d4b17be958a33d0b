//
// Created by usatiynyan.
//

#pragma once

#include "sl/mono/model/concept.hpp"

#include <utility>

namespace sl::mono {

// stateless, every subscriber may share the same instance
struct empty_subscription final : subscription {
    static empty_subscription& instance();

    void request(std::int64_t) & override {}
    void cancel() & override {}

    template <typename ValueT, typename ErrorT>
    static void complete(subscriber<ValueT, ErrorT>& a_subscriber) {
        a_subscriber.on_subscribe(instance());
        a_subscriber.on_complete();
    }

    template <typename ValueT, typename ErrorT>
    static void error(subscriber<ValueT, ErrorT>& a_subscriber, ErrorT error) {
        a_subscriber.on_subscribe(instance());
        a_subscriber.on_error(std::move(error));
    }

    template <typename ValueT, typename ErrorT>
    static void inert(subscriber<ValueT, ErrorT>& a_subscriber) {
        a_subscriber.on_subscribe(instance());
    }

private:
    empty_subscription() = default;
};

} // namespace sl::mono
