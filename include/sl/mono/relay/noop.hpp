//
// Created by usatiynyan.
// Sentinel that takes the place of a broadcaster once it has been drained,
// late terminal signals and late cancellations land here and vanish.
//

#pragma once

#include "sl/mono/model/concept.hpp"

namespace sl::mono {

template <typename ValueT, typename ErrorT>
struct noop_processor final : processor<ValueT, ErrorT> {
    static noop_processor& instance() {
        static noop_processor an_instance;
        return an_instance;
    }

    void subscribe(subscriber<ValueT, ErrorT>&) & override {}

    void on_subscribe(subscription&) & override {}
    void on_next(ValueT&&) & override {}
    void on_error(ErrorT&&) & override {}
    void on_complete() & override {}

private:
    noop_processor() = default;
};

} // namespace sl::mono
