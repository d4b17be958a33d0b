//
// Created by usatiynyan.
// Where signals that arrived too late, or without a legitimate subscription, end up.
//

#pragma once

namespace sl::mono {

template <typename ValueT, typename ErrorT>
struct drop_sink {
    virtual ~drop_sink() = default;

    virtual void on_next_dropped(ValueT&&) & = 0;
    virtual void on_error_dropped(ErrorT&&) & = 0;
};

template <typename ValueT, typename ErrorT>
struct dummy_drop_sink final : drop_sink<ValueT, ErrorT> {
    explicit dummy_drop_sink() = default;

    void on_next_dropped(ValueT&&) & override {}
    void on_error_dropped(ErrorT&&) & override {}
};

template <typename ValueT, typename ErrorT>
drop_sink<ValueT, ErrorT>& default_drop_sink() {
    static dummy_drop_sink<ValueT, ErrorT> instance;
    return instance;
}

} // namespace sl::mono
