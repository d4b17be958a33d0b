//
// Created by usatiynyan.
//

#pragma once

#include "sl/mono/model/concept.hpp"

namespace sl::mono {

// `source | cell | consumer` subscribes every stage to the one on its left
template <typename ValueT, typename ErrorT>
publisher<ValueT, ErrorT>& operator|(publisher<ValueT, ErrorT>& a_publisher, processor<ValueT, ErrorT>& a_processor) {
    a_publisher.subscribe(a_processor);
    return a_processor;
}

template <typename ValueT, typename ErrorT>
void operator|(publisher<ValueT, ErrorT>& a_publisher, subscriber<ValueT, ErrorT>& a_subscriber) {
    a_publisher.subscribe(a_subscriber);
}

} // namespace sl::mono
