//
// Created by usatiynyan.
// Retention list: pushed from any thread, swept of finished items on the way, drained by the owner.
//

#pragma once

#include "sl/mono/thread/detail/config.hpp"

#include <sl/meta/intrusive/forward_list.hpp>

#include <cstddef>

namespace sl::mono::detail {

template <typename T, template <typename> typename Atomic = detail::atomic>
struct lock_free_stack {
    using node_type = meta::intrusive_forward_list_node<T>;

    void push(node_type* new_node) {
        new_node->intrusive_next = head_.load(std::memory_order::relaxed);

        while (!head_.compare_exchange_weak(
            new_node->intrusive_next, new_node, std::memory_order::release, std::memory_order::relaxed
        )) {}
    }

    node_type* extract() {
        node_type* old_head = head_.load(std::memory_order::relaxed);

        while (old_head != nullptr
               && !head_.compare_exchange_weak(old_head, nullptr, std::memory_order::acquire, std::memory_order::relaxed)
        ) {}

        return old_head;
    }

    // takes everything out, deletes what `is_finished` accepts and pushes the rest back
    // concurrent pushes and reclaims are fine, each reclaim owns what it extracted
    template <typename PredicateF>
    std::size_t reclaim(PredicateF&& is_finished) {
        std::size_t reclaimed = 0;
        node_type* node = extract();
        while (node != nullptr) {
            node_type* next = node->intrusive_next;
            if (T* item = node->downcast(); is_finished(*item)) {
                delete item;
                ++reclaimed;
            } else {
                push(node);
            }
            node = next;
        }
        return reclaimed;
    }

    // not thread-safe, meant for destructors
    void clear() {
        node_type* node = extract();
        while (node != nullptr) {
            node_type* next = node->intrusive_next;
            delete node->downcast();
            node = next;
        }
    }

private:
    Atomic<node_type*> head_{ nullptr };
};

} // namespace sl::mono::detail
