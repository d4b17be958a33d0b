//
// Created by usatiynyan.
//

#include "sl/mono/relay/empty.hpp"

namespace sl::mono {

empty_subscription& empty_subscription::instance() {
    static empty_subscription an_instance;
    return an_instance;
}

} // namespace sl::mono
