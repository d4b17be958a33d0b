//
// Created by usatiynyan.
//

#pragma once

#include <chrono>

namespace sl::mono {

struct wait_config {
    // how often a blocked caller re-reads the state
    std::chrono::microseconds poll_interval{ std::chrono::milliseconds{ 1 } };
};

} // namespace sl::mono
