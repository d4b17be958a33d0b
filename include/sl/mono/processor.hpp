//
// Created by usatiynyan.
//

#pragma once

#include "sl/mono/processor/config.hpp"
#include "sl/mono/processor/mono.hpp"
#include "sl/mono/processor/state.hpp"
