//
// Created by usatiynyan.
//

#pragma once

#include "sl/mono/relay/empty.hpp"
#include "sl/mono/relay/noop.hpp"
#include "sl/mono/relay/replay.hpp"
#include "sl/mono/relay/scalar.hpp"
