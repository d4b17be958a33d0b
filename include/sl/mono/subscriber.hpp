//
// Created by usatiynyan.
//

#pragma once

#include "sl/mono/subscriber/functor.hpp"
