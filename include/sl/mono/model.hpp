//
// Created by usatiynyan.
//

#pragma once

#include "sl/mono/model/concept.hpp"
#include "sl/mono/model/drop_sink.hpp"
#include "sl/mono/model/error.hpp"
#include "sl/mono/model/syntax.hpp"
