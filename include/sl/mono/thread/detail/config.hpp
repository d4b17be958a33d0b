//
// Created by usatiynyan.
// Injection points for the synchronization primitives every cell and relay is built from:
//  - SL_MONO_ATOMIC, template for all atomic fields, e.g. a model checker's atomic
//  - SL_MONO_MUTEX, lock type guarding relay bookkeeping
//  - SL_MONO_INTERFERENCE_SIZE, cache line size used to pad the hot atomics of a cell
//

#pragma once

#ifndef SL_MONO_ATOMIC
#include <atomic>
#define SL_MONO_ATOMIC std::atomic
#endif // SL_MONO_ATOMIC

#ifndef SL_MONO_MUTEX
#include <mutex>
#define SL_MONO_MUTEX std::mutex
#endif // SL_MONO_MUTEX

#if !SL_MONO_INTERFERENCE_SIZE && defined(__cpp_lib_hardware_interference_size)
#include <new>
#endif

#include <cstddef>

namespace sl::mono::detail {

template <typename T>
using atomic = SL_MONO_ATOMIC<T>;

using mutex = SL_MONO_MUTEX;

#if SL_MONO_INTERFERENCE_SIZE
inline constexpr std::size_t hardware_destructive_interference_size = SL_MONO_INTERFERENCE_SIZE;
#elif defined(__cpp_lib_hardware_interference_size)
using std::hardware_destructive_interference_size;
#else
inline constexpr std::size_t hardware_destructive_interference_size = 64;
#endif

} // namespace sl::mono::detail
