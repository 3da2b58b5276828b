/**
 * @file BusMutex.h
 * @brief Requirements on the lock that guards a shared bus, and the
 *        execution-context markers used by the proxies
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <type_traits>
#include <utility>

namespace sharedbus
{
    /**
     * A bus mutex M is supplied by the application (critical section, RTOS
     * mutex, single-task cell, ...). sharedbus only relies on this shape:
     *
     *   class M {
     *   public:
     *       using Bus = ...;                                  // the raw bus handle type
     *       static constexpr bool SINGLE_CONTEXT = ...;       // optional, defaults to false
     *
     *       explicit M(Bus bus);                              // takes ownership of the bus
     *
     *       template <typename F>
     *       auto lock(F &&f) const -> decltype(f(std::declval<Bus &>()));
     *   };
     *
     * lock() acquires exclusive access, runs f exactly once with a mutable
     * reference to the bus, releases access and returns f's result unchanged.
     * At most one f may be running at any time within the concurrency domain
     * the mutex is made for. lock() is const: proxies only hold a const
     * reference, the mutex keeps its state mutable.
     *
     * SINGLE_CONTEXT = true declares that every user of this mutex runs in the
     * same execution context (one thread, one task, no preemption between
     * users). Only such mutexes may hand out SpiProxy.
     */

    namespace detail
    {
        template <typename Bus>
        struct LockProbe
        {
            int operator()(Bus &) const
            {
                return 0;
            }
        };
    } // namespace detail

    /**
     * @brief True when M satisfies the bus mutex requirements above
     *
     * The probe checks that lock() returns the closure's own result type.
     */
    template <typename M, typename = void>
    struct IsBusMutex : std::false_type
    {
    };

    template <typename M>
    struct IsBusMutex<M, std::void_t<typename M::Bus,
                                     decltype(std::declval<const M &>().lock(detail::LockProbe<typename M::Bus>()))>>
        : std::integral_constant<bool,
                                 std::is_constructible<M, typename M::Bus>::value &&
                                     std::is_same<decltype(std::declval<const M &>().lock(
                                                      detail::LockProbe<typename M::Bus>())),
                                                  int>::value>
    {
    };

    /**
     * @brief True only when M declares SINGLE_CONTEXT = true
     */
    template <typename M, typename = void>
    struct IsSingleContext : std::false_type
    {
    };

    template <typename M>
    struct IsSingleContext<M, std::void_t<decltype(M::SINGLE_CONTEXT)>>
        : std::integral_constant<bool, M::SINGLE_CONTEXT>
    {
    };

    /**
     * @brief Tag base for types that must stay in the execution context that created them
     */
    struct ContextBound
    {
    };

    /**
     * @brief True when T may be moved to another thread or task
     *
     * False for ContextBound types and for anything that exposes a Mutex type
     * declaring SINGLE_CONTEXT, since such a mutex never excludes across contexts.
     */
    template <typename T, typename = void>
    struct IsContextTransferable : std::integral_constant<bool, !std::is_base_of<ContextBound, T>::value>
    {
    };

    template <typename T>
    struct IsContextTransferable<T, std::void_t<typename T::Mutex>>
        : std::integral_constant<bool, !std::is_base_of<ContextBound, T>::value &&
                                           !IsSingleContext<typename T::Mutex>::value>
    {
    };

    /**
     * @brief Compile-time gate for code that hands an object to another thread or task
     *
     * Task spawning helpers call this for every argument they move into the new
     * context. A ContextBound argument, or a proxy over a single-context mutex,
     * fails the build.
     */
    template <typename T>
    constexpr void requireTransferable()
    {
        static_assert(IsContextTransferable<std::decay_t<T>>::value,
                      "This object is bound to the execution context that created it and cannot be "
                      "handed to another thread or task");
    }

} // namespace sharedbus
