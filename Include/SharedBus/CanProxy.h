/**
 * @file CanProxy.h
 * @brief Stand-in for a CAN bus handle that serializes access through a bus mutex
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <utility>

#include "BusMutex.h"

namespace sharedbus
{
    /**
     * @brief Proxy for sharing a CAN bus
     *
     * transmit() and receive() each take the mutex on their own. Another user
     * may transmit or receive between two calls.
     *
     * @tparam M Bus mutex type (see BusMutex.h)
     */
    template <typename M>
    class CanProxy
    {
    public:
        using Mutex = M;
        using Bus = typename M::Bus;

        // The bus's own frame type, passed through unchanged
        using Frame = typename Bus::Frame;

        explicit CanProxy(const M &mutex)
            : mutex(&mutex)
        {
        }

        template <typename B = Bus>
        auto transmit(const Frame &frame)
            -> decltype(std::declval<B &>().transmit(frame))
        {
            return mutex->lock([&](Bus &bus) { return bus.transmit(frame); });
        }

        template <typename B = Bus>
        auto receive()
            -> decltype(std::declval<B &>().receive())
        {
            return mutex->lock([&](Bus &bus) { return bus.receive(); });
        }

    private:
        const M *mutex;
    };

} // namespace sharedbus
