/**
 * @file AdcProxy.h
 * @brief Stand-in for an ADC handle that serializes one-shot conversions
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <utility>

#include "BusMutex.h"
#include "Hal/Adc.h"
#include "Hal/Nb.h"

namespace sharedbus
{
    /**
     * @brief Proxy for sharing an ADC
     *
     * @warning read() BLOCKS although its signature is non-blocking.
     *
     * The ADC one-shot read is poll-based: the handle returns WouldBlock until
     * the conversion is finished. A conversion on a shared converter cannot be
     * left half done between polls, the next user would start a different
     * channel on top of it. The proxy therefore takes the mutex, polls the
     * handle until it reports a sample or an error, and only then releases the
     * mutex. Consequences for callers:
     *   - read() never returns WouldBlock;
     *   - the calling context stalls for the whole acquisition time;
     *   - every other proxy on the same mutex waits meanwhile.
     * The result type is kept identical to the handle's so drivers written for
     * the raw ADC keep compiling.
     *
     * @tparam M Bus mutex type (see BusMutex.h)
     */
    template <typename M>
    class AdcProxy
    {
    public:
        using Mutex = M;
        using Bus = typename M::Bus;

        explicit AdcProxy(const M &mutex)
            : mutex(&mutex)
        {
        }

        /**
         * @brief Converts one sample on the channel selected by pin
         *
         * @tparam Pin Channel type (see hal::adc::Channel)
         * @return The handle's result: the sample, or its error. Never WouldBlock.
         */
        template <typename Pin, typename B = Bus>
        auto read(Pin &pin)
            -> decltype(std::declval<B &>().read(pin))
        {
            static_assert(hal::adc::IsChannel<Pin>::value, "Pin must name its ADC Unit and a channel()");

            return mutex->lock([&](Bus &bus) {
                return hal::nb::block([&]() { return bus.read(pin); });
            });
        }

    private:
        const M *mutex;
    };

} // namespace sharedbus
