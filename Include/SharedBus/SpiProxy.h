/**
 * @file SpiProxy.h
 * @brief Stand-in for an SPI bus handle, restricted to one execution context
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <stdint.h>
#include <type_traits>
#include <utility>

#include <etl/span.h>

#include "BusMutex.h"
#include "Hal/Spi.h"

namespace sharedbus
{
    /**
     * @brief Proxy for sharing an SPI bus
     *
     * Offers the same operations as the bus handle (see Hal/Spi.h) and forwards
     * each one under the mutex, returning the bus's result untouched.
     *
     * @note SpiProxy can only share a bus within a single thread or task.
     * SPI drivers assert their chip-select line before calling transfer/write and
     * release it afterwards, which is outside the lock. Two contexts could
     * therefore have their chip-selects asserted at the same time. To rule that
     * out:
     *   - SpiProxy can only be constructed from a mutex that declares
     *     SINGLE_CONTEXT = true, any other mutex does not compile;
     *   - SpiProxy is ContextBound, requireTransferable() rejects it at compile time.
     * The driver must still assert chip-select and call the proxy without
     * yielding in between.
     *
     * @tparam M Bus mutex type (see BusMutex.h)
     */
    template <typename M>
    class SpiProxy : private ContextBound
    {
    public:
        using Mutex = M;
        using Bus = typename M::Bus;

        template <typename MutexT = M, typename = std::enable_if_t<IsSingleContext<MutexT>::value>>
        explicit SpiProxy(const M &mutex)
            : mutex(&mutex)
        {
        }

        /**
         * @brief Full duplex, in place transfer
         *
         * @return The bus's result, on success a view of the received words
         */
        template <typename B = Bus>
        auto transfer(etl::span<uint8_t> words)
            -> decltype(std::declval<B &>().transfer(words))
        {
            return mutex->lock([&](Bus &bus) { return bus.transfer(words); });
        }

        template <typename B = Bus>
        auto write(etl::span<const uint8_t> words)
            -> decltype(std::declval<B &>().write(words))
        {
            return mutex->lock([&](Bus &bus) { return bus.write(words); });
        }

        template <typename B = Bus>
        auto exec(etl::span<hal::spi::Operation> operations)
            -> decltype(std::declval<B &>().exec(operations))
        {
            return mutex->lock([&](Bus &bus) { return bus.exec(operations); });
        }

    private:
        const M *mutex;
    };

} // namespace sharedbus
