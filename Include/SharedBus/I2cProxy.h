/**
 * @file I2cProxy.h
 * @brief Stand-in for an I2C bus handle that serializes access through a bus mutex
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <stdint.h>
#include <utility>

#include <etl/span.h>

#include "BusMutex.h"
#include "Hal/I2c.h"

namespace sharedbus
{
    /**
     * @brief Proxy for sharing an I2C bus
     *
     * Offers the same operations as the bus handle (see Hal/I2c.h), so it can be
     * given to a driver instead of the bus itself. Every call takes the mutex,
     * runs the one matching bus operation and returns its result untouched.
     * An operation is only present when the bus implements it.
     *
     * Each call is complete inside a single lock hold, including both phases of
     * writeRead and all segments of a transaction, so the proxy may be used from
     * any thread, task or interrupt the mutex is made for.
     *
     * Copies refer to the same mutex. Obtain one from BusManager::acquireI2c().
     *
     * @tparam M Bus mutex type (see BusMutex.h)
     */
    template <typename M>
    class I2cProxy
    {
    public:
        using Mutex = M;
        using Bus = typename M::Bus;

        explicit I2cProxy(const M &mutex)
            : mutex(&mutex)
        {
        }

        template <typename B = Bus>
        auto write(uint8_t address, etl::span<const uint8_t> bytes)
            -> decltype(std::declval<B &>().write(address, bytes))
        {
            return mutex->lock([&](Bus &bus) { return bus.write(address, bytes); });
        }

        template <typename B = Bus>
        auto read(uint8_t address, etl::span<uint8_t> buffer)
            -> decltype(std::declval<B &>().read(address, buffer))
        {
            return mutex->lock([&](Bus &bus) { return bus.read(address, buffer); });
        }

        template <typename B = Bus>
        auto writeRead(uint8_t address, etl::span<const uint8_t> bytes, etl::span<uint8_t> buffer)
            -> decltype(std::declval<B &>().writeRead(address, bytes, buffer))
        {
            return mutex->lock([&](Bus &bus) { return bus.writeRead(address, bytes, buffer); });
        }

        template <typename B = Bus>
        auto transaction(uint8_t address, etl::span<hal::i2c::Operation> operations)
            -> decltype(std::declval<B &>().transaction(address, operations))
        {
            return mutex->lock([&](Bus &bus) { return bus.transaction(address, operations); });
        }

    private:
        const M *mutex;
    };

} // namespace sharedbus
