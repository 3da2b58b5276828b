/**
 * @file BusManager.h
 * @brief Owner of a shared bus and factory for its proxies
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <utility>

#include "BusMutex.h"
#include "I2cProxy.h"
#include "SpiProxy.h"
#include "AdcProxy.h"
#include "CanProxy.h"

namespace sharedbus
{
    /**
     * @brief Owns one bus mutex (and through it the bus) and hands out proxies
     *
     * Usage:
     * @code
     *   sharedbus::BusManager<RtosMutex<I2cController>> manager(std::move(controller));
     *   Tmp102<sharedbus::I2cProxy<RtosMutex<I2cController>>> thermometer(manager.acquireI2c());
     *   Bmp280<sharedbus::I2cProxy<RtosMutex<I2cController>>> barometer(manager.acquireI2c());
     * @endcode
     *
     * Proxies keep a reference to the mutex inside the manager. The manager must
     * outlive every proxy acquired from it, which is why it can be neither copied
     * nor moved. Acquiring a proxy does not touch the bus.
     *
     * @tparam M Bus mutex type (see BusMutex.h)
     */
    template <typename M>
    class BusManager
    {
        static_assert(IsBusMutex<M>::value,
                      "M must provide Bus, a constructor taking Bus and a const lock(f) returning f's result");

    public:
        using Bus = typename M::Bus;

        explicit BusManager(Bus bus)
            : mutex(std::move(bus))
        {
        }

        BusManager(const BusManager &) = delete;
        BusManager &operator=(const BusManager &) = delete;
        BusManager(BusManager &&) = delete;
        BusManager &operator=(BusManager &&) = delete;

        I2cProxy<M> acquireI2c() const
        {
            return I2cProxy<M>(mutex);
        }

        /**
         * @brief Acquires an SPI proxy, only for SINGLE_CONTEXT mutexes
         *
         * @see SpiProxy for why sharing SPI across contexts is refused
         */
        template <typename Mutex = M>
        SpiProxy<Mutex> acquireSpi() const
        {
            static_assert(IsSingleContext<Mutex>::value,
                          "SpiProxy requires a SINGLE_CONTEXT bus mutex: chip-select is asserted outside "
                          "the lock, sharing SPI across threads or tasks is not safe");
            return SpiProxy<Mutex>(mutex);
        }

        AdcProxy<M> acquireAdc() const
        {
            return AdcProxy<M>(mutex);
        }

        CanProxy<M> acquireCan() const
        {
            return CanProxy<M>(mutex);
        }

    private:
        M mutex;
    };

} // namespace sharedbus
