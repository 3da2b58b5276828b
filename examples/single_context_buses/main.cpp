/**
 * @file main.cpp
 * @brief SPI, ADC and CAN sharing in a single cooperative main loop
 *
 * Everything runs in one context, so a single-context mutex is enough for all
 * three buses and SPI proxies may be handed out.
 */

#include <type_traits>
#include <utility>

#include <etl/array.h>
#include <etl/expected.h>
#include <etl/span.h>
#include <etl/vector.h>

#include "Error/Error.h"
#include "Hal/Adc.h"
#include "Hal/CanFrame.h"
#include "Hal/Nb.h"
#include "SharedBus/SharedBus.h"
#include "Utils/Logging.h"

using namespace error;

namespace
{
    /**
     * @brief Bus mutex for code that never preempts itself
     *
     * No locking at all, only a busy flag that reports re-entry from inside a
     * bus operation.
     */
    template <typename BusT>
    class SingleTaskMutex
    {
    public:
        using Bus = BusT;
        static constexpr bool SINGLE_CONTEXT = true;

        explicit SingleTaskMutex(Bus bus) : bus(std::move(bus)) {}

        template <typename F>
        auto lock(F &&f) const -> decltype(f(std::declval<Bus &>()))
        {
            if (busy)
            {
                LOG_ERROR("Bus locked again from inside a bus operation");
            }
            Borrow borrow(busy);
            return f(bus);
        }

    private:
        struct Borrow
        {
            explicit Borrow(bool &flag) : flag(flag) { flag = true; }
            ~Borrow() { flag = false; }
            bool &flag;
        };

        mutable Bus bus;
        mutable bool busy = false;
    };

    // ==============================================================================
    // Simulated peripherals
    // ==============================================================================

    class SimulatedSpiController
    {
    public:
        // Answers 0x5A to every word, the last written word is echoed on the next transfer
        etl::expected<etl::span<const uint8_t>, Error> transfer(etl::span<uint8_t> words)
        {
            for (auto &word : words)
            {
                uint8_t out = word;
                word = static_cast<uint8_t>(lastWord ^ 0x5A);
                lastWord = out;
            }
            return etl::span<const uint8_t>(words.data(), words.size());
        }

        etl::expected<void, Error> write(etl::span<const uint8_t> words)
        {
            if (!words.empty())
            {
                lastWord = words[words.size() - 1];
            }
            return {};
        }

    private:
        uint8_t lastWord = 0;
    };

    struct Adc1 {};
    using BatteryChannel = hal::adc::Channel<Adc1, 3>;
    using ThrottleChannel = hal::adc::Channel<Adc1, 7>;

    class SimulatedAdc
    {
    public:
        static constexpr int CONVERSION_POLLS = 4;

        template <typename Pin>
        hal::nb::Result<uint16_t, Error> read(Pin &)
        {
            static_assert(std::is_same<typename Pin::Unit, Adc1>::value, "channel belongs to another ADC");

            if (pendingPolls < 0)
            {
                pendingPolls = CONVERSION_POLLS;
            }
            if (pendingPolls > 0)
            {
                --pendingPolls;
                return etl::unexpected(hal::nb::Error<Error>::wouldBlock());
            }
            pendingPolls = -1;
            return static_cast<uint16_t>(Pin::channel() * 512 + 100);
        }

    private:
        int pendingPolls = -1;
    };

    // Loopback CAN controller: every transmitted frame is received back
    class SimulatedCanController
    {
    public:
        using Frame = hal::can::Frame;

        etl::expected<void, Error> transmit(const Frame &frame)
        {
            if (mailbox.full())
            {
                return etl::unexpected(Error::fromCan(CanError::Overrun));
            }
            mailbox.push_back(frame);
            return {};
        }

        etl::expected<Frame, Error> receive()
        {
            if (mailbox.empty())
            {
                return etl::unexpected(Error::fromHardware(HardwareError::Timeout));
            }
            Frame frame = mailbox.front();
            mailbox.erase(mailbox.begin());
            return frame;
        }

    private:
        etl::vector<Frame, 4> mailbox;
    };

    // ==============================================================================
    // Drivers, written against raw handles
    // ==============================================================================

    struct ChipSelectPin
    {
        const char *name;
        void setLow() {}
        void setHigh() {}
    };

    template <typename Spi>
    class SpiFlash
    {
    public:
        SpiFlash(Spi spi, ChipSelectPin cs) : spi(spi), cs(cs) {}

        etl::expected<uint8_t, Error> readStatus()
        {
            etl::array<uint8_t, 2> frame = {0x05, 0x00};
            cs.setLow();
            auto result = spi.transfer(etl::span<uint8_t>(frame.data(), frame.size()));
            cs.setHigh();
            if (!result)
            {
                return etl::unexpected(result.error());
            }
            return result.value()[1];
        }

    private:
        Spi spi;
        ChipSelectPin cs;
    };

    template <typename Spi>
    class SpiDisplay
    {
    public:
        SpiDisplay(Spi spi, ChipSelectPin cs) : spi(spi), cs(cs) {}

        etl::expected<void, Error> fill(uint8_t colour)
        {
            etl::array<uint8_t, 8> line;
            line.fill(colour);
            cs.setLow();
            auto result = spi.write(etl::span<const uint8_t>(line.data(), line.size()));
            cs.setHigh();
            return result;
        }

    private:
        Spi spi;
        ChipSelectPin cs;
    };

} // namespace

int main()
{
    using SpiMutex = SingleTaskMutex<SimulatedSpiController>;
    using AdcMutex = SingleTaskMutex<SimulatedAdc>;
    using CanMutex = SingleTaskMutex<SimulatedCanController>;

    sharedbus::BusManager<SpiMutex> spiBus(SimulatedSpiController{});
    sharedbus::BusManager<AdcMutex> adcBus(SimulatedAdc{});
    sharedbus::BusManager<CanMutex> canBus(SimulatedCanController{});

    SpiFlash<sharedbus::SpiProxy<SpiMutex>> flash(spiBus.acquireSpi(), ChipSelectPin{"flash"});
    SpiDisplay<sharedbus::SpiProxy<SpiMutex>> display(spiBus.acquireSpi(), ChipSelectPin{"display"});

    auto battery = adcBus.acquireAdc();
    auto throttle = adcBus.acquireAdc();
    auto canTx = canBus.acquireCan();
    auto canRx = canBus.acquireCan();

    BatteryChannel batteryPin;
    ThrottleChannel throttlePin;

    for (uint8_t tick = 0; tick < 3; ++tick)
    {
        auto status = flash.readStatus();
        if (!status)
        {
            LOG_ERROR("Flash: %s", status.error().toString().c_str());
        }
        else
        {
            LOG_INFO("Flash status 0x%02X", static_cast<unsigned>(status.value()));
        }

        auto filled = display.fill(tick);
        if (!filled)
        {
            LOG_ERROR("Display: %s", filled.error().toString().c_str());
        }

        // Blocks until the conversion is done, see AdcProxy
        auto batterySample = battery.read(batteryPin);
        auto throttleSample = throttle.read(throttlePin);
        if (!batterySample || !throttleSample)
        {
            LOG_ERROR("ADC conversion failed");
            continue;
        }

        const uint8_t payload[] = {
            static_cast<uint8_t>(batterySample.value() >> 8), static_cast<uint8_t>(batterySample.value()),
            static_cast<uint8_t>(throttleSample.value() >> 8), static_cast<uint8_t>(throttleSample.value())};
        auto id = hal::can::Id::standard(0x321);
        if (!id)
        {
            LOG_ERROR("CAN id: %s", id.error().toString().c_str());
            continue;
        }
        auto frame = hal::can::Frame::data(id.value(), etl::span<const uint8_t>(payload, sizeof(payload)));
        if (!frame)
        {
            LOG_ERROR("CAN frame: %s", frame.error().toString().c_str());
            continue;
        }

        auto sent = canTx.transmit(frame.value());
        if (!sent)
        {
            LOG_ERROR("CAN transmit: %s", sent.error().toString().c_str());
            continue;
        }

        auto received = canRx.receive();
        if (!received)
        {
            LOG_ERROR("CAN receive: %s", received.error().toString().c_str());
            continue;
        }
        LOG_INFO("CAN 0x%03lX: battery %u throttle %u",
                 static_cast<unsigned long>(received.value().id().raw()),
                 static_cast<unsigned>(batterySample.value()),
                 static_cast<unsigned>(throttleSample.value()));
    }

    return 0;
}
