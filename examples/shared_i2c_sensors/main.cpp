/**
 * @file main.cpp
 * @brief Two sensor drivers on two threads sharing one I2C controller
 *
 * The drivers are written against a plain I2C handle type and know nothing
 * about sharing. Each gets an I2cProxy from the same BusManager.
 */

#include <mutex>
#include <thread>
#include <utility>

#include <etl/array.h>
#include <etl/expected.h>
#include <etl/span.h>

#include "Error/Error.h"
#include "SharedBus/SharedBus.h"
#include "Utils/Logging.h"

using namespace error;

namespace
{
    /**
     * @brief Simulated I2C controller with two register-mapped devices attached
     */
    class SimulatedI2cController
    {
    public:
        static constexpr uint8_t THERMOMETER_ADDRESS = 0x48;
        static constexpr uint8_t HYGROMETER_ADDRESS = 0x40;

        etl::expected<void, Error> write(uint8_t address, etl::span<const uint8_t> bytes)
        {
            auto device = select(address);
            if (!device)
            {
                return etl::unexpected(device.error());
            }
            if (!bytes.empty())
            {
                device.value()->pointer = bytes[0];
            }
            return {};
        }

        etl::expected<void, Error> read(uint8_t address, etl::span<uint8_t> buffer)
        {
            auto device = select(address);
            if (!device)
            {
                return etl::unexpected(device.error());
            }
            const Device &target = *device.value();
            for (size_t i = 0; i < buffer.size(); ++i)
            {
                buffer[i] = target.registers[(target.pointer + i) % target.registers.size()];
            }
            return {};
        }

        etl::expected<void, Error> writeRead(uint8_t address, etl::span<const uint8_t> bytes, etl::span<uint8_t> buffer)
        {
            auto written = write(address, bytes);
            if (!written)
            {
                return written;
            }
            return read(address, buffer);
        }

    private:
        struct Device
        {
            etl::array<uint8_t, 4> registers;
            uint8_t pointer;
        };

        etl::expected<Device *, Error> select(uint8_t address)
        {
            if (address == THERMOMETER_ADDRESS)
            {
                return &thermometer;
            }
            if (address == HYGROMETER_ADDRESS)
            {
                return &hygrometer;
            }
            return etl::unexpected(Error::fromI2c(I2cError::NoAcknowledgeAddress));
        }

        // Register 0 holds the reading, MSB first
        Device thermometer{{0x19, 0x40, 0x00, 0x00}, 0};   // 25.25 C
        Device hygrometer{{0x66, 0x67, 0x00, 0x00}, 0};    // 40.0 %RH
    };

    /**
     * @brief Bus mutex backed by std::mutex, usable from any thread
     */
    template <typename BusT>
    class StdMutex
    {
    public:
        using Bus = BusT;

        explicit StdMutex(Bus bus) : bus(std::move(bus)) {}

        template <typename F>
        auto lock(F &&f) const -> decltype(f(std::declval<Bus &>()))
        {
            std::lock_guard<std::mutex> guard(mutex);
            return f(bus);
        }

    private:
        mutable std::mutex mutex;
        mutable Bus bus;
    };

    template <typename I2c>
    class Thermometer
    {
    public:
        Thermometer(I2c i2c, uint8_t address) : i2c(std::move(i2c)), address(address) {}

        // Degrees Celsius times 100
        etl::expected<int32_t, Error> readCentiDegrees()
        {
            const uint8_t reg[] = {0x00};
            etl::array<uint8_t, 2> raw{};
            auto result = i2c.writeRead(address, etl::span<const uint8_t>(reg, 1), etl::span<uint8_t>(raw.data(), raw.size()));
            if (!result)
            {
                return etl::unexpected(result.error());
            }
            // 12-bit two's complement, 0.0625 C per count
            int32_t counts = static_cast<int16_t>((raw[0] << 8) | raw[1]) >> 4;
            return counts * 625 / 100;
        }

    private:
        I2c i2c;
        uint8_t address;
    };

    template <typename I2c>
    class Hygrometer
    {
    public:
        Hygrometer(I2c i2c, uint8_t address) : i2c(std::move(i2c)), address(address) {}

        // Relative humidity in tenths of a percent
        etl::expected<int32_t, Error> readPermille()
        {
            const uint8_t reg[] = {0x00};
            auto selected = i2c.write(address, etl::span<const uint8_t>(reg, 1));
            if (!selected)
            {
                return etl::unexpected(selected.error());
            }
            etl::array<uint8_t, 2> raw{};
            auto result = i2c.read(address, etl::span<uint8_t>(raw.data(), raw.size()));
            if (!result)
            {
                return etl::unexpected(result.error());
            }
            uint32_t counts = (static_cast<uint32_t>(raw[0]) << 8) | raw[1];
            return static_cast<int32_t>(counts * 1000 / 65535);
        }

    private:
        I2c i2c;
        uint8_t address;
    };

    template <typename Proxy, typename Body>
    std::thread spawnDriverTask(Proxy proxy, Body body)
    {
        sharedbus::requireTransferable<Proxy>();
        return std::thread([proxy, body]() mutable { body(proxy); });
    }

} // namespace

int main()
{
    using Mutex = StdMutex<SimulatedI2cController>;
    using Proxy = sharedbus::I2cProxy<Mutex>;

    sharedbus::BusManager<Mutex> i2cBus(SimulatedI2cController{});
    LOG_INFO("I2C bus shared between thermometer and hygrometer");

    std::thread thermometerTask = spawnDriverTask(i2cBus.acquireI2c(), [](Proxy proxy) {
        Thermometer<Proxy> thermometer(proxy, SimulatedI2cController::THERMOMETER_ADDRESS);
        for (int i = 0; i < 3; ++i)
        {
            auto reading = thermometer.readCentiDegrees();
            if (!reading)
            {
                LOG_ERROR("Thermometer: %s", reading.error().toString().c_str());
                continue;
            }
            LOG_INFO("Thermometer: %ld.%02ld C", static_cast<long>(reading.value() / 100), static_cast<long>(reading.value() % 100));
        }
    });

    std::thread hygrometerTask = spawnDriverTask(i2cBus.acquireI2c(), [](Proxy proxy) {
        Hygrometer<Proxy> hygrometer(proxy, SimulatedI2cController::HYGROMETER_ADDRESS);
        for (int i = 0; i < 3; ++i)
        {
            auto reading = hygrometer.readPermille();
            if (!reading)
            {
                LOG_ERROR("Hygrometer: %s", reading.error().toString().c_str());
                continue;
            }
            LOG_INFO("Hygrometer: %ld.%ld %%RH", static_cast<long>(reading.value() / 10), static_cast<long>(reading.value() % 10));
        }
    });

    thermometerTask.join();
    hygrometerTask.join();

    // Nothing answers at 0x4F, the controller's error comes back as is
    Thermometer<Proxy> missing(i2cBus.acquireI2c(), 0x4F);
    auto reading = missing.readCentiDegrees();
    if (!reading)
    {
        LOG_WARN("Device 0x4F: %s", reading.error().toString().c_str());
    }

    return 0;
}
