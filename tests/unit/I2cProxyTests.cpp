#include <gtest/gtest.h>
#include <gtest/gtest-spi.h>

#include <thread>
#include <utility>
#include <type_traits>

#include <etl/array.h>

#include "SharedBus/SharedBus.h"
#include "MockBuses.h"
#include "TestMutexes.h"

using namespace sharedbus;

namespace
{
    template <typename P, typename = void>
    struct HasRead : std::false_type
    {
    };

    template <typename P>
    struct HasRead<P, std::void_t<decltype(std::declval<P &>().read(uint8_t{}, std::declval<etl::span<uint8_t>>()))>>
        : std::true_type
    {
    };

    template <typename P, typename = void>
    struct HasWrite : std::false_type
    {
    };

    template <typename P>
    struct HasWrite<P, std::void_t<decltype(std::declval<P &>().write(uint8_t{}, std::declval<etl::span<const uint8_t>>()))>>
        : std::true_type
    {
    };

    /**
     * @brief Minimal register-based sensor driver, written against any I2C handle
     */
    template <typename I2c>
    class RegisterDevice
    {
    public:
        RegisterDevice(I2c i2c, uint8_t address) : i2c(std::move(i2c)), address(address) {}

        auto readRegister(uint8_t reg, etl::span<uint8_t> out)
        {
            const uint8_t select[] = {reg};
            return i2c.writeRead(address, etl::span<const uint8_t>(select, 1), out);
        }

    private:
        I2c i2c;
        uint8_t address;
    };
} // namespace

// Test Fixture for the I2C proxy over a single-context mutex
class I2cProxyTest : public ::testing::Test {
protected:
    using Mutex = CellMutex<MockI2cBus>;

    void SetUp() override {
        mutex = new Mutex(MockI2cBus(log));
    }

    void TearDown() override {
        delete mutex;
    }

    BusLog log;
    Mutex *mutex;
};

TEST_F(I2cProxyTest, WriteForwardsArgumentsUnderOneLock)
{
    I2cProxy<Mutex> proxy(*mutex);
    const uint8_t bytes[] = {0x01, 0x02};

    auto result = proxy.write(0x10, etl::span<const uint8_t>(bytes, 2));

    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(mutex->acquisitions(), 1u);
    ASSERT_EQ(log.count(BusOp::I2cWrite), 1u);
    const auto &call = log.firstBegin(BusOp::I2cWrite);
    EXPECT_EQ(call.address, 0x10);
    EXPECT_EQ(call.data, static_cast<const void *>(bytes));
    EXPECT_EQ(call.length, 2u);
    ASSERT_EQ(call.bytes.size(), 2u);
    EXPECT_EQ(call.bytes[0], 0x01);
    EXPECT_EQ(call.bytes[1], 0x02);
}

TEST_F(I2cProxyTest, ReadFillsCallerBuffer)
{
    I2cProxy<Mutex> proxy(*mutex);
    etl::array<uint8_t, 3> buffer{};

    auto result = proxy.read(0x20, etl::span<uint8_t>(buffer.data(), buffer.size()));

    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(mutex->acquisitions(), 1u);
    EXPECT_EQ(log.firstBegin(BusOp::I2cRead).data, static_cast<const void *>(buffer.data()));
    EXPECT_EQ(buffer[0], 0x20);
    EXPECT_EQ(buffer[2], 0x22);
}

TEST_F(I2cProxyTest, WriteReadIsOneBusOperationUnderOneLock)
{
    I2cProxy<Mutex> proxy(*mutex);
    const uint8_t reg[] = {0x40};
    etl::array<uint8_t, 2> buffer{};

    auto result = proxy.writeRead(0x48, etl::span<const uint8_t>(reg, 1), etl::span<uint8_t>(buffer.data(), buffer.size()));

    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(mutex->acquisitions(), 1u);
    EXPECT_EQ(log.count(BusOp::I2cWriteRead), 1u);
    EXPECT_EQ(log.count(BusOp::I2cWrite), 0u);
    EXPECT_EQ(log.count(BusOp::I2cRead), 0u);
    EXPECT_EQ(buffer[0], 0x40);
    EXPECT_EQ(buffer[1], 0x41);
}

TEST_F(I2cProxyTest, TransactionRunsAllSegmentsUnderOneLock)
{
    I2cProxy<Mutex> proxy(*mutex);
    const uint8_t header[] = {0x00, 0x10};
    etl::array<uint8_t, 4> payload{};
    etl::array<hal::i2c::Operation, 2> operations = {
        hal::i2c::Operation::write(etl::span<const uint8_t>(header, 2)),
        hal::i2c::Operation::read(etl::span<uint8_t>(payload.data(), payload.size()))};

    auto result = proxy.transaction(0x50, etl::span<hal::i2c::Operation>(operations.data(), operations.size()));

    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(mutex->acquisitions(), 1u);
    EXPECT_EQ(log.firstBegin(BusOp::I2cTransaction).length, 2u);
    EXPECT_EQ(payload[0], 0xA5);
    EXPECT_EQ(payload[3], 0xA5);
}

TEST_F(I2cProxyTest, ErrorIsReturnedUnchanged)
{
    I2cProxy<Mutex> proxy(*mutex);
    log.failWith = Error::fromI2c(I2cError::NoAcknowledgeAddress);
    etl::array<uint8_t, 1> buffer{};

    auto result = proxy.read(0x77, etl::span<uint8_t>(buffer.data(), buffer.size()));

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Error::fromI2c(I2cError::NoAcknowledgeAddress));
    static_assert(std::is_same<decltype(result), etl::expected<void, Error>>::value,
                  "proxy result type must be the bus result type");
}

TEST_F(I2cProxyTest, CopiesShareTheSameMutex)
{
    I2cProxy<Mutex> first(*mutex);
    I2cProxy<Mutex> second = first;
    const uint8_t bytes[] = {0xFF};

    EXPECT_TRUE(first.write(0x10, etl::span<const uint8_t>(bytes, 1)).has_value());
    EXPECT_TRUE(second.write(0x11, etl::span<const uint8_t>(bytes, 1)).has_value());

    EXPECT_EQ(mutex->acquisitions(), 2u);
    EXPECT_EQ(log.count(BusOp::I2cWrite), 2u);
    EXPECT_TRUE(log.strictlyNested());
}

TEST_F(I2cProxyTest, DriverWrittenForRawBusWorksOnProxy)
{
    RegisterDevice<I2cProxy<Mutex>> device(I2cProxy<Mutex>(*mutex), 0x48);
    etl::array<uint8_t, 2> value{};

    auto result = device.readRegister(0x05, etl::span<uint8_t>(value.data(), value.size()));

    EXPECT_TRUE(result.has_value());
    EXPECT_EQ(value[0], 0x05);
    EXPECT_EQ(log.firstBegin(BusOp::I2cWriteRead).address, 0x48);
}

TEST(I2cProxyCapabilityTest, OnlyOperationsOfTheBusAreOffered)
{
    using Mutex = CellMutex<WriteOnlyI2cBus>;
    static_assert(HasWrite<I2cProxy<Mutex>>::value, "bus implements write");
    static_assert(!HasRead<I2cProxy<Mutex>>::value, "bus has no read, proxy must not offer one");
    static_assert(HasRead<I2cProxy<CellMutex<MockI2cBus>>>::value, "full bus offers read");
    SUCCEED();
}

// Two drivers on two threads share one bus through one mutex
TEST(I2cProxyConcurrencyTest, ConcurrentDriversNeverInterleaveOnTheBus)
{
    using Mutex = ThreadMutex<MockI2cBus>;
    constexpr int ITERATIONS = 500;

    BusLog log;
    BusManager<Mutex> manager(MockI2cBus{log});

    std::thread driverA([proxy = manager.acquireI2c()]() mutable {
        const uint8_t bytes[] = {1, 2};
        for (int i = 0; i < ITERATIONS; ++i) {
            EXPECT_TRUE(proxy.write(0x10, etl::span<const uint8_t>(bytes, 2)).has_value());
        }
    });

    std::thread driverB([proxy = manager.acquireI2c()]() mutable {
        uint8_t buffer[2] = {};
        for (int i = 0; i < ITERATIONS; ++i) {
            EXPECT_TRUE(proxy.read(0x20, etl::span<uint8_t>(buffer, 2)).has_value());
        }
    });

    driverA.join();
    driverB.join();

    EXPECT_FALSE(log.overlapped.load());
    EXPECT_TRUE(log.strictlyNested());
    EXPECT_EQ(log.count(BusOp::I2cWrite), static_cast<size_t>(ITERATIONS));
    EXPECT_EQ(log.count(BusOp::I2cRead), static_cast<size_t>(ITERATIONS));

    // Every call reached the bus with its own arguments
    for (const auto &event : log.events) {
        if (event.phase != BusEvent::Phase::Begin) {
            continue;
        }
        if (event.op == BusOp::I2cWrite) {
            EXPECT_EQ(event.address, 0x10);
            ASSERT_EQ(event.bytes.size(), 2u);
            EXPECT_EQ(event.bytes[0], 1);
            EXPECT_EQ(event.bytes[1], 2);
        } else {
            EXPECT_EQ(event.address, 0x20);
        }
    }
}

namespace
{
    void lookUpInEmptyLog()
    {
        static BusLog emptyLog;
        emptyLog.firstBegin(BusOp::I2cWrite);
    }
} // namespace

TEST(BusLogTest, LookupWithoutMatchingEventFailsTheTest)
{
    EXPECT_NONFATAL_FAILURE(lookUpInEmptyLog(), "no Begin event recorded");
}
