#include <gtest/gtest.h>
#include "Hal/CanFrame.h"

using namespace error;
using namespace hal::can;

TEST(CanFrameTests, StandardIdRange)
{
    ASSERT_TRUE(Id::standard(0x7FF).has_value());
    EXPECT_FALSE(Id::standard(0x7FF).value().isExtended());

    auto tooLarge = Id::standard(0x800);
    ASSERT_FALSE(tooLarge.has_value());
    EXPECT_EQ(tooLarge.error(), Error::fromCan(CanError::InvalidIdentifier));
}

TEST(CanFrameTests, ExtendedIdRange)
{
    auto id = Id::extended(0x1FFFFFFF);
    ASSERT_TRUE(id.has_value());
    EXPECT_TRUE(id.value().isExtended());
    EXPECT_EQ(id.value().raw(), 0x1FFFFFFFu);

    EXPECT_FALSE(Id::extended(0x20000000).has_value());
}

TEST(CanFrameTests, SameRawValueDifferentFormatIsDifferentId)
{
    EXPECT_NE(Id::standard(0x123).value(), Id::extended(0x123).value());
}

TEST(CanFrameTests, DataFrameCarriesPayload)
{
    const uint8_t payload[] = {0xDE, 0xAD, 0xBE, 0xEF};
    auto frame = Frame::data(Id::standard(0x100).value(), etl::span<const uint8_t>(payload, sizeof(payload)));

    ASSERT_TRUE(frame.has_value());
    EXPECT_FALSE(frame.value().isRemote());
    EXPECT_EQ(frame.value().dlc(), 4);
    ASSERT_EQ(frame.value().payload().size(), 4u);
    EXPECT_EQ(frame.value().payload()[0], 0xDE);
    EXPECT_EQ(frame.value().payload()[3], 0xEF);
}

TEST(CanFrameTests, RejectsPayloadLongerThanEightBytes)
{
    const uint8_t payload[9] = {};
    auto frame = Frame::data(Id::standard(0x100).value(), etl::span<const uint8_t>(payload, sizeof(payload)));

    ASSERT_FALSE(frame.has_value());
    EXPECT_EQ(frame.error(), Error::fromCan(CanError::InvalidDataLength));
}

TEST(CanFrameTests, RemoteFrameHasDlcButNoData)
{
    auto frame = Frame::remote(Id::extended(0x18FF50E5).value(), 8);

    ASSERT_TRUE(frame.has_value());
    EXPECT_TRUE(frame.value().isRemote());
    EXPECT_TRUE(frame.value().isExtended());
    EXPECT_EQ(frame.value().dlc(), 8);
    EXPECT_TRUE(frame.value().payload().empty());

    EXPECT_FALSE(Frame::remote(Id::standard(0x1).value(), 9).has_value());
}

TEST(CanFrameTests, EqualityComparesIdKindAndData)
{
    const uint8_t a[] = {1, 2};
    const uint8_t b[] = {1, 3};
    auto id = Id::standard(0x42).value();

    EXPECT_EQ(Frame::data(id, etl::span<const uint8_t>(a, 2)).value(),
              Frame::data(id, etl::span<const uint8_t>(a, 2)).value());
    EXPECT_NE(Frame::data(id, etl::span<const uint8_t>(a, 2)).value(),
              Frame::data(id, etl::span<const uint8_t>(b, 2)).value());
    EXPECT_NE(Frame::data(id, etl::span<const uint8_t>(a, 2)).value(),
              Frame::remote(id, 2).value());
}
