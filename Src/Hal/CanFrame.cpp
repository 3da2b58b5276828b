/**
 * @file CanFrame.cpp
 * @brief Validated construction of classic CAN identifiers and frames
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Hal/CanFrame.h"
#include "Utils/Logging.h"

using namespace error;
using namespace hal::can;

etl::expected<Id, Error> Id::standard(uint16_t raw)
{
    if (raw > STANDARD_MAX)
    {
        LOG_WARN("Standard CAN id 0x%X exceeds 11 bits", static_cast<unsigned>(raw));
        return etl::unexpected(Error::fromCan(CanError::InvalidIdentifier));
    }
    return Id(raw, false);
}

etl::expected<Id, Error> Id::extended(uint32_t raw)
{
    if (raw > EXTENDED_MAX)
    {
        LOG_WARN("Extended CAN id 0x%lX exceeds 29 bits", static_cast<unsigned long>(raw));
        return etl::unexpected(Error::fromCan(CanError::InvalidIdentifier));
    }
    return Id(raw, true);
}

Frame::Frame(const Id &id, bool remote, uint8_t dlc)
    : frameId(id), remoteFlag(remote), length(dlc)
{
    bytes.fill(0);
}

etl::expected<Frame, Error> Frame::data(const Id &id, etl::span<const uint8_t> payload)
{
    if (payload.size() > MAX_DATA_LENGTH)
    {
        LOG_WARN("CAN payload of %u bytes exceeds %u", static_cast<unsigned>(payload.size()), static_cast<unsigned>(MAX_DATA_LENGTH));
        return etl::unexpected(Error::fromCan(CanError::InvalidDataLength));
    }

    Frame frame(id, false, static_cast<uint8_t>(payload.size()));
    for (size_t i = 0; i < payload.size(); ++i)
    {
        frame.bytes[i] = payload[i];
    }
    return frame;
}

etl::expected<Frame, Error> Frame::remote(const Id &id, uint8_t dlc)
{
    if (dlc > MAX_DATA_LENGTH)
    {
        LOG_WARN("CAN remote frame DLC %u exceeds %u", static_cast<unsigned>(dlc), static_cast<unsigned>(MAX_DATA_LENGTH));
        return etl::unexpected(Error::fromCan(CanError::InvalidDataLength));
    }
    return Frame(id, true, dlc);
}

etl::span<const uint8_t> Frame::payload() const
{
    if (remoteFlag)
    {
        return etl::span<const uint8_t>();
    }
    return etl::span<const uint8_t>(bytes.data(), length);
}

bool Frame::operator==(const Frame &other) const
{
    if (frameId != other.frameId || remoteFlag != other.remoteFlag || length != other.length)
    {
        return false;
    }
    // Remote frames carry no data
    if (remoteFlag)
    {
        return true;
    }
    for (uint8_t i = 0; i < length; ++i)
    {
        if (bytes[i] != other.bytes[i])
        {
            return false;
        }
    }
    return true;
}
