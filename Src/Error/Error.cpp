/**
 * @file Error.cpp
 * @brief Layered error type: comparison and human readable names
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Error/Error.h"

#include <type_traits>

using namespace error;

bool Error::operator==(const Error &other) const
{
    if (layer != other.layer || errorCode.index() != other.errorCode.index())
    {
        return false;
    }

    switch (layer)
    {
        case ErrorLayer::Hardware:
            return get<HardwareError>() == other.get<HardwareError>();
        case ErrorLayer::I2c:
            return get<I2cError>() == other.get<I2cError>();
        case ErrorLayer::Spi:
            return get<SpiError>() == other.get<SpiError>();
        case ErrorLayer::Adc:
            return get<AdcError>() == other.get<AdcError>();
        case ErrorLayer::Can:
            return get<CanError>() == other.get<CanError>();
        default:
            return false;
    }
}

etl::string_view Error::layerName(ErrorLayer layer)
{
    switch (layer) {
        case ErrorLayer::Hardware:
            return "Hardware";
        case ErrorLayer::I2c:
            return "I2C";
        case ErrorLayer::Spi:
            return "SPI";
        case ErrorLayer::Adc:
            return "ADC";
        case ErrorLayer::Can:
            return "CAN";
        default:
            return "Unknown";
    }
}

etl::string_view Error::nameOf(HardwareError err)
{
    switch (err) {
        case HardwareError::Ok:
            return "Ok";
        case HardwareError::Timeout:
            return "Timeout";
        case HardwareError::NotInitialized:
            return "NotInitialized";
        case HardwareError::InvalidConfiguration:
            return "InvalidConfiguration";
        case HardwareError::NotSupported:
            return "NotSupported";
        case HardwareError::Unknown:
            return "UnknownError";
        default:
            return "UndefinedHardwareError";
    }
}

etl::string_view Error::nameOf(I2cError err)
{
    switch (err) {
        case I2cError::Ok:
            return "Ok";
        case I2cError::Bus:
            return "Bus";
        case I2cError::ArbitrationLoss:
            return "ArbitrationLoss";
        case I2cError::NoAcknowledgeAddress:
            return "NoAcknowledgeAddress";
        case I2cError::NoAcknowledgeData:
            return "NoAcknowledgeData";
        case I2cError::Overrun:
            return "Overrun";
        default:
            return "UndefinedI2cError";
    }
}

etl::string_view Error::nameOf(SpiError err)
{
    switch (err) {
        case SpiError::Ok:
            return "Ok";
        case SpiError::Overrun:
            return "Overrun";
        case SpiError::ModeFault:
            return "ModeFault";
        case SpiError::FrameFormat:
            return "FrameFormat";
        case SpiError::ChipSelectFault:
            return "ChipSelectFault";
        default:
            return "UndefinedSpiError";
    }
}

etl::string_view Error::nameOf(AdcError err)
{
    switch (err) {
        case AdcError::Ok:
            return "Ok";
        case AdcError::Overrun:
            return "Overrun";
        case AdcError::InvalidChannel:
            return "InvalidChannel";
        case AdcError::NotCalibrated:
            return "NotCalibrated";
        default:
            return "UndefinedAdcError";
    }
}

etl::string_view Error::nameOf(CanError err)
{
    switch (err) {
        case CanError::Ok:
            return "Ok";
        case CanError::Overrun:
            return "Overrun";
        case CanError::Bit:
            return "Bit";
        case CanError::Stuff:
            return "Stuff";
        case CanError::Crc:
            return "Crc";
        case CanError::Form:
            return "Form";
        case CanError::Acknowledge:
            return "Acknowledge";
        case CanError::Arbitration:
            return "Arbitration";
        case CanError::BusOff:
            return "BusOff";
        case CanError::InvalidIdentifier:
            return "InvalidIdentifier";
        case CanError::InvalidDataLength:
            return "InvalidDataLength";
        default:
            return "UndefinedCanError";
    }
}

etl::string<64> Error::toString() const
{
    etl::string<64> result;
    auto layer_name = layerName(layer);
    result.assign(layer_name.begin(), layer_name.end());
    result.append(" Error: ");

    auto error_name = etl::visit([](auto&& arg) -> etl::string_view {
            using T = std::decay_t<decltype(arg)>;
            if constexpr (std::is_same_v<T, HardwareError> ||
                          std::is_same_v<T, I2cError> ||
                          std::is_same_v<T, SpiError> ||
                          std::is_same_v<T, AdcError> ||
                          std::is_same_v<T, CanError>) {
                return nameOf(arg);
            } else {
                return "Unknown Error Type";
            }
        }, errorCode);

    result.append(error_name.begin(), error_name.end());
    return result;
}
