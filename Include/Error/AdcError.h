/**
 * @file AdcError.h
 * @brief ADC error codes
 * @version 0.1
 * @date 2026-10-19
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    enum class AdcError : uint8_t {
        Ok = 0,
        Overrun,            // A new conversion finished before the previous one was read
        InvalidChannel,     // Channel is not routed to this converter
        NotCalibrated
    };

} // namespace error
