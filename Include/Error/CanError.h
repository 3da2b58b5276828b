/**
 * @file CanError.h
 * @brief CAN bus and CAN frame error codes
 * @version 0.1
 * @date 2026-10-19
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    /**
     * @brief CAN controller error codes
     * 
     * The first block mirrors the error kinds a CAN controller reports on the wire.
     * InvalidIdentifier and InvalidDataLength are raised when building a frame.
     */
    enum class CanError : uint8_t {
        Ok = 0,
        Overrun,
        Bit,
        Stuff,
        Crc,
        Form,
        Acknowledge,
        Arbitration,
        BusOff,

        // Frame construction
        InvalidIdentifier,
        InvalidDataLength
    };

} // namespace error
