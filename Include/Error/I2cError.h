/**
 * @file I2cError.h
 * @brief I2C bus error codes
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
     * @brief I2C controller error codes
     * 
     */
    enum class I2cError : uint8_t {
        Ok = 0,
        Bus,                    // Misplaced START or STOP condition
        ArbitrationLoss,        // Another controller won the bus
        NoAcknowledgeAddress,   // Target did not ACK its address
        NoAcknowledgeData,      // Target did not ACK a data byte
        Overrun                 // Receive register overrun / transmit underrun
    };

} // namespace error
