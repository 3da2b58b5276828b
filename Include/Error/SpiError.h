/**
 * @file SpiError.h
 * @brief SPI bus error codes
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
     * @brief SPI controller error codes
     * 
     */
    enum class SpiError : uint8_t {
        Ok = 0,
        Overrun,
        ModeFault,
        FrameFormat,
        ChipSelectFault
    };

} // namespace error
