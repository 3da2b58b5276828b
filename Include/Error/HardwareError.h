/**
 * @file HardwareError.h
 * @brief Generic hardware error codes shared by every bus kind
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
     * @brief Errors a bus implementation reports that are not specific to one protocol
     * 
     */
    enum class HardwareError : uint8_t {
        Ok = 0,
        Timeout,
        NotInitialized,
        InvalidConfiguration,
        NotSupported,
        Unknown
    };

} // namespace error
