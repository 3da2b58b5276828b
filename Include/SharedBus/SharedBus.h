/**
 * @file SharedBus.h
 * @brief Convenience header pulling in the bus manager and all proxies
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "BusMutex.h"
#include "BusManager.h"
#include "I2cProxy.h"
#include "SpiProxy.h"
#include "AdcProxy.h"
#include "CanProxy.h"
