/**
 * @file I2c.h
 * @brief I2C operation set consumed by I2cProxy
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <stdint.h>

#include <etl/span.h>

namespace hal
{
    namespace i2c
    {
        /**
         * A blocking I2C bus handle provides any subset of:
         *
         *   etl::expected<void, E> write(uint8_t address, etl::span<const uint8_t> bytes);
         *   etl::expected<void, E> read(uint8_t address, etl::span<uint8_t> buffer);
         *   etl::expected<void, E> writeRead(uint8_t address, etl::span<const uint8_t> bytes,
         *                                    etl::span<uint8_t> buffer);
         *   etl::expected<void, E> transaction(uint8_t address, etl::span<Operation> operations);
         *
         * Addresses are 7-bit, right aligned. writeRead issues a repeated START
         * between the two phases.
         */

        /**
         * @brief One segment of an I2C transaction
         *
         * Adjacent segments of the same kind are merged on the wire, a change of
         * kind produces a repeated START.
         */
        struct Operation
        {
            enum class Kind : uint8_t
            {
                Read,
                Write
            };

            static Operation read(etl::span<uint8_t> buffer)
            {
                return Operation{Kind::Read, buffer, etl::span<const uint8_t>()};
            }

            static Operation write(etl::span<const uint8_t> bytes)
            {
                return Operation{Kind::Write, etl::span<uint8_t>(), bytes};
            }

            Kind kind;
            etl::span<uint8_t> readBuffer;
            etl::span<const uint8_t> writeBuffer;
        };

    } // namespace i2c

} // namespace hal
