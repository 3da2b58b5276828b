/**
 * @file Spi.h
 * @brief SPI operation set consumed by SpiProxy
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
    namespace spi
    {
        /**
         * A blocking SPI bus handle provides any subset of:
         *
         *   etl::expected<etl::span<const uint8_t>, E> transfer(etl::span<uint8_t> words);
         *   etl::expected<void, E> write(etl::span<const uint8_t> words);
         *   etl::expected<void, E> exec(etl::span<Operation> operations);
         *
         * transfer is full duplex and in place: words are sent and overwritten with
         * the words clocked in. The returned span views the same storage.
         * Chip-select is not part of the bus handle, the device driver owns it.
         */

        struct Operation
        {
            enum class Kind : uint8_t
            {
                Write,
                Transfer
            };

            static Operation write(etl::span<const uint8_t> words)
            {
                return Operation{Kind::Write, words, etl::span<uint8_t>()};
            }

            static Operation transfer(etl::span<uint8_t> words)
            {
                return Operation{Kind::Transfer, etl::span<const uint8_t>(), words};
            }

            Kind kind;
            etl::span<const uint8_t> writeWords;
            etl::span<uint8_t> transferWords;
        };

    } // namespace spi

} // namespace hal
