/**
 * @file CanFrame.h
 * @brief Classic CAN 2.0 frame and the CAN operation set consumed by CanProxy
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <stdint.h>

#include <etl/array.h>
#include <etl/expected.h>
#include <etl/span.h>

#include "Error/Error.h"

namespace hal
{
    namespace can
    {
        /**
         * A blocking CAN bus handle provides:
         *
         *   using Frame = ...;
         *   etl::expected<void, E> transmit(const Frame &frame);
         *   etl::expected<Frame, E> receive();
         *
         * Frame is whatever type the controller uses. hal::can::Frame below is
         * available for controllers that have no frame type of their own.
         */

        /**
         * @brief Standard (11-bit) or extended (29-bit) identifier
         */
        class Id
        {
        public:
            static constexpr uint16_t STANDARD_MAX = 0x7FF;
            static constexpr uint32_t EXTENDED_MAX = 0x1FFFFFFF;

            static etl::expected<Id, error::Error> standard(uint16_t raw);
            static etl::expected<Id, error::Error> extended(uint32_t raw);

            bool isExtended() const { return extendedFlag; }
            uint32_t raw() const { return value; }

            bool operator==(const Id &other) const
            {
                return extendedFlag == other.extendedFlag && value == other.value;
            }

            bool operator!=(const Id &other) const
            {
                return !(*this == other);
            }

        private:
            Id(uint32_t value, bool extended)
                : value(value), extendedFlag(extended) {}

            uint32_t value;
            bool extendedFlag;
        };

        class Frame
        {
        public:
            static constexpr uint8_t MAX_DATA_LENGTH = 8;

            /**
             * @brief Builds a data frame
             *
             * @param id Frame identifier
             * @param payload 0 to 8 data bytes
             * @return etl::expected<Frame, error::Error> Frame, or CanError::InvalidDataLength
             */
            static etl::expected<Frame, error::Error> data(const Id &id, etl::span<const uint8_t> payload);

            /**
             * @brief Builds a remote (RTR) frame requesting dlc bytes
             *
             * @return etl::expected<Frame, error::Error> Frame, or CanError::InvalidDataLength if dlc > 8
             */
            static etl::expected<Frame, error::Error> remote(const Id &id, uint8_t dlc);

            const Id &id() const { return frameId; }
            bool isExtended() const { return frameId.isExtended(); }
            bool isRemote() const { return remoteFlag; }
            uint8_t dlc() const { return length; }

            /**
             * @brief Data bytes, empty for remote frames
             */
            etl::span<const uint8_t> payload() const;

            bool operator==(const Frame &other) const;
            bool operator!=(const Frame &other) const
            {
                return !(*this == other);
            }

        private:
            Frame(const Id &id, bool remote, uint8_t dlc);

            Id frameId;
            bool remoteFlag;
            uint8_t length;
            etl::array<uint8_t, MAX_DATA_LENGTH> bytes;
        };

    } // namespace can

} // namespace hal
