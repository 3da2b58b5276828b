/**
 * @file Adc.h
 * @brief ADC channel description and one-shot operation consumed by AdcProxy
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <stdint.h>
#include <type_traits>

#include "Nb.h"

namespace hal
{
    namespace adc
    {
        /**
         * An ADC handle provides, for each channel pin type it supports:
         *
         *   nb::Result<Word, E> read(Pin &pin);
         *
         * read starts a conversion on the first call and returns WouldBlock until
         * the sample is ready. Word is the sample type the converter produces.
         */

        /**
         * @brief Base for pin types that select an ADC channel
         *
         * @tparam AdcUnit Tag type of the converter the channel belongs to
         * @tparam Id Channel number on that converter
         */
        template <typename AdcUnit, uint8_t Id>
        struct Channel
        {
            using Unit = AdcUnit;

            static constexpr uint8_t channel()
            {
                return Id;
            }
        };

        /**
         * @brief True when Pin names its converter Unit and a channel() number
         */
        template <typename Pin, typename = void>
        struct IsChannel : std::false_type
        {
        };

        template <typename Pin>
        struct IsChannel<Pin, std::void_t<typename Pin::Unit, decltype(Pin::channel())>> : std::true_type
        {
        };

    } // namespace adc

} // namespace hal
