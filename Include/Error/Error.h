/**
 * @file Error.h
 * @brief Layered error type returned by bus implementations
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "HardwareError.h"
#include "I2cError.h"
#include "SpiError.h"
#include "AdcError.h"
#include "CanError.h"

#include <etl/variant.h>
#include <etl/string_view.h>
#include <etl/string.h>

namespace error {

    enum class ErrorLayer : uint8_t {
        Hardware,
        I2c,
        Spi,
        Adc,
        Can
    };


    /**
     * @brief Error value carried in the error branch of etl::expected
     *
     * The layer identifies which bus produced the error, the variant holds the
     * layer specific code. The proxies in sharedbus never create or alter an
     * Error, they hand back whatever the bus returned.
     */
    class Error {
        public:

            using ErrorVariant = etl::variant<
                HardwareError,
                I2cError,
                SpiError,
                AdcError,
                CanError
            >;

            static Error fromHardware(HardwareError err) {
                return Error{ErrorLayer::Hardware, err};
            }

            static Error fromI2c(I2cError err) {
                return Error{ErrorLayer::I2c, err};
            }

            static Error fromSpi(SpiError err) {
                return Error{ErrorLayer::Spi, err};
            }

            static Error fromAdc(AdcError err) {
                return Error{ErrorLayer::Adc, err};
            }

            static Error fromCan(CanError err) {
                return Error{ErrorLayer::Can, err};
            }

            template<typename T>
            bool is() const {
                return etl::holds_alternative<T>(errorCode);
            }

            template<typename T>
            T get() const {
                return etl::get<T>(errorCode);
            }

            ErrorLayer getLayer() const {
                return layer;
            }

            bool operator==(const Error &other) const;
            bool operator!=(const Error &other) const {
                return !(*this == other);
            }

            static etl::string_view layerName(ErrorLayer layer);

            static etl::string_view nameOf(HardwareError err);
            static etl::string_view nameOf(I2cError err);
            static etl::string_view nameOf(SpiError err);
            static etl::string_view nameOf(AdcError err);
            static etl::string_view nameOf(CanError err);

            /**
             * @brief Renders the error as "<Layer> Error: <Name>"
             *
             * @return etl::string<64> Human readable description
             */
            etl::string<64> toString() const;

        private:
            // Only the from* factories pair a layer with its code
            Error(ErrorLayer layer, ErrorVariant errorCode)
                : layer(layer), errorCode(errorCode) {}

            ErrorLayer   layer;
            ErrorVariant errorCode;

    };

} // namespace error
