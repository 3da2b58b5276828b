/**
 * @file Nb.h
 * @brief Result type for poll-based (non-blocking) bus operations
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/expected.h>
#include <etl/optional.h>

namespace hal
{
    namespace nb
    {
        /**
         * @brief Error branch of a non-blocking operation
         *
         * Either WouldBlock (the operation has not finished yet, call again) or a
         * real error of the bus's own type.
         *
         * @tparam E Error type of the underlying bus
         */
        template <typename E>
        class Error
        {
        public:
            static Error wouldBlock()
            {
                return Error();
            }

            static Error other(const E &err)
            {
                return Error(err);
            }

            bool isWouldBlock() const
            {
                return !otherError.has_value();
            }

            /**
             * @brief The bus error, only valid when isWouldBlock() is false
             */
            const E &error() const
            {
                return otherError.value();
            }

            bool operator==(const Error &rhs) const
            {
                if (isWouldBlock() || rhs.isWouldBlock())
                {
                    return isWouldBlock() == rhs.isWouldBlock();
                }
                return error() == rhs.error();
            }

            bool operator!=(const Error &rhs) const
            {
                return !(*this == rhs);
            }

        private:
            Error() = default;
            explicit Error(const E &err) : otherError(err) {}

            etl::optional<E> otherError;
        };

        template <typename T, typename E>
        using Result = etl::expected<T, Error<E>>;

        /**
         * @brief Calls poll until it returns something other than WouldBlock
         *
         * Busy-waits on the calling context, there is no timeout.
         *
         * @param poll Callable returning an nb::Result
         * @return The first result that is a value or a real error
         */
        template <typename Poll>
        auto block(Poll &&poll) -> decltype(poll())
        {
            auto result = poll();
            while (!result.has_value() && result.error().isWouldBlock())
            {
                result = poll();
            }
            return result;
        }

    } // namespace nb

} // namespace hal
