/**
 * @file result_logging.hpp
 * @brief Pass-through logging of a Result flowing through a pipeline.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"

#include <sstream>
#include <string_view>
#include <type_traits>

namespace railway {

namespace detail {

template <typename T>
concept Streamable = requires(std::ostream& os, const T& value) { os << value; };

}  // namespace detail

/**
 * @brief Logs "<label>: success <value>" or "<label>: failure <error>" and
 *        returns @p result unchanged. Values without operator<< are omitted.
 */
template <typename T>
Result<T> log_result(Result<T> result, Logger& logger, std::string_view label,
                     LogLevel level = LogLevel::Debug) {
    if (!logger.enabled(level)) return result;

    std::ostringstream oss;
    oss << label << ": ";
    if (result.is_success()) {
        oss << "success";
        if constexpr (detail::Streamable<T>) {
            oss << ' ' << result.value();
        }
    } else {
        oss << "failure " << result.error();
    }
    logger.log(level, oss.str());
    return result;
}

}  // namespace railway
