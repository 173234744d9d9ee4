#pragma once

#include "./errors.hpp"

#include <boost/leaf/common.hpp>
#include <boost/leaf/error.hpp>
#include <boost/leaf/handle_errors.hpp>
#include <boost/leaf/on_error.hpp>
#include <boost/leaf/result.hpp>
#include <neo/pp.hpp>

#include <sstream>
#include <string_view>
#include <system_error>

namespace dply {

using boost::leaf::bad_result;
using boost::leaf::current_error;
using boost::leaf::new_error;
using boost::leaf::result;

/**
 * @brief Run an operation that reports failure through a result<>, and rethrow a failure as an
 * external_error<Code>.
 *
 * The message reads "<what> [<subject>]: <cause>", where the cause is the message of the
 * std::error_code that the failure carries, or the LEAF diagnostic if it carries none. The
 * error objects of the failure are not carried over.
 */
template <errc Code, typename Op>
void check_result(Op&& op, std::string_view what, std::string_view subject) {
    boost::leaf::try_handle_all(
        [&]() -> result<void> {
            BOOST_LEAF_CHECK(op());
            return {};
        },
        [&](const std::error_code& ec) {
            throw_external_error<Code>("{} [{}]: {}", what, subject, ec.message());
        },
        [&](const boost::leaf::diagnostic_info& info) {
            std::ostringstream out;
            out << info;
            throw_external_error<Code>("{} [{}]: {}", what, subject, out.str());
        });
}

}  // namespace dply

/**
 * @brief Generate a callable object that returns the given expression.
 *
 * Use this as a parameter to leaf's error-loading APIs.
 */
#define DPLY_E_ARG(...) ([&] { return __VA_ARGS__; })

/**
 * @brief Attach the given error object to any error that leaves the current scope, whether by
 * exception or by a failed result<>
 */
#define DPLY_E_SCOPE(...)                                                                          \
    auto NEO_CONCAT(_dply_err_info_, __LINE__) = boost::leaf::on_error(DPLY_E_ARG(__VA_ARGS__))
