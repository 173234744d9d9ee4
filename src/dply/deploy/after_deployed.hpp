#pragma once

#include <dply/config/target.hpp>

#include <string_view>

namespace dply {

class deploy_context;

struct e_after_deployed_operation {
    std::string type;
    std::string target;
};

/**
 * @brief Open a URL, file, or executable with the desktop's opener.
 *
 * The opener program is `xdg-open`, unless overridden by the DPLY_OPEN_COMMAND environment
 * variable. Throws user_error<errc::after_deployed_failure> if the opener fails.
 */
void open_external(std::string_view what);

/**
 * @brief Run the `deployed` operations of a target, in order.
 *
 * Stops at, and throws, the first failure.
 */
void run_after_deployed_operations(const deploy_target& target, const deploy_context& ctx);

}  // namespace dply
