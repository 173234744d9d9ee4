#include "./context.hpp"

#include <dply/util/log.hpp>

using namespace dply;

void deploy_context::error(std::string_view message) const {
    dply_log(error, "{}", message);
}
