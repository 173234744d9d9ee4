#include "./nonesuch.hpp"

#include <dply/util/log.hpp>

#include <fansi/styled.hpp>

#include <iomanip>
#include <ostream>

using namespace dply;
using namespace fansi::literals;

void e_nonesuch::log_error() const noexcept {
    dply_log(error, "Unknown {} '.bold.red[{}]'"_styled, kind, given);
    if (nearest) {
        dply_log(error, "  (Did you mean '.br.yellow[{}]'?)"_styled, *nearest);
    }
}

std::ostream& dply::operator<<(std::ostream& out, const e_nonesuch& self) noexcept {
    out << "dply::e_nonesuch: Unknown " << self.kind << ' ' << std::quoted(self.given);
    if (self.nearest) {
        out << " (nearest is " << std::quoted(*self.nearest) << ")";
    }
    return out;
}
