#include "./output.hpp"

#include <ostream>

using namespace dply;

void output_channel::write(std::string_view text) {
    std::scoped_lock lk{_mtx};
    _out << text;
    _out.flush();
}

void output_channel::write_line(std::string_view text) {
    std::scoped_lock lk{_mtx};
    _out << text << '\n';
    _out.flush();
}
