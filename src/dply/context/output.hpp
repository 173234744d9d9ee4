#pragma once

#include <iosfwd>
#include <mutex>
#include <string_view>

namespace dply {

/**
 * @brief An append-only sink for the human-readable progress of a deployment.
 */
class output_channel {
    std::ostream& _out;
    std::mutex    _mtx;

public:
    explicit output_channel(std::ostream& out) noexcept
        : _out(out) {}

    output_channel(const output_channel&) = delete;
    output_channel& operator=(const output_channel&) = delete;

    void write(std::string_view text);
    void write_line(std::string_view text = {});
};

}  // namespace dply
