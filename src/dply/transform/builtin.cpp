#include "./builtin.hpp"

#include <yaml-cpp/node/convert.h>
#include <yaml-cpp/node/impl.h>

#include <array>
#include <cstdint>
#include <stdexcept>

using namespace dply;

namespace {

constexpr char b64_alphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

constexpr std::array<std::int8_t, 256> make_decode_table() {
    std::array<std::int8_t, 256> table{};
    for (auto& v : table) {
        v = -1;
    }
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(b64_alphabet[i])] = static_cast<std::int8_t>(i);
    }
    return table;
}

constexpr auto b64_decode_table = make_decode_table();

std::string xor_key(const YAML::Node& options) {
    if (options.IsMap()) {
        auto key = options["key"];
        if (key.IsDefined() && key.IsScalar()) {
            auto str = key.as<std::string>();
            if (!str.empty()) {
                return str;
            }
        }
    }
    return std::string(1, '\x5a');
}

std::string xor_bytes(const transform_context& ctx) {
    auto        key = xor_key(ctx.options);
    std::string ret(ctx.data);
    for (std::size_t idx = 0; idx < ret.size(); ++idx) {
        ret[idx] = static_cast<char>(ret[idx] ^ key[idx % key.size()]);
    }
    return ret;
}

}  // namespace

std::string dply::base64_encode(std::string_view data) {
    std::string encoded;
    encoded.reserve(((data.size() + 2) / 3) * 4);
    auto byte_at = [&](std::size_t i) { return static_cast<std::uint32_t>(
                                            static_cast<unsigned char>(data[i])); };
    std::size_t index = 0;
    while (index + 3 <= data.size()) {
        std::uint32_t triple = (byte_at(index) << 16) | (byte_at(index + 1) << 8) | byte_at(index + 2);
        encoded.push_back(b64_alphabet[(triple >> 18) & 0x3F]);
        encoded.push_back(b64_alphabet[(triple >> 12) & 0x3F]);
        encoded.push_back(b64_alphabet[(triple >> 6) & 0x3F]);
        encoded.push_back(b64_alphabet[triple & 0x3F]);
        index += 3;
    }
    auto remaining = data.size() - index;
    if (remaining == 1) {
        std::uint32_t triple = byte_at(index) << 16;
        encoded.push_back(b64_alphabet[(triple >> 18) & 0x3F]);
        encoded.push_back(b64_alphabet[(triple >> 12) & 0x3F]);
        encoded.append("==");
    } else if (remaining == 2) {
        std::uint32_t triple = (byte_at(index) << 16) | (byte_at(index + 1) << 8);
        encoded.push_back(b64_alphabet[(triple >> 18) & 0x3F]);
        encoded.push_back(b64_alphabet[(triple >> 12) & 0x3F]);
        encoded.push_back(b64_alphabet[(triple >> 6) & 0x3F]);
        encoded.push_back('=');
    }
    return encoded;
}

std::string dply::base64_decode(std::string_view data) {
    std::string decoded;
    decoded.reserve((data.size() / 4) * 3);
    std::uint32_t accum   = 0;
    int           n_bits  = 0;
    std::size_t   n_chars = 0;
    std::size_t   n_pad   = 0;
    for (char c : data) {
        if (c == '\n' || c == '\r') {
            continue;
        }
        ++n_chars;
        if (c == '=') {
            ++n_pad;
            continue;
        }
        if (n_pad != 0) {
            throw std::invalid_argument("Invalid base64 data: Padding in the middle of the input");
        }
        auto val = b64_decode_table[static_cast<unsigned char>(c)];
        if (val < 0) {
            throw std::invalid_argument("Invalid base64 data: Unexpected character");
        }
        accum = (accum << 6) | static_cast<std::uint32_t>(val);
        n_bits += 6;
        if (n_bits >= 8) {
            n_bits -= 8;
            decoded.push_back(static_cast<char>((accum >> n_bits) & 0xFF));
        }
    }
    if (n_chars % 4 != 0 || n_pad > 2) {
        throw std::invalid_argument("Invalid base64 data: Truncated input");
    }
    return decoded;
}

std::optional<transform_module> dply::builtin_transform_module(std::string_view id) {
    if (id == "base64") {
        return transform_module{
            .id             = "base64",
            .transform_data = [](const transform_context& ctx) { return base64_encode(ctx.data); },
            .restore_data   = [](const transform_context& ctx) { return base64_decode(ctx.data); },
        };
    }
    if (id == "xor") {
        return transform_module{
            .id             = "xor",
            .transform_data = xor_bytes,
            .restore_data   = xor_bytes,
        };
    }
    return std::nullopt;
}
