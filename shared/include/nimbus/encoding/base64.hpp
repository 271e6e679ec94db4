#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace nimbus::encoding
{

    std::string encode_base64(std::span<const std::byte> data);

    // Throws std::invalid_argument on malformed input.
    std::vector<std::byte> decode_base64(std::string_view input);

    std::string encode_hex(std::span<const std::byte> data);

    std::vector<std::byte> decode_hex(std::string_view input);

} // namespace nimbus::encoding
