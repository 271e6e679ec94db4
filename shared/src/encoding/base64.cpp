#include "nimbus/encoding/base64.hpp"

#include <stdexcept>

#include <sodium.h>

#include "nimbus/crypto.hpp"

namespace nimbus::encoding
{

    namespace
    {
        constexpr int kVariant = sodium_base64_VARIANT_ORIGINAL;

        const unsigned char *as_uchar(std::span<const std::byte> data)
        {
            return reinterpret_cast<const unsigned char *>(data.data());
        }
    } // namespace

    std::string encode_base64(std::span<const std::byte> data)
    {
        crypto::ensure_sodium_init();
        std::string output(sodium_base64_ENCODED_LEN(data.size(), kVariant), '\0');
        sodium_bin2base64(output.data(), output.size(), as_uchar(data), data.size(), kVariant);
        output.resize(output.size() - 1); // trailing NUL
        return output;
    }

    std::vector<std::byte> decode_base64(std::string_view input)
    {
        crypto::ensure_sodium_init();
        std::vector<std::byte> output(input.size() / 4 * 3 + 3);
        std::size_t decoded = 0;
        if (sodium_base642bin(reinterpret_cast<unsigned char *>(output.data()), output.size(), input.data(),
                              input.size(), " \r\n", &decoded, nullptr, kVariant) != 0)
        {
            throw std::invalid_argument("Malformed base64 input");
        }
        output.resize(decoded);
        return output;
    }

    std::string encode_hex(std::span<const std::byte> data)
    {
        std::string output(data.size() * 2 + 1, '\0');
        sodium_bin2hex(output.data(), output.size(), as_uchar(data), data.size());
        output.resize(data.size() * 2);
        return output;
    }

    std::vector<std::byte> decode_hex(std::string_view input)
    {
        std::vector<std::byte> output(input.size() / 2);
        std::size_t decoded = 0;
        if (sodium_hex2bin(reinterpret_cast<unsigned char *>(output.data()), output.size(), input.data(), input.size(),
                           nullptr, &decoded, nullptr) != 0 ||
            decoded * 2 != input.size())
        {
            throw std::invalid_argument("Malformed hex input");
        }
        output.resize(decoded);
        return output;
    }

} // namespace nimbus::encoding
