#include "chunkvault/encoding/base64.hpp"

#include <array>
#include <cctype>
#include <cstdint>

namespace chunkvault::encoding
{

    namespace
    {

        constexpr std::string_view kAlphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
        constexpr std::uint8_t kNotInAlphabet = 0xFF;

        consteval auto make_reverse_table()
        {
            std::array<std::uint8_t, 256> table{};
            table.fill(kNotInAlphabet);
            for (std::size_t i = 0; i < kAlphabet.size(); ++i)
            {
                table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<std::uint8_t>(i);
            }
            return table;
        }

        constexpr auto kReverse = make_reverse_table();

        char sextet(std::uint32_t group, int shift)
        {
            return kAlphabet[(group >> shift) & 0x3Fu];
        }

        std::uint32_t octet(std::byte value)
        {
            return static_cast<std::uint32_t>(value);
        }

    } // namespace

    std::string encode_base64(std::span<const std::byte> data)
    {
        std::string output;
        output.reserve(((data.size() + 2) / 3) * 4);

        std::size_t i = 0;
        for (; i + 3 <= data.size(); i += 3)
        {
            const auto group = (octet(data[i]) << 16) | (octet(data[i + 1]) << 8) | octet(data[i + 2]);
            output.push_back(sextet(group, 18));
            output.push_back(sextet(group, 12));
            output.push_back(sextet(group, 6));
            output.push_back(sextet(group, 0));
        }

        const auto rest = data.size() - i;
        if (rest > 0)
        {
            auto group = octet(data[i]) << 16;
            if (rest == 2)
            {
                group |= octet(data[i + 1]) << 8;
            }
            output.push_back(sextet(group, 18));
            output.push_back(sextet(group, 12));
            output.push_back(rest == 2 ? sextet(group, 6) : '=');
            output.push_back('=');
        }
        return output;
    }

    std::optional<std::vector<std::byte>> decode_base64(std::string_view input)
    {
        std::string text;
        text.reserve(input.size());
        for (const char ch : input)
        {
            if (!std::isspace(static_cast<unsigned char>(ch)))
            {
                text.push_back(ch);
            }
        }
        if (text.size() % 4 != 0)
        {
            return std::nullopt;
        }

        std::vector<std::byte> output;
        output.reserve((text.size() / 4) * 3);
        for (std::size_t quantum = 0; quantum < text.size(); quantum += 4)
        {
            const bool last = quantum + 4 == text.size();
            std::uint32_t group = 0;
            std::size_t padding = 0;
            for (std::size_t k = 0; k < 4; ++k)
            {
                const char ch = text[quantum + k];
                if (ch == '=')
                {
                    // Only the last two characters of the final quantum may be padding.
                    if (!last || k < 2)
                    {
                        return std::nullopt;
                    }
                    ++padding;
                    group <<= 6;
                    continue;
                }
                const auto value = kReverse[static_cast<unsigned char>(ch)];
                if (value == kNotInAlphabet || padding > 0)
                {
                    return std::nullopt;
                }
                group = (group << 6) | value;
            }

            output.push_back(static_cast<std::byte>((group >> 16) & 0xFFu));
            if (padding < 2)
            {
                output.push_back(static_cast<std::byte>((group >> 8) & 0xFFu));
            }
            if (padding < 1)
            {
                output.push_back(static_cast<std::byte>(group & 0xFFu));
            }
        }
        return output;
    }

} // namespace chunkvault::encoding
