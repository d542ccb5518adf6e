#include "msgparse/image_id.hpp"

namespace msgparse
{
namespace
{
int hexValue(char ch) noexcept
{
    if (ch >= '0' && ch <= '9')
        return ch - '0';
    if (ch >= 'a' && ch <= 'f')
        return ch - 'a' + 10;
    if (ch >= 'A' && ch <= 'F')
        return ch - 'A' + 10;
    return -1;
}

bool isHyphenPosition(std::size_t index) noexcept
{
    return index == 8 || index == 13 || index == 18 || index == 23;
}

} // namespace

std::optional<ImageId> ImageId::parse(std::string_view text) noexcept
{
    if (text.size() != 36)
        return std::nullopt;

    std::array<std::uint8_t, 16> bytes{};
    std::size_t out = 0;
    int high = -1;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        char ch = text[i];
        if (isHyphenPosition(i))
        {
            if (ch != '-')
                return std::nullopt;
            continue;
        }
        int value = hexValue(ch);
        if (value < 0)
            return std::nullopt;
        if (high < 0)
        {
            high = value;
            continue;
        }
        bytes[out++] = static_cast<std::uint8_t>((high << 4) | value);
        high = -1;
    }
    return ImageId(bytes);
}

std::string ImageId::toString() const
{
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string result;
    result.reserve(36);
    for (std::size_t i = 0; i < bytes_.size(); ++i)
    {
        if (i == 4 || i == 6 || i == 8 || i == 10)
            result.push_back('-');
        result.push_back(kDigits[bytes_[i] >> 4]);
        result.push_back(kDigits[bytes_[i] & 0x0F]);
    }
    return result;
}

} // namespace msgparse
