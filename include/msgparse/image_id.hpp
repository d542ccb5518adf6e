#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace msgparse
{

// 128-bit identifier written as 8-4-4-4-12 hexadecimal digits.
class ImageId
{
public:
    ImageId() = default;
    explicit ImageId(const std::array<std::uint8_t, 16> &bytes) noexcept : bytes_(bytes) {}

    static std::optional<ImageId> parse(std::string_view text) noexcept;

    std::string toString() const;
    const std::array<std::uint8_t, 16> &bytes() const noexcept { return bytes_; }

    bool operator==(const ImageId &other) const noexcept { return bytes_ == other.bytes_; }
    bool operator!=(const ImageId &other) const noexcept { return bytes_ != other.bytes_; }
    bool operator<(const ImageId &other) const noexcept { return bytes_ < other.bytes_; }

private:
    std::array<std::uint8_t, 16> bytes_{};
};

} // namespace msgparse
