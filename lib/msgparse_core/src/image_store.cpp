#include "msgparse/image_store.hpp"

#include <algorithm>
#include <array>
#include <initializer_list>
#include <cctype>
#include <fstream>
#include <iterator>
#include <string_view>
#include <system_error>
#include <utility>

namespace msgparse
{
namespace
{
struct MediaType
{
    std::string_view extension;
    std::string_view type;
};

constexpr std::array<MediaType, 6> kMediaTypes{{
    {".png", "image/png"},
    {".jpg", "image/jpeg"},
    {".jpeg", "image/jpeg"},
    {".gif", "image/gif"},
    {".webp", "image/webp"},
    {".bmp", "image/bmp"},
}};

std::string upper(std::string text)
{
    for (char &ch : text)
        ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
    return text;
}

std::string lower(std::string text)
{
    for (char &ch : text)
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return text;
}

bool readFile(const std::filesystem::path &path, std::vector<std::uint8_t> &data)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return false;
    data.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    return !in.bad();
}

} // namespace

ImageStore::ImageStore(std::filesystem::path directory) : directory_(std::move(directory))
{
}

std::shared_ptr<const ImageResource> ImageStore::find(const ImageId &id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = cache_.find(id);
    if (it != cache_.end())
        return it->second;

    auto image = load(id);
    if (image)
        cache_.emplace(id, image);
    return image;
}

ImageResolver ImageStore::resolver() const
{
    return [this](const ImageId &id) { return find(id); };
}

std::size_t ImageStore::cached_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

std::string ImageStore::media_type_for(const std::filesystem::path &path)
{
    std::string extension = lower(path.extension().string());
    auto it = std::find_if(kMediaTypes.begin(), kMediaTypes.end(), [&](const MediaType &entry) {
        return entry.extension == extension;
    });
    if (it == kMediaTypes.end())
        return "application/octet-stream";
    return std::string(it->type);
}

std::shared_ptr<const ImageResource> ImageStore::load(const ImageId &id) const
{
    if (directory_.empty())
        return nullptr;

    const std::string name = id.toString();
    for (const std::string &stem : {name, upper(name)})
    {
        for (const auto &entry : kMediaTypes)
        {
            std::filesystem::path candidate = directory_ / (stem + std::string(entry.extension));
            std::error_code ec;
            if (!std::filesystem::is_regular_file(candidate, ec))
                continue;

            auto image = std::make_shared<ImageResource>();
            if (!readFile(candidate, image->data) || image->data.empty())
                continue;
            image->id = id;
            image->mediaType = std::string(entry.type);
            image->source = candidate;
            return image;
        }
    }
    return nullptr;
}

} // namespace msgparse
