#pragma once

#include "msgparse/content_block.hpp"
#include "msgparse/message_parser.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace msgparse
{

// Resolves image identifiers to files named "<id>.<ext>" inside one
// directory. Loaded images are cached for the lifetime of the store.
class ImageStore
{
public:
    explicit ImageStore(std::filesystem::path directory);

    std::shared_ptr<const ImageResource> find(const ImageId &id) const;

    // The returned resolver refers to this store and must not outlive it.
    ImageResolver resolver() const;

    const std::filesystem::path &directory() const noexcept { return directory_; }
    std::size_t cached_count() const;

    static std::string media_type_for(const std::filesystem::path &path);

private:
    std::shared_ptr<const ImageResource> load(const ImageId &id) const;

    std::filesystem::path directory_;
    mutable std::mutex mutex_;
    mutable std::map<ImageId, std::shared_ptr<const ImageResource>> cache_;
};

} // namespace msgparse
