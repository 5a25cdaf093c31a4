#include "core/directory_asset_resolver.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

DirectoryAssetResolver::DirectoryAssetResolver(const PathSettings &paths, std::shared_ptr<BlockingWorkerPool> pool,
                                               std::shared_ptr<StockPhotoFetcher> photo_fetcher)
    : paths_(paths), pool_(std::move(pool)), photo_fetcher_(std::move(photo_fetcher))
{
    if (!pool_)
    {
        throw std::invalid_argument("DirectoryAssetResolver requires a worker pool");
    }
}

void DirectoryAssetResolver::resolve(const std::vector<ScriptSection> &sections,
                                     const CancellationToken &token,
                                     Completion<AssetResult> done)
{
    size_t section_count = sections.size();
    auto self = shared_from_this();
    bool queued = pool_->submit([self, section_count, token, done]()
                                {
        if (token.isCancelled())
        {
            done(AssetResult::Failure({AssetErrorKind::FETCH_FAILED, "Asset resolution cancelled"}));
            return;
        }
        done(self->resolveBlocking(section_count)); });

    if (!queued)
    {
        done(AssetResult::Failure({AssetErrorKind::FETCH_FAILED, "Blocking worker pool unavailable"}));
    }
}

AssetResult DirectoryAssetResolver::resolveBlocking(size_t section_count) const
{
    if (!ensureDirectories())
    {
        return AssetResult::Failure({AssetErrorKind::FETCH_FAILED,
                                     "Could not create asset directories under " + paths_.assets_dir});
    }

    AssetResult images = listImages();
    if (!images.ok())
    {
        return images;
    }
    if (images.value().empty() && photo_fetcher_ && photo_fetcher_->isEnabled())
    {
        photo_fetcher_->fetchInto(paths_.assets_dir);
        images = listImages();
        if (!images.ok())
        {
            return images;
        }
    }
    if (images.value().empty())
    {
        Logger::warn("[ASSETS] No images found. Add assets to proceed.");
        return AssetResult::Failure({AssetErrorKind::NOT_FOUND, "No images found in " + paths_.assets_dir});
    }

    std::vector<std::string> locations;
    locations.reserve(images.value().size());
    for (const auto &item : images.value())
    {
        locations.push_back(item.location);
    }
    return AssetResult::Success(assignToSections(locations, section_count));
}

bool DirectoryAssetResolver::ensureDirectories() const
{
    for (const auto &directory : {paths_.assets_dir, paths_.output_dir, paths_.temp_dir})
    {
        std::error_code ec;
        fs::create_directories(directory, ec);
        if (ec)
        {
            Logger::error("[ASSETS] Failed to create directory " + directory + ": " + ec.message());
            return false;
        }
    }
    Logger::info("[ASSETS] Directories ensured: " + paths_.assets_dir);
    return true;
}

AssetResult DirectoryAssetResolver::listImages() const
{
    std::vector<std::string> images;
    std::error_code ec;
    fs::directory_iterator it(paths_.assets_dir, ec);
    if (ec)
    {
        return AssetResult::Failure({AssetErrorKind::FETCH_FAILED,
                                     "Cannot read assets directory " + paths_.assets_dir + ": " + ec.message()});
    }

    for (; it != fs::directory_iterator(); it.increment(ec))
    {
        if (ec)
        {
            return AssetResult::Failure({AssetErrorKind::FETCH_FAILED,
                                         "Error while listing " + paths_.assets_dir + ": " + ec.message()});
        }
        std::error_code entry_ec;
        if (it->is_regular_file(entry_ec) && isSupportedImage(it->path().string()))
        {
            images.push_back(it->path().string());
        }
    }
    if (ec)
    {
        return AssetResult::Failure({AssetErrorKind::FETCH_FAILED,
                                     "Error while listing " + paths_.assets_dir + ": " + ec.message()});
    }

    std::sort(images.begin(), images.end());
    Logger::info("[ASSETS] Found " + std::to_string(images.size()) + " images");

    std::vector<AssetItem> items;
    items.reserve(images.size());
    for (const auto &image : images)
    {
        items.push_back(AssetItem{image, 0, AssetKind::IMAGE});
    }
    return AssetResult::Success(std::move(items));
}

std::vector<AssetItem> DirectoryAssetResolver::assignToSections(const std::vector<std::string> &images, size_t section_count)
{
    std::vector<AssetItem> items;
    if (images.empty())
    {
        return items;
    }
    if (section_count == 0)
    {
        section_count = 1;
    }

    size_t count = std::max(images.size(), section_count);
    items.reserve(count);
    for (size_t k = 0; k < count; ++k)
    {
        // Section indices never decrease, so rendering order follows the script
        items.push_back(AssetItem{images[k % images.size()], k * section_count / count, AssetKind::IMAGE});
    }
    return items;
}

bool DirectoryAssetResolver::isSupportedImage(const std::string &path)
{
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return ext == ".png" || ext == ".jpg" || ext == ".jpeg";
}
