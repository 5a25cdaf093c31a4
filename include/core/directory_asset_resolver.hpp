#pragma once

#include <memory>
#include <string>
#include <vector>
#include "core/blocking_worker_pool.hpp"
#include "core/pipeline_config.hpp"
#include "core/pipeline_stages.hpp"
#include "core/stock_photo_fetcher.hpp"

/**
 * @brief Resolves script sections to the images of a local assets directory.
 *
 * Directory access runs on the blocking worker pool. Images are taken in name
 * order and spread over the sections in script order; when there are more
 * sections than images the images are reused round-robin. An empty directory
 * is first filled by the stock photo fetcher, when one is enabled.
 *
 * Must be owned by a std::shared_ptr.
 */
class DirectoryAssetResolver : public AssetResolver,
                               public std::enable_shared_from_this<DirectoryAssetResolver>
{
public:
    DirectoryAssetResolver(const PathSettings &paths, std::shared_ptr<BlockingWorkerPool> pool,
                           std::shared_ptr<StockPhotoFetcher> photo_fetcher = nullptr);

    void resolve(const std::vector<ScriptSection> &sections,
                 const CancellationToken &token,
                 Completion<AssetResult> done) override;

    /**
     * @brief Create the assets, output and temp directories if missing
     * @return false if any of them could not be created
     */
    bool ensureDirectories() const;

    /**
     * @brief List .png, .jpg and .jpeg files of the assets directory, sorted by name
     */
    AssetResult listImages() const;

    /**
     * @brief Pair images with sections, preserving both orders
     */
    static std::vector<AssetItem> assignToSections(const std::vector<std::string> &images, size_t section_count);

    static bool isSupportedImage(const std::string &path);

private:
    AssetResult resolveBlocking(size_t section_count) const;

    PathSettings paths_;
    std::shared_ptr<BlockingWorkerPool> pool_;
    std::shared_ptr<StockPhotoFetcher> photo_fetcher_;
};
