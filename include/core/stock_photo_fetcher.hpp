#pragma once

#include <memory>
#include <string>
#include <vector>
#include "core/pipeline_config.hpp"

/**
 * @brief Raw answer of the stock photo service
 */
struct PhotoServiceResponse
{
    int status = 0;   // HTTP-like status; 0 means the connection failed
    std::string body; // JSON for a search, image bytes for a download
    std::string error_message;
};

/**
 * @brief Vendor transport of the stock photo service. Calls block the calling thread.
 */
class PhotoSearchTransport
{
public:
    virtual ~PhotoSearchTransport() = default;

    virtual PhotoServiceResponse searchPhotos(const std::string &query, int per_page,
                                              const std::string &orientation, const std::string &api_key) = 0;

    virtual PhotoServiceResponse downloadPhoto(const std::string &url, const std::string &api_key) = 0;
};

/**
 * @brief Fills an empty assets directory with stock photos of the configured theme.
 *
 * Search and download failures are logged as warnings and never raised; the
 * caller lists the directory again afterwards and decides what is missing.
 */
class StockPhotoFetcher
{
public:
    StockPhotoFetcher(const AssetSettings &settings, std::shared_ptr<PhotoSearchTransport> transport);

    bool isEnabled() const { return settings_.auto_generate; }

    /**
     * @brief Search the theme and download every result into assets_dir
     * @return Number of photos written
     */
    size_t fetchInto(const std::string &assets_dir) const;

    /**
     * @brief Image URLs of a search response, preferring the large rendition
     *
     * Entries without a usable URL are skipped. Malformed JSON yields no URLs.
     */
    static std::vector<std::string> parsePhotoUrls(const std::string &json_text);

    // pexels_01.jpg, pexels_02.jpg, ...
    static std::string photoFileName(size_t number);

    static constexpr const char *ORIENTATION = "landscape";

private:
    std::vector<std::string> searchPhotoUrls() const;
    bool downloadPhoto(const std::string &url, const std::string &destination) const;

    AssetSettings settings_;
    std::shared_ptr<PhotoSearchTransport> transport_;
};
