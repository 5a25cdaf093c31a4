#include "core/stock_photo_fetcher.hpp"
#include "logging/logger.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace
{
    bool isSuccessStatus(int status)
    {
        return status >= 200 && status < 300;
    }

    std::string describeFailure(const PhotoServiceResponse &response)
    {
        std::string reason = response.error_message.empty() ? "no details" : response.error_message;
        if (response.status == 0)
        {
            return reason;
        }
        return "(status=" + std::to_string(response.status) + "): " + reason;
    }
}

StockPhotoFetcher::StockPhotoFetcher(const AssetSettings &settings, std::shared_ptr<PhotoSearchTransport> transport)
    : settings_(settings), transport_(std::move(transport))
{
    if (!transport_)
    {
        throw std::invalid_argument("StockPhotoFetcher requires a transport");
    }
}

size_t StockPhotoFetcher::fetchInto(const std::string &assets_dir) const
{
    if (settings_.theme.empty() || settings_.pexels_api_key.empty())
    {
        Logger::warn("[ASSETS] Auto-generate enabled but theme or API key missing.");
        return 0;
    }

    std::vector<std::string> urls = searchPhotoUrls();
    size_t written = 0;
    for (size_t i = 0; i < urls.size(); ++i)
    {
        std::string destination = (fs::path(assets_dir) / photoFileName(i + 1)).string();
        if (downloadPhoto(urls[i], destination))
        {
            ++written;
        }
    }

    Logger::info("[ASSETS] Downloaded " + std::to_string(written) + " of " + std::to_string(urls.size()) +
                 " photos for theme '" + settings_.theme + "'");
    return written;
}

std::vector<std::string> StockPhotoFetcher::searchPhotoUrls() const
{
    Logger::info("[PEXELS] Searching photos: query=" + settings_.theme + " per_page=" +
                 std::to_string(settings_.pexels_per_page));

    PhotoServiceResponse response;
    try
    {
        response = transport_->searchPhotos(settings_.theme, settings_.pexels_per_page, ORIENTATION,
                                            settings_.pexels_api_key);
    }
    catch (const std::exception &e)
    {
        Logger::warn("[PEXELS] Search failed: " + std::string(e.what()));
        return {};
    }

    if (!isSuccessStatus(response.status))
    {
        Logger::warn("[PEXELS] Search failed " + describeFailure(response));
        return {};
    }
    return parsePhotoUrls(response.body);
}

bool StockPhotoFetcher::downloadPhoto(const std::string &url, const std::string &destination) const
{
    PhotoServiceResponse response;
    try
    {
        response = transport_->downloadPhoto(url, settings_.pexels_api_key);
    }
    catch (const std::exception &e)
    {
        Logger::warn("[PEXELS] Download failed: " + std::string(e.what()));
        return false;
    }

    if (!isSuccessStatus(response.status) || response.body.empty())
    {
        Logger::warn("[PEXELS] Download failed " + describeFailure(response));
        return false;
    }

    std::error_code ec;
    fs::create_directories(fs::path(destination).parent_path(), ec);
    std::ofstream file(destination, std::ios::binary | std::ios::trunc);
    if (!file.is_open())
    {
        Logger::warn("[PEXELS] Cannot write " + destination);
        return false;
    }
    file.write(response.body.data(), static_cast<std::streamsize>(response.body.size()));
    if (!file)
    {
        Logger::warn("[PEXELS] Short write to " + destination);
        file.close();
        fs::remove(destination, ec);
        return false;
    }

    Logger::info("[PEXELS] Downloaded " + destination);
    return true;
}

std::vector<std::string> StockPhotoFetcher::parsePhotoUrls(const std::string &json_text)
{
    std::vector<std::string> urls;
    try
    {
        auto payload = nlohmann::json::parse(json_text);
        if (!payload.is_object() || !payload.contains("photos") || !payload["photos"].is_array())
        {
            return urls;
        }

        for (const auto &photo : payload["photos"])
        {
            if (!photo.is_object() || !photo.contains("src") || !photo["src"].is_object())
            {
                continue;
            }
            const auto &src = photo["src"];
            std::string url = src.value("large", "");
            if (url.empty())
            {
                url = src.value("original", "");
            }
            if (!url.empty())
            {
                urls.push_back(url);
            }
        }
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::warn("[PEXELS] Invalid JSON response: " + std::string(e.what()));
        urls.clear();
    }
    return urls;
}

std::string StockPhotoFetcher::photoFileName(size_t number)
{
    char name[32];
    std::snprintf(name, sizeof(name), "pexels_%02zu.jpg", number);
    return name;
}
