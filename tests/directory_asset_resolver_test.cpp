#include <gtest/gtest.h>
#include "core/directory_asset_resolver.hpp"
#include "stubs/pipeline_stubs.hpp"
#include <filesystem>
#include <fstream>
#include <future>

namespace fs = std::filesystem;

class DirectoryAssetResolverTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        root_ = fs::temp_directory_path() / "video_factory_assets_test";
        fs::remove_all(root_);
        paths_.assets_dir = (root_ / "assets").string();
        paths_.output_dir = (root_ / "output").string();
        paths_.temp_dir = (root_ / "temp").string();
        pool_ = std::make_shared<BlockingWorkerPool>(1);
        resolver_ = std::make_shared<DirectoryAssetResolver>(paths_, pool_);
    }

    void TearDown() override
    {
        pool_->shutdown();
        fs::remove_all(root_);
    }

    void touch(const std::string &name)
    {
        fs::create_directories(paths_.assets_dir);
        std::ofstream(fs::path(paths_.assets_dir) / name) << "img";
    }

    static std::vector<ScriptSection> sections(size_t count)
    {
        std::vector<ScriptSection> result;
        for (size_t i = 0; i < count; ++i)
        {
            result.push_back(ScriptSection{i, "section " + std::to_string(i)});
        }
        return result;
    }

    AssetResult resolveAndWait(size_t section_count)
    {
        auto promise = std::make_shared<std::promise<AssetResult>>();
        auto future = promise->get_future();
        resolver_->resolve(sections(section_count), CancellationToken(), [promise](AssetResult result)
                           { promise->set_value(std::move(result)); });
        return future.get();
    }

    fs::path root_;
    PathSettings paths_;
    std::shared_ptr<BlockingWorkerPool> pool_;
    std::shared_ptr<DirectoryAssetResolver> resolver_;
};

TEST_F(DirectoryAssetResolverTest, ListsSupportedImagesSorted)
{
    touch("b.JPG");
    touch("a.png");
    touch("c.jpeg");
    touch("notes.txt");
    touch("clip.gif");

    AssetResult result = resolveAndWait(3);

    ASSERT_TRUE(result.ok()) << result.error().message;
    ASSERT_EQ(result.value().size(), 3u);
    EXPECT_EQ(fs::path(result.value()[0].location).filename().string(), "a.png");
    EXPECT_EQ(fs::path(result.value()[1].location).filename().string(), "b.JPG");
    EXPECT_EQ(fs::path(result.value()[2].location).filename().string(), "c.jpeg");
    EXPECT_EQ(result.value()[0].section_index, 0u);
    EXPECT_EQ(result.value()[2].section_index, 2u);
}

TEST_F(DirectoryAssetResolverTest, CreatesDirectories)
{
    AssetResult result = resolveAndWait(1);

    EXPECT_TRUE(fs::is_directory(paths_.assets_dir));
    EXPECT_TRUE(fs::is_directory(paths_.output_dir));
    EXPECT_TRUE(fs::is_directory(paths_.temp_dir));
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, AssetErrorKind::NOT_FOUND);
}

TEST_F(DirectoryAssetResolverTest, UnreadableAssetsPathIsFetchFailed)
{
    // A regular file where the directory should be
    fs::create_directories(root_);
    std::ofstream(root_ / "assets") << "not a directory";

    AssetResult result = resolveAndWait(1);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, AssetErrorKind::FETCH_FAILED);
}

TEST_F(DirectoryAssetResolverTest, EmptyDirectoryIsFilledWithStockPhotos)
{
    AssetSettings settings;
    settings.auto_generate = true;
    settings.theme = "polvos";
    settings.pexels_api_key = "pexels-key";
    auto transport = std::make_shared<FakePhotoTransport>();
    transport->search_response.body = R"({"photos": [{"src": {"large": "https://img/a.jpg"}},
                                                      {"src": {"large": "https://img/b.jpg"}}]})";
    resolver_ = std::make_shared<DirectoryAssetResolver>(paths_, pool_,
                                                         std::make_shared<StockPhotoFetcher>(settings, transport));

    AssetResult result = resolveAndWait(2);

    ASSERT_TRUE(result.ok()) << result.error().message;
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_EQ(fs::path(result.value()[0].location).filename().string(), "pexels_01.jpg");
    EXPECT_EQ(fs::path(result.value()[1].location).filename().string(), "pexels_02.jpg");
    EXPECT_EQ(transport->last_query, "polvos");
}

TEST_F(DirectoryAssetResolverTest, FailedStockSearchFallsThroughToNotFound)
{
    AssetSettings settings;
    settings.auto_generate = true;
    settings.theme = "polvos";
    settings.pexels_api_key = "pexels-key";
    auto transport = std::make_shared<FakePhotoTransport>();
    transport->search_response = PhotoServiceResponse{0, "", "connection refused"};
    resolver_ = std::make_shared<DirectoryAssetResolver>(paths_, pool_,
                                                         std::make_shared<StockPhotoFetcher>(settings, transport));

    AssetResult result = resolveAndWait(2);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, AssetErrorKind::NOT_FOUND);
    EXPECT_EQ(transport->searches, 1);
}

TEST_F(DirectoryAssetResolverTest, ExistingImagesSkipStockPhotos)
{
    touch("01.png");
    AssetSettings settings;
    settings.auto_generate = true;
    settings.theme = "polvos";
    settings.pexels_api_key = "pexels-key";
    auto transport = std::make_shared<FakePhotoTransport>();
    resolver_ = std::make_shared<DirectoryAssetResolver>(paths_, pool_,
                                                         std::make_shared<StockPhotoFetcher>(settings, transport));

    AssetResult result = resolveAndWait(1);

    ASSERT_TRUE(result.ok()) << result.error().message;
    EXPECT_EQ(transport->searches, 0);
}

TEST_F(DirectoryAssetResolverTest, DisabledAutoGenerateNeverSearches)
{
    auto transport = std::make_shared<FakePhotoTransport>();
    resolver_ = std::make_shared<DirectoryAssetResolver>(paths_, pool_,
                                                         std::make_shared<StockPhotoFetcher>(AssetSettings(), transport));

    AssetResult result = resolveAndWait(1);

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().kind, AssetErrorKind::NOT_FOUND);
    EXPECT_EQ(transport->searches, 0);
}

TEST(DirectoryAssetAssignmentTest, ImagesReusedWhenSectionsOutnumberThem)
{
    auto items = DirectoryAssetResolver::assignToSections({"a.png", "b.png"}, 5);

    ASSERT_EQ(items.size(), 5u);
    std::vector<std::string> locations;
    for (size_t i = 0; i < items.size(); ++i)
    {
        EXPECT_EQ(items[i].section_index, i);
        locations.push_back(items[i].location);
    }
    std::vector<std::string> expected{"a.png", "b.png", "a.png", "b.png", "a.png"};
    EXPECT_EQ(locations, expected);
}

TEST(DirectoryAssetAssignmentTest, ExtraImagesShareSectionsInOrder)
{
    auto items = DirectoryAssetResolver::assignToSections({"1.jpg", "2.jpg", "3.jpg", "4.jpg"}, 2);

    ASSERT_EQ(items.size(), 4u);
    EXPECT_EQ(items[0].section_index, 0u);
    EXPECT_EQ(items[1].section_index, 0u);
    EXPECT_EQ(items[2].section_index, 1u);
    EXPECT_EQ(items[3].section_index, 1u);
    EXPECT_EQ(items[3].location, "4.jpg");
}

TEST(DirectoryAssetAssignmentTest, SupportedExtensions)
{
    EXPECT_TRUE(DirectoryAssetResolver::isSupportedImage("x.png"));
    EXPECT_TRUE(DirectoryAssetResolver::isSupportedImage("x.JPEG"));
    EXPECT_FALSE(DirectoryAssetResolver::isSupportedImage("x.gif"));
    EXPECT_FALSE(DirectoryAssetResolver::isSupportedImage("png"));
}
