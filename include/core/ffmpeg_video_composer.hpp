#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "core/blocking_worker_pool.hpp"
#include "core/pipeline_config.hpp"
#include "core/pipeline_stages.hpp"
#include "core/process_runner.hpp"

/**
 * @brief Renders a slideshow of the resolved images over the narration with ffmpeg.
 *
 * Every image is shown for image_duration_seconds, scaled and letterboxed to
 * the configured resolution, encoded as H.264 video with AAC audio. The
 * encoder process runs on the blocking worker pool.
 *
 * Must be owned by a std::shared_ptr.
 */
class FfmpegVideoComposer : public VideoComposer,
                            public std::enable_shared_from_this<FfmpegVideoComposer>
{
public:
    FfmpegVideoComposer(const VideoSettings &settings,
                        std::shared_ptr<BlockingWorkerPool> pool,
                        std::shared_ptr<CommandRunner> runner = std::make_shared<ProcessRunner>());

    void compose(const AudioArtifact &audio,
                 const std::vector<AssetItem> &assets,
                 const std::string &output_path,
                 const CancellationToken &token,
                 Completion<RenderResult> done) override;

    /**
     * @brief Frame size of a resolution preset: 720p, 1080p or 4k
     */
    static std::optional<std::pair<int, int>> frameSize(const std::string &resolution);

    /**
     * @brief Concat demuxer script listing every image with its display time
     */
    static std::string buildConcatList(const std::vector<AssetItem> &assets, int image_duration_seconds);

    static std::vector<std::string> buildArguments(const std::string &ffmpeg_path,
                                                   const std::string &concat_list_path,
                                                   const std::string &audio_path,
                                                   const std::string &output_path,
                                                   const VideoSettings &settings);

    static constexpr const char *ENCODER_BINARY = "ffmpeg";

private:
    RenderResult composeBlocking(const AudioArtifact &audio,
                                 const std::vector<AssetItem> &assets,
                                 const std::string &output_path) const;

    VideoSettings settings_;
    std::shared_ptr<BlockingWorkerPool> pool_;
    std::shared_ptr<CommandRunner> runner_;
};
