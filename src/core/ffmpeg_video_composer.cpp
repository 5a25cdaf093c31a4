#include "core/ffmpeg_video_composer.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace
{
    // Last non-empty line of the encoder output, for error messages
    std::string lastLine(const std::string &output)
    {
        size_t end = output.find_last_not_of("\r\n");
        if (end == std::string::npos)
            return "";
        size_t begin = output.find_last_of('\n', end);
        begin = begin == std::string::npos ? 0 : begin + 1;
        return output.substr(begin, end - begin + 1);
    }

    std::string escapeConcatPath(const std::string &path)
    {
        std::string escaped;
        for (char c : path)
        {
            if (c == '\'')
                escaped += "'\\''";
            else
                escaped += c;
        }
        return escaped;
    }
}

FfmpegVideoComposer::FfmpegVideoComposer(const VideoSettings &settings,
                                         std::shared_ptr<BlockingWorkerPool> pool,
                                         std::shared_ptr<CommandRunner> runner)
    : settings_(settings), pool_(std::move(pool)), runner_(std::move(runner))
{
    if (!pool_ || !runner_)
    {
        throw std::invalid_argument("FfmpegVideoComposer requires a worker pool and a command runner");
    }
}

void FfmpegVideoComposer::compose(const AudioArtifact &audio,
                                  const std::vector<AssetItem> &assets,
                                  const std::string &output_path,
                                  const CancellationToken &token,
                                  Completion<RenderResult> done)
{
    auto self = shared_from_this();
    bool queued = pool_->submit([self, audio, assets, output_path, token, done]()
                                {
        if (token.isCancelled())
        {
            done(RenderResult::Failure({RenderErrorKind::ENCODING_FAILED, "Rendering cancelled"}));
            return;
        }
        done(self->composeBlocking(audio, assets, output_path)); });

    if (!queued)
    {
        done(RenderResult::Failure({RenderErrorKind::ENCODER_UNAVAILABLE, "Blocking worker pool unavailable"}));
    }
}

RenderResult FfmpegVideoComposer::composeBlocking(const AudioArtifact &audio,
                                                  const std::vector<AssetItem> &assets,
                                                  const std::string &output_path) const
{
    if (assets.empty())
    {
        return RenderResult::Failure({RenderErrorKind::INVALID_INPUT, "No images available for rendering"});
    }

    std::error_code ec;
    if (audio.location.empty() || !fs::is_regular_file(audio.location, ec))
    {
        return RenderResult::Failure({RenderErrorKind::INVALID_INPUT, "Narration audio not found: " + audio.location});
    }

    if (!frameSize(settings_.resolution))
    {
        return RenderResult::Failure({RenderErrorKind::INVALID_INPUT, "Unsupported resolution: " + settings_.resolution});
    }

    auto ffmpeg = runner_->findExecutable(ENCODER_BINARY);
    if (!ffmpeg)
    {
        Logger::error("[VIDEO] ffmpeg not found on PATH");
        return RenderResult::Failure({RenderErrorKind::ENCODER_UNAVAILABLE, "ffmpeg executable not found on PATH"});
    }

    fs::path output(output_path);
    if (output.has_parent_path())
    {
        fs::create_directories(output.parent_path(), ec);
        if (ec)
        {
            return RenderResult::Failure({RenderErrorKind::ENCODING_FAILED,
                                          "Cannot create output directory: " + ec.message()});
        }
    }

    std::string list_path = output_path + ".concat.txt";
    {
        std::ofstream list_file(list_path);
        if (!list_file.is_open())
        {
            return RenderResult::Failure({RenderErrorKind::ENCODING_FAILED, "Cannot write image list: " + list_path});
        }
        list_file << buildConcatList(assets, settings_.image_duration_seconds);
    }

    Logger::info("[VIDEO] Rendering video with " + std::to_string(assets.size()) + " images at " +
                 settings_.resolution + "/" + std::to_string(settings_.fps) + "fps");

    ProcessOutput result = runner_->run(buildArguments(*ffmpeg, list_path, audio.location, output_path, settings_));
    fs::remove(list_path, ec);

    if (result.exit_code != 0)
    {
        Logger::error("[VIDEO] Failed to render video: exit code " + std::to_string(result.exit_code));
        return RenderResult::Failure({RenderErrorKind::ENCODING_FAILED,
                                      "ffmpeg exited with code " + std::to_string(result.exit_code) + ": " +
                                          lastLine(result.output)});
    }

    Logger::info("[VIDEO] Video saved at " + output_path);
    return RenderResult::Success(output_path);
}

std::optional<std::pair<int, int>> FfmpegVideoComposer::frameSize(const std::string &resolution)
{
    if (resolution == "720p")
        return std::make_pair(1280, 720);
    if (resolution == "1080p")
        return std::make_pair(1920, 1080);
    if (resolution == "4k")
        return std::make_pair(3840, 2160);
    return std::nullopt;
}

std::string FfmpegVideoComposer::buildConcatList(const std::vector<AssetItem> &assets, int image_duration_seconds)
{
    std::string list = "ffconcat version 1.0\n";
    for (const auto &asset : assets)
    {
        std::string absolute = fs::absolute(asset.location).string();
        list += "file '" + escapeConcatPath(absolute) + "'\n";
        list += "duration " + std::to_string(image_duration_seconds) + "\n";
    }
    // The demuxer ignores the duration of the final entry unless it is repeated
    if (!assets.empty())
    {
        list += "file '" + escapeConcatPath(fs::absolute(assets.back().location).string()) + "'\n";
    }
    return list;
}

std::vector<std::string> FfmpegVideoComposer::buildArguments(const std::string &ffmpeg_path,
                                                             const std::string &concat_list_path,
                                                             const std::string &audio_path,
                                                             const std::string &output_path,
                                                             const VideoSettings &settings)
{
    auto size = frameSize(settings.resolution).value_or(std::make_pair(1920, 1080));
    std::string w = std::to_string(size.first);
    std::string h = std::to_string(size.second);
    std::string filter = "scale=" + w + ":" + h + ":force_original_aspect_ratio=decrease," +
                         "pad=" + w + ":" + h + ":(ow-iw)/2:(oh-ih)/2,format=yuv420p";

    return {ffmpeg_path,
            "-y",
            "-f", "concat",
            "-safe", "0",
            "-i", concat_list_path,
            "-i", audio_path,
            "-vf", filter,
            "-r", std::to_string(settings.fps),
            "-c:v", "libx264",
            "-c:a", "aac",
            output_path};
}
