#include "tts/speech_synthesizer.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

SynthesisResult SpeechResponseMapper::toSynthesisResult(const SpeechRequest &request, const TransportResponse &response)
{
    const int status = response.status;
    const std::string detail = response.error_message.empty() ? "" : ": " + response.error_message;

    if (status == 401 || status == 403)
    {
        return SynthesisResult::Failure({SynthesisErrorKind::AUTH_FAILURE,
                                         "Provider rejected credentials (status " + std::to_string(status) + ")" + detail,
                                         std::nullopt});
    }
    if (status == 404 || status == 422)
    {
        return SynthesisResult::Failure({SynthesisErrorKind::INVALID_VOICE_ID,
                                         "Provider rejected voice id '" + request.voice_id + "'" + detail,
                                         std::nullopt});
    }
    if (status == 429)
    {
        return SynthesisResult::Failure({SynthesisErrorKind::RATE_LIMITED,
                                         "Provider rate limit reached" + detail,
                                         response.retry_after});
    }
    if (status == 0 || status == 408 || (status >= 500 && status < 600))
    {
        return SynthesisResult::Failure({SynthesisErrorKind::TRANSIENT_NETWORK_ERROR,
                                         "Provider unreachable (status " + std::to_string(status) + ")" + detail,
                                         std::nullopt});
    }
    if (status < 200 || status >= 300)
    {
        return SynthesisResult::Failure({SynthesisErrorKind::UNEXPECTED_RESPONSE,
                                         "Unexpected provider status " + std::to_string(status) + detail,
                                         std::nullopt});
    }
    if (response.audio.empty())
    {
        return SynthesisResult::Failure({SynthesisErrorKind::UNEXPECTED_RESPONSE,
                                         "Provider returned no audio",
                                         std::nullopt});
    }

    std::string write_error;
    if (!writeAudio(request.output_path, response.audio, write_error))
    {
        return SynthesisResult::Failure({SynthesisErrorKind::UNEXPECTED_RESPONSE, write_error, std::nullopt});
    }

    AudioArtifact artifact;
    artifact.location = request.output_path;
    artifact.size_bytes = response.audio.size();
    artifact.format = response.format;
    artifact.sample_rate_hz = response.sample_rate_hz;
    artifact.channels = response.channels;
    artifact.duration = response.duration.count() > 0
                            ? response.duration
                            : estimateDuration(response.audio.size(), response.bitrate_kbps);
    return SynthesisResult::Success(artifact);
}

std::chrono::milliseconds SpeechResponseMapper::estimateDuration(size_t size_bytes, int bitrate_kbps)
{
    if (bitrate_kbps <= 0)
    {
        return std::chrono::milliseconds(0);
    }
    // bits / (kbit/s) = ms
    return std::chrono::milliseconds(static_cast<long long>(size_bytes) * 8 / bitrate_kbps);
}

bool SpeechResponseMapper::writeAudio(const std::string &output_path, const std::vector<uint8_t> &audio, std::string &error)
{
    try
    {
        fs::path path(output_path);
        if (path.has_parent_path())
        {
            fs::create_directories(path.parent_path());
        }

        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            error = "Cannot open audio output: " + output_path;
            Logger::error("[TTS] " + error);
            return false;
        }
        out.write(reinterpret_cast<const char *>(audio.data()), static_cast<std::streamsize>(audio.size()));
        if (!out)
        {
            error = "Failed writing audio output: " + output_path;
            Logger::error("[TTS] " + error);
            return false;
        }
    }
    catch (const fs::filesystem_error &e)
    {
        error = "Cannot prepare audio output " + output_path + ": " + e.what();
        Logger::error("[TTS] " + error);
        return false;
    }

    Logger::debug("[TTS] Wrote " + std::to_string(audio.size()) + " bytes to " + output_path);
    return true;
}
