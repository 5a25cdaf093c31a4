#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "core/cancellation_token.hpp"
#include "core/pipeline_errors.hpp"
#include "core/result.hpp"
#include "core/tts_provider.hpp"

/**
 * @brief Synthesized narration produced once per pipeline run
 */
struct AudioArtifact
{
    std::string location; // Path of the written audio file
    std::chrono::milliseconds duration{0};
    int sample_rate_hz = 0;
    int channels = 0;
    std::string format; // Container/codec, e.g. "mp3"
    size_t size_bytes = 0;
};

/**
 * @brief One synthesis call: what to say, with which voice, and where to write it
 */
struct SpeechRequest
{
    std::string text;
    std::string voice_id;
    std::string output_path;
};

/**
 * @brief Raw answer of a speech vendor, before it is mapped to the synthesis contract
 */
struct TransportResponse
{
    int status = 0; // HTTP-like status; 0 means the connection failed
    std::vector<uint8_t> audio;
    std::optional<std::chrono::milliseconds> retry_after;
    std::string error_message;

    // Audio format as announced by the vendor
    std::string format = "mp3";
    int sample_rate_hz = 24000;
    int channels = 1;
    int bitrate_kbps = 48;
    // Vendor-reported duration; estimated from size and bitrate when zero
    std::chrono::milliseconds duration{0};
};

using SynthesisResult = Result<AudioArtifact, SynthesisError>;
using SynthesisCompletion = Completion<SynthesisResult>;

/**
 * @brief Speech synthesis capability, identical for every provider.
 *
 * synthesize() returns immediately; the completion is invoked exactly once,
 * possibly from another thread, when the audio is written or the call failed.
 * Callers never learn whether the provider suspended on I/O or ran on a
 * blocking worker.
 */
class SpeechSynthesizer
{
public:
    virtual ~SpeechSynthesizer() = default;

    virtual void synthesize(const SpeechRequest &request,
                            const CancellationToken &token,
                            SynthesisCompletion done) = 0;

    virtual TtsProvider provider() const = 0;
};

/**
 * @brief Non-blocking vendor transport. on_response may fire on any thread.
 */
class AsyncSpeechTransport
{
public:
    virtual ~AsyncSpeechTransport() = default;
    virtual void requestSpeech(const SpeechRequest &request,
                               std::function<void(TransportResponse)> on_response) = 0;
};

/**
 * @brief Vendor transport that holds the calling thread until the response arrives
 */
class BlockingSpeechTransport
{
public:
    virtual ~BlockingSpeechTransport() = default;
    virtual TransportResponse requestSpeech(const SpeechRequest &request) = 0;
};

/**
 * @brief Shared mapping from vendor responses to the synthesis contract.
 *
 * Both provider variants go through here, so a given response yields the same
 * artifact or error whichever provider produced it.
 */
class SpeechResponseMapper
{
public:
    /**
     * @brief Map a vendor response and, on success, write the audio to request.output_path
     *
     * 401/403 -> AUTH_FAILURE, 404/422 -> INVALID_VOICE_ID, 429 -> RATE_LIMITED,
     * 0/408/5xx -> TRANSIENT_NETWORK_ERROR, 2xx without audio and any other
     * status -> UNEXPECTED_RESPONSE.
     */
    static SynthesisResult toSynthesisResult(const SpeechRequest &request, const TransportResponse &response);

    static std::chrono::milliseconds estimateDuration(size_t size_bytes, int bitrate_kbps);

private:
    static bool writeAudio(const std::string &output_path, const std::vector<uint8_t> &audio, std::string &error);
};
