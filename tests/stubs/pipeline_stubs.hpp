#pragma once

#include <algorithm>
#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "core/pipeline_stages.hpp"
#include "core/process_runner.hpp"
#include "core/stock_photo_fetcher.hpp"
#include "tts/elevenlabs_synthesizer.hpp"
#include "tts/speech_synthesizer.hpp"

/*
 * Collaborator stubs for pipeline tests. Each one replays a scripted list of
 * outcomes, repeating the last one once the list is exhausted, and counts its
 * calls.
 */

template <typename R>
class ScriptedOutcomes
{
public:
    explicit ScriptedOutcomes(std::vector<R> outcomes) : outcomes_(std::move(outcomes)) {}

    R at(int call_index) const
    {
        size_t i = std::min(static_cast<size_t>(call_index), outcomes_.size() - 1);
        return outcomes_[i];
    }

private:
    std::vector<R> outcomes_;
};

class StubScriptGenerator : public ScriptGenerator
{
public:
    explicit StubScriptGenerator(std::vector<GenerationResult> outcomes = {
                                     GenerationResult::Success("Primeiro fato curioso.\n\nSegundo fato curioso.")})
        : outcomes_(std::move(outcomes))
    {
    }

    void generate(const std::string &topic, const std::string &language, const CancellationToken &,
                  Completion<GenerationResult> done) override
    {
        int n = calls++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_topic_ = topic;
            last_language_ = language;
            if (hold_completion)
            {
                pending_ = done;
                return;
            }
        }
        done(outcomes_.at(n));
    }

    std::string lastLanguage() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_language_;
    }

    std::string lastTopic() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_topic_;
    }

    std::atomic<int> calls{0};
    // Keep the completion instead of invoking it, the call never finishes
    std::atomic<bool> hold_completion{false};

private:
    ScriptedOutcomes<GenerationResult> outcomes_;
    mutable std::mutex mutex_;
    std::string last_topic_;
    std::string last_language_;
    Completion<GenerationResult> pending_;
};

class StubSpeechSynthesizer : public SpeechSynthesizer
{
public:
    explicit StubSpeechSynthesizer(TtsProvider provider, std::vector<SynthesisResult> outcomes = {})
        : provider_(provider), outcomes_(std::move(outcomes))
    {
    }

    void synthesize(const SpeechRequest &request, const CancellationToken &, SynthesisCompletion done) override
    {
        int n = calls++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }

        if (outcomes_.empty())
        {
            AudioArtifact artifact;
            artifact.location = request.output_path;
            artifact.duration = std::chrono::milliseconds(4000);
            artifact.sample_rate_hz = 24000;
            artifact.channels = 1;
            artifact.format = "mp3";
            done(SynthesisResult::Success(artifact));
            return;
        }

        size_t i = std::min(static_cast<size_t>(n), outcomes_.size() - 1);
        done(outcomes_[i]);
    }

    TtsProvider provider() const override { return provider_; }

    std::vector<SpeechRequest> requests() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    std::atomic<int> calls{0};

private:
    TtsProvider provider_;
    std::vector<SynthesisResult> outcomes_;
    mutable std::mutex mutex_;
    std::vector<SpeechRequest> requests_;
};

class StubAssetResolver : public AssetResolver
{
public:
    explicit StubAssetResolver(std::vector<AssetResult> outcomes = {
                                   AssetResult::Success({AssetItem{"assets/01.jpg", 0, AssetKind::IMAGE},
                                                         AssetItem{"assets/02.jpg", 1, AssetKind::IMAGE}})})
        : outcomes_(std::move(outcomes))
    {
    }

    void resolve(const std::vector<ScriptSection> &sections, const CancellationToken &,
                 Completion<AssetResult> done) override
    {
        int n = calls++;
        last_section_count = sections.size();
        done(outcomes_.at(n));
    }

    std::atomic<int> calls{0};
    std::atomic<size_t> last_section_count{0};

private:
    ScriptedOutcomes<AssetResult> outcomes_;
};

class StubVideoComposer : public VideoComposer
{
public:
    StubVideoComposer() = default;
    explicit StubVideoComposer(std::vector<RenderResult> outcomes) : outcomes_(std::move(outcomes)) {}

    void compose(const AudioArtifact &audio, const std::vector<AssetItem> &assets, const std::string &output_path,
                 const CancellationToken &, Completion<RenderResult> done) override
    {
        int n = calls++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            last_audio_location_ = audio.location;
            last_asset_count_ = assets.size();
        }

        if (outcomes_.empty())
        {
            done(RenderResult::Success(output_path));
            return;
        }
        size_t i = std::min(static_cast<size_t>(n), outcomes_.size() - 1);
        done(outcomes_[i]);
    }

    std::string lastAudioLocation() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_audio_location_;
    }

    size_t lastAssetCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_asset_count_;
    }

    std::atomic<int> calls{0};

private:
    std::vector<RenderResult> outcomes_;
    mutable std::mutex mutex_;
    std::string last_audio_location_;
    size_t last_asset_count_ = 0;
};

inline TransportResponse okResponse(size_t audio_bytes = 6000)
{
    TransportResponse response;
    response.status = 200;
    response.audio.assign(audio_bytes, 0x55);
    return response;
}

inline TransportResponse statusResponse(int status)
{
    TransportResponse response;
    response.status = status;
    return response;
}

/**
 * @brief Async transport answering from a separate thread, like a network callback
 */
class FakeAsyncTransport : public AsyncSpeechTransport
{
public:
    explicit FakeAsyncTransport(std::vector<TransportResponse> responses) : responses_(std::move(responses)) {}

    ~FakeAsyncTransport() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &t : threads_)
        {
            if (t.joinable())
                t.join();
        }
    }

    void requestSpeech(const SpeechRequest &, std::function<void(TransportResponse)> on_response) override
    {
        int n = calls++;
        TransportResponse response = responses_.at(n);
        std::lock_guard<std::mutex> lock(mutex_);
        threads_.emplace_back([response, on_response]()
                              { on_response(response); });
    }

    std::atomic<int> calls{0};

private:
    ScriptedOutcomes<TransportResponse> responses_;
    std::mutex mutex_;
    std::vector<std::thread> threads_;
};

class FakeBlockingTransport : public BlockingSpeechTransport
{
public:
    explicit FakeBlockingTransport(std::vector<TransportResponse> responses) : responses_(std::move(responses)) {}

    TransportResponse requestSpeech(const SpeechRequest &) override
    {
        int n = calls++;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            caller_threads_.push_back(std::this_thread::get_id());
        }
        return responses_.at(n);
    }

    std::vector<std::thread::id> callerThreads() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return caller_threads_;
    }

    std::atomic<int> calls{0};

private:
    ScriptedOutcomes<TransportResponse> responses_;
    mutable std::mutex mutex_;
    std::vector<std::thread::id> caller_threads_;
};

/**
 * @brief CommandRunner that records invocations instead of starting processes
 */
class FakeCommandRunner : public CommandRunner
{
public:
    std::optional<std::string> findExecutable(const std::string &name) const override
    {
        if (!executable_available)
            return std::nullopt;
        return "/usr/bin/" + name;
    }

    ProcessOutput run(const std::vector<std::string> &args) const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        invocations_.push_back(args);
        return result;
    }

    std::vector<std::vector<std::string>> invocations() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return invocations_;
    }

    bool executable_available = true;
    ProcessOutput result{0, ""};

private:
    mutable std::mutex mutex_;
    mutable std::vector<std::vector<std::string>> invocations_;
};

/**
 * @brief Photo service that answers one search and serves fixed image bytes
 */
class FakePhotoTransport : public PhotoSearchTransport
{
public:
    PhotoServiceResponse searchPhotos(const std::string &query, int per_page,
                                      const std::string &, const std::string &api_key) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++searches;
        last_query = query;
        last_per_page = per_page;
        last_api_key = api_key;
        return search_response;
    }

    PhotoServiceResponse downloadPhoto(const std::string &url, const std::string &) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        downloads.push_back(url);
        if (std::find(failing_urls.begin(), failing_urls.end(), url) != failing_urls.end())
        {
            return PhotoServiceResponse{403, "", "Forbidden"};
        }
        return PhotoServiceResponse{200, "jpeg-bytes", ""};
    }

    PhotoServiceResponse search_response{200, R"({"photos": []})", ""};
    std::vector<std::string> failing_urls;

    int searches = 0;
    std::string last_query;
    int last_per_page = 0;
    std::string last_api_key;
    std::vector<std::string> downloads;

private:
    std::mutex mutex_;
};
