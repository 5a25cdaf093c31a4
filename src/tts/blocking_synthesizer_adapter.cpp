#include "tts/blocking_synthesizer_adapter.hpp"
#include "logging/logger.hpp"
#include <stdexcept>

BlockingSynthesizerAdapter::BlockingSynthesizerAdapter(std::shared_ptr<BlockingSpeechProvider> provider,
                                                       std::shared_ptr<BlockingWorkerPool> pool)
    : provider_(std::move(provider)), pool_(std::move(pool))
{
    if (!provider_ || !pool_)
    {
        throw std::invalid_argument("BlockingSynthesizerAdapter requires a provider and a worker pool");
    }
}

void BlockingSynthesizerAdapter::synthesize(const SpeechRequest &request,
                                            const CancellationToken &token,
                                            SynthesisCompletion done)
{
    auto provider = provider_;
    bool queued = pool_->submit([provider, request, token, done]()
                                {
        if (token.isCancelled())
        {
            // Run was cancelled while the job waited for a worker
            done(SynthesisResult::Failure({SynthesisErrorKind::UNEXPECTED_RESPONSE, "Synthesis cancelled", std::nullopt}));
            return;
        }

        SynthesisResult result = SynthesisResult::Failure({SynthesisErrorKind::UNEXPECTED_RESPONSE, "Provider did not run", std::nullopt});
        try
        {
            result = provider->synthesizeBlocking(request);
        }
        catch (const std::exception &e)
        {
            Logger::error("[TTS] Blocking provider threw: " + std::string(e.what()));
            result = SynthesisResult::Failure({SynthesisErrorKind::UNEXPECTED_RESPONSE,
                                               "Provider error: " + std::string(e.what()),
                                               std::nullopt});
        }
        done(std::move(result)); });

    if (!queued)
    {
        done(SynthesisResult::Failure({SynthesisErrorKind::UNEXPECTED_RESPONSE,
                                       "Blocking worker pool unavailable",
                                       std::nullopt}));
    }
}
