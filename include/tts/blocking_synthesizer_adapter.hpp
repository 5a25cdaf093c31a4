#pragma once

#include <memory>
#include "core/blocking_worker_pool.hpp"
#include "tts/elevenlabs_synthesizer.hpp"
#include "tts/speech_synthesizer.hpp"

/**
 * @brief Presents a blocking provider through the suspend-until-ready contract.
 *
 * Each call is queued on the shared blocking worker pool; the completion fires
 * on the worker once the provider returns. The caller's thread is released
 * immediately.
 */
class BlockingSynthesizerAdapter : public SpeechSynthesizer
{
public:
    BlockingSynthesizerAdapter(std::shared_ptr<BlockingSpeechProvider> provider,
                               std::shared_ptr<BlockingWorkerPool> pool);

    void synthesize(const SpeechRequest &request,
                    const CancellationToken &token,
                    SynthesisCompletion done) override;

    TtsProvider provider() const override { return provider_->provider(); }

private:
    std::shared_ptr<BlockingSpeechProvider> provider_;
    std::shared_ptr<BlockingWorkerPool> pool_;
};
