#pragma once

#include <memory>
#include "tts/speech_synthesizer.hpp"

/**
 * @brief Edge TTS provider, the cooperative variant.
 *
 * Hands the request to an asynchronous transport and returns. The completion
 * runs when the transport delivers the response; no thread waits meanwhile.
 */
class EdgeSynthesizer : public SpeechSynthesizer
{
public:
    explicit EdgeSynthesizer(std::shared_ptr<AsyncSpeechTransport> transport);

    void synthesize(const SpeechRequest &request,
                    const CancellationToken &token,
                    SynthesisCompletion done) override;

    TtsProvider provider() const override { return TtsProvider::EDGE; }

private:
    std::shared_ptr<AsyncSpeechTransport> transport_;
};
