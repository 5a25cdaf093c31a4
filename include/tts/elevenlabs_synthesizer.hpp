#pragma once

#include <memory>
#include <string>
#include "tts/speech_synthesizer.hpp"

/**
 * @brief Provider whose synthesis call holds the calling thread.
 *
 * Never called directly by the pipeline; BlockingSynthesizerAdapter runs it
 * on the blocking worker pool.
 */
class BlockingSpeechProvider
{
public:
    virtual ~BlockingSpeechProvider() = default;
    virtual SynthesisResult synthesizeBlocking(const SpeechRequest &request) = 0;
    virtual TtsProvider provider() const = 0;
};

/**
 * @brief ElevenLabs provider, the blocking variant
 */
class ElevenLabsSynthesizer : public BlockingSpeechProvider
{
public:
    ElevenLabsSynthesizer(std::shared_ptr<BlockingSpeechTransport> transport, const std::string &api_key);

    /**
     * @brief Synthesize on the calling thread
     *
     * An empty API key is reported as AUTH_FAILURE without contacting the vendor.
     */
    SynthesisResult synthesizeBlocking(const SpeechRequest &request) override;

    TtsProvider provider() const override { return TtsProvider::ELEVENLABS; }

private:
    std::shared_ptr<BlockingSpeechTransport> transport_;
    std::string api_key_;
};
