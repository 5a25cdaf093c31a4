#include "tts/elevenlabs_synthesizer.hpp"
#include "logging/logger.hpp"
#include <stdexcept>

ElevenLabsSynthesizer::ElevenLabsSynthesizer(std::shared_ptr<BlockingSpeechTransport> transport, const std::string &api_key)
    : transport_(std::move(transport)), api_key_(api_key)
{
    if (!transport_)
    {
        throw std::invalid_argument("ElevenLabsSynthesizer requires a transport");
    }
    if (api_key_.empty())
    {
        Logger::warn("[TTS] ELEVENLABS_API_KEY is not configured");
    }
}

SynthesisResult ElevenLabsSynthesizer::synthesizeBlocking(const SpeechRequest &request)
{
    if (api_key_.empty())
    {
        return SynthesisResult::Failure({SynthesisErrorKind::AUTH_FAILURE,
                                         "ELEVENLABS_API_KEY is not configured",
                                         std::nullopt});
    }
    if (request.voice_id.empty())
    {
        return SynthesisResult::Failure({SynthesisErrorKind::INVALID_VOICE_ID, "Empty ElevenLabs voice id", std::nullopt});
    }

    Logger::info("[TTS] Generating audio with ElevenLabs: voice=" + request.voice_id);

    try
    {
        TransportResponse response = transport_->requestSpeech(request);
        return SpeechResponseMapper::toSynthesisResult(request, response);
    }
    catch (const std::exception &e)
    {
        Logger::error("[TTS] ElevenLabs transport failed: " + std::string(e.what()));
        return SynthesisResult::Failure({SynthesisErrorKind::UNEXPECTED_RESPONSE,
                                         "ElevenLabs transport error: " + std::string(e.what()),
                                         std::nullopt});
    }
}
