#include "tts/edge_synthesizer.hpp"
#include "logging/logger.hpp"
#include <stdexcept>

EdgeSynthesizer::EdgeSynthesizer(std::shared_ptr<AsyncSpeechTransport> transport)
    : transport_(std::move(transport))
{
    if (!transport_)
    {
        throw std::invalid_argument("EdgeSynthesizer requires a transport");
    }
}

void EdgeSynthesizer::synthesize(const SpeechRequest &request,
                                 const CancellationToken &token,
                                 SynthesisCompletion done)
{
    if (request.voice_id.empty())
    {
        done(SynthesisResult::Failure({SynthesisErrorKind::INVALID_VOICE_ID, "Empty Edge voice id", std::nullopt}));
        return;
    }

    if (token.isCancelled())
    {
        done(SynthesisResult::Failure({SynthesisErrorKind::UNEXPECTED_RESPONSE, "Synthesis cancelled", std::nullopt}));
        return;
    }

    Logger::info("[TTS] Generating audio with EdgeTTS: voice=" + request.voice_id);

    try
    {
        transport_->requestSpeech(request, [request, done](TransportResponse response)
                                  { done(SpeechResponseMapper::toSynthesisResult(request, response)); });
    }
    catch (const std::exception &e)
    {
        Logger::error("[TTS] Edge transport failed to start request: " + std::string(e.what()));
        done(SynthesisResult::Failure({SynthesisErrorKind::UNEXPECTED_RESPONSE,
                                       "Edge transport error: " + std::string(e.what()),
                                       std::nullopt}));
    }
}
