#include "core/pipeline_errors.hpp"

PipelineErrorKind PipelineErrors::toPipelineKind(ConfigErrorKind kind)
{
    switch (kind)
    {
    case ConfigErrorKind::UNKNOWN_CHANNEL:
        return PipelineErrorKind::UNKNOWN_CHANNEL;
    case ConfigErrorKind::MISSING_VOICE_ID:
        return PipelineErrorKind::MISSING_VOICE_ID;
    case ConfigErrorKind::UNKNOWN_PROVIDER:
        return PipelineErrorKind::UNKNOWN_PROVIDER;
    }
    return PipelineErrorKind::UNKNOWN_PROVIDER;
}

PipelineErrorKind PipelineErrors::toPipelineKind(GenerationErrorKind kind)
{
    switch (kind)
    {
    case GenerationErrorKind::QUOTA_EXCEEDED:
        return PipelineErrorKind::QUOTA_EXCEEDED;
    case GenerationErrorKind::INVALID_PROMPT:
        return PipelineErrorKind::INVALID_PROMPT;
    case GenerationErrorKind::TRANSIENT_FAILURE:
        return PipelineErrorKind::TRANSIENT_FAILURE;
    }
    return PipelineErrorKind::TRANSIENT_FAILURE;
}

PipelineErrorKind PipelineErrors::toPipelineKind(SynthesisErrorKind kind)
{
    switch (kind)
    {
    case SynthesisErrorKind::AUTH_FAILURE:
        return PipelineErrorKind::AUTH_FAILURE;
    case SynthesisErrorKind::RATE_LIMITED:
        return PipelineErrorKind::RATE_LIMITED;
    case SynthesisErrorKind::INVALID_VOICE_ID:
        return PipelineErrorKind::INVALID_VOICE_ID;
    case SynthesisErrorKind::TRANSIENT_NETWORK_ERROR:
        return PipelineErrorKind::TRANSIENT_NETWORK_ERROR;
    case SynthesisErrorKind::UNEXPECTED_RESPONSE:
        return PipelineErrorKind::UNEXPECTED_RESPONSE;
    }
    return PipelineErrorKind::UNEXPECTED_RESPONSE;
}

PipelineErrorKind PipelineErrors::toPipelineKind(AssetErrorKind kind)
{
    switch (kind)
    {
    case AssetErrorKind::NOT_FOUND:
        return PipelineErrorKind::NOT_FOUND;
    case AssetErrorKind::FETCH_FAILED:
        return PipelineErrorKind::FETCH_FAILED;
    }
    return PipelineErrorKind::FETCH_FAILED;
}

PipelineErrorKind PipelineErrors::toPipelineKind(RenderErrorKind kind)
{
    switch (kind)
    {
    case RenderErrorKind::ENCODER_UNAVAILABLE:
        return PipelineErrorKind::ENCODER_UNAVAILABLE;
    case RenderErrorKind::INVALID_INPUT:
        return PipelineErrorKind::INVALID_INPUT;
    case RenderErrorKind::ENCODING_FAILED:
        return PipelineErrorKind::ENCODING_FAILED;
    }
    return PipelineErrorKind::ENCODING_FAILED;
}

std::string PipelineErrors::getKindName(PipelineErrorKind kind)
{
    switch (kind)
    {
    case PipelineErrorKind::UNKNOWN_CHANNEL:
        return "UnknownChannel";
    case PipelineErrorKind::MISSING_VOICE_ID:
        return "MissingVoiceId";
    case PipelineErrorKind::UNKNOWN_PROVIDER:
        return "UnknownProvider";
    case PipelineErrorKind::QUOTA_EXCEEDED:
        return "QuotaExceeded";
    case PipelineErrorKind::INVALID_PROMPT:
        return "InvalidPrompt";
    case PipelineErrorKind::TRANSIENT_FAILURE:
        return "TransientFailure";
    case PipelineErrorKind::AUTH_FAILURE:
        return "AuthFailure";
    case PipelineErrorKind::RATE_LIMITED:
        return "RateLimited";
    case PipelineErrorKind::INVALID_VOICE_ID:
        return "InvalidVoiceId";
    case PipelineErrorKind::TRANSIENT_NETWORK_ERROR:
        return "TransientNetworkError";
    case PipelineErrorKind::UNEXPECTED_RESPONSE:
        return "UnexpectedResponse";
    case PipelineErrorKind::NOT_FOUND:
        return "NotFound";
    case PipelineErrorKind::FETCH_FAILED:
        return "FetchFailed";
    case PipelineErrorKind::ENCODER_UNAVAILABLE:
        return "EncoderUnavailable";
    case PipelineErrorKind::INVALID_INPUT:
        return "InvalidInput";
    case PipelineErrorKind::ENCODING_FAILED:
        return "EncodingFailed";
    case PipelineErrorKind::CANCELLED:
        return "Cancelled";
    }
    return "Unknown";
}
