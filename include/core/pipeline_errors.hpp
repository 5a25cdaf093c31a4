#pragma once

#include <chrono>
#include <optional>
#include <string>

/**
 * @brief Error taxonomy of the video pipeline.
 *
 * ConfigError is raised before any stage runs. The remaining errors are
 * scoped to the stage that produced them. Only the kinds reported by
 * isRetryable() are retried by the stage; every other kind ends the run.
 */

enum class ConfigErrorKind
{
    UNKNOWN_CHANNEL,
    MISSING_VOICE_ID,
    UNKNOWN_PROVIDER
};

struct ConfigError
{
    ConfigErrorKind kind;
    std::string message;

    bool isRetryable() const { return false; }
};

enum class GenerationErrorKind
{
    QUOTA_EXCEEDED,
    INVALID_PROMPT,
    TRANSIENT_FAILURE
};

struct GenerationError
{
    GenerationErrorKind kind;
    std::string message;

    bool isRetryable() const { return kind == GenerationErrorKind::TRANSIENT_FAILURE; }
};

enum class SynthesisErrorKind
{
    AUTH_FAILURE,
    RATE_LIMITED,
    INVALID_VOICE_ID,
    TRANSIENT_NETWORK_ERROR,
    UNEXPECTED_RESPONSE
};

struct SynthesisError
{
    SynthesisErrorKind kind;
    std::string message;
    // Provider hint for RATE_LIMITED, empty when the provider gave none
    std::optional<std::chrono::milliseconds> retry_after;

    bool isRetryable() const
    {
        return kind == SynthesisErrorKind::RATE_LIMITED ||
               kind == SynthesisErrorKind::TRANSIENT_NETWORK_ERROR;
    }
};

enum class AssetErrorKind
{
    NOT_FOUND,
    FETCH_FAILED
};

struct AssetError
{
    AssetErrorKind kind;
    std::string message;

    bool isRetryable() const { return false; }
};

enum class RenderErrorKind
{
    ENCODER_UNAVAILABLE,
    INVALID_INPUT,
    ENCODING_FAILED
};

struct RenderError
{
    RenderErrorKind kind;
    std::string message;

    bool isRetryable() const { return false; }
};

/**
 * @brief Flat error kind reported in a pipeline failure
 */
enum class PipelineErrorKind
{
    UNKNOWN_CHANNEL,
    MISSING_VOICE_ID,
    UNKNOWN_PROVIDER,
    QUOTA_EXCEEDED,
    INVALID_PROMPT,
    TRANSIENT_FAILURE,
    AUTH_FAILURE,
    RATE_LIMITED,
    INVALID_VOICE_ID,
    TRANSIENT_NETWORK_ERROR,
    UNEXPECTED_RESPONSE,
    NOT_FOUND,
    FETCH_FAILED,
    ENCODER_UNAVAILABLE,
    INVALID_INPUT,
    ENCODING_FAILED,
    CANCELLED
};

class PipelineErrors
{
public:
    static PipelineErrorKind toPipelineKind(ConfigErrorKind kind);
    static PipelineErrorKind toPipelineKind(GenerationErrorKind kind);
    static PipelineErrorKind toPipelineKind(SynthesisErrorKind kind);
    static PipelineErrorKind toPipelineKind(AssetErrorKind kind);
    static PipelineErrorKind toPipelineKind(RenderErrorKind kind);

    /**
     * @brief Name of an error kind as shown to operators, e.g. "MissingVoiceId"
     */
    static std::string getKindName(PipelineErrorKind kind);

    template <typename Kind>
    static std::string getKindName(Kind kind)
    {
        return getKindName(toPipelineKind(kind));
    }
};

/**
 * @brief Provider-supplied delay before the next attempt, if any
 */
template <typename E>
std::optional<std::chrono::milliseconds> retryAfterHint(const E &)
{
    return std::nullopt;
}

inline std::optional<std::chrono::milliseconds> retryAfterHint(const SynthesisError &error)
{
    return error.retry_after;
}
