#pragma once

#include <map>
#include <memory>
#include <string>
#include "core/channel_registry.hpp"
#include "core/pipeline_errors.hpp"
#include "core/result.hpp"
#include "core/tts_provider.hpp"
#include "tts/speech_synthesizer.hpp"

/**
 * @brief Provider and voice resolved for one channel
 */
struct ProviderSelection
{
    TtsProvider provider;
    std::string voice_id;
};

/**
 * @brief Ready-to-call synthesis for one channel
 */
struct SynthesisBinding
{
    ChannelConfig channel;
    ProviderSelection selection;
    std::shared_ptr<SpeechSynthesizer> synthesizer;
};

/**
 * @brief Resolves which provider and voice a channel uses.
 *
 * The active provider is fixed at construction. Switching providers means
 * building a new selector; nothing here reads global state.
 */
class ProviderSelector
{
public:
    /**
     * @param registry Channel registry, shared read-only
     * @param active_provider Configured provider identifier, kept verbatim and validated on resolve
     * @param synthesizers Capability instance per provider, required by bind() only
     */
    ProviderSelector(std::shared_ptr<const ChannelRegistry> registry,
                     const std::string &active_provider,
                     std::map<TtsProvider, std::shared_ptr<SpeechSynthesizer>> synthesizers = {});

    /**
     * @brief Resolve the provider selection for a channel
     *
     * Checks, in order: the active provider is enumerated (UNKNOWN_PROVIDER),
     * the channel exists (UNKNOWN_CHANNEL), the channel has a voice id for the
     * active provider (MISSING_VOICE_ID). Never substitutes another provider.
     */
    Result<ProviderSelection, ConfigError> resolve(const std::string &channel_name) const;

    /**
     * @brief Resolve and attach the synthesizer registered for the selected provider
     *
     * A selected provider without a registered synthesizer is UNKNOWN_PROVIDER.
     */
    Result<SynthesisBinding, ConfigError> bind(const std::string &channel_name) const;

    const std::string &getActiveProvider() const { return active_provider_; }

private:
    std::shared_ptr<const ChannelRegistry> registry_;
    std::string active_provider_;
    std::map<TtsProvider, std::shared_ptr<SpeechSynthesizer>> synthesizers_;
};
