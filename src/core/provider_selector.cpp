#include "core/provider_selector.hpp"
#include "logging/logger.hpp"
#include <stdexcept>

ProviderSelector::ProviderSelector(std::shared_ptr<const ChannelRegistry> registry,
                                   const std::string &active_provider,
                                   std::map<TtsProvider, std::shared_ptr<SpeechSynthesizer>> synthesizers)
    : registry_(std::move(registry)), active_provider_(active_provider), synthesizers_(std::move(synthesizers))
{
    if (!registry_)
    {
        throw std::invalid_argument("ProviderSelector requires a channel registry");
    }
}

Result<ProviderSelection, ConfigError> ProviderSelector::resolve(const std::string &channel_name) const
{
    using SelectionResult = Result<ProviderSelection, ConfigError>;

    auto provider = TtsProviders::fromString(active_provider_);
    if (!provider)
    {
        std::string message = "Unknown TTS provider: '" + active_provider_ + "'";
        Logger::error("[CONFIG] " + message);
        return SelectionResult::Failure({ConfigErrorKind::UNKNOWN_PROVIDER, message});
    }

    auto channel = registry_->lookup(channel_name);
    if (!channel)
    {
        std::string message = "Unknown channel: '" + channel_name + "'";
        Logger::error("[CONFIG] " + message);
        return SelectionResult::Failure({ConfigErrorKind::UNKNOWN_CHANNEL, message});
    }

    auto voice_id = channel->voiceIdFor(*provider);
    if (!voice_id)
    {
        std::string message = "No voice ID configured for provider: " + TtsProviders::getProviderName(*provider) +
                              " (channel '" + channel_name + "')";
        Logger::error("[CONFIG] " + message);
        return SelectionResult::Failure({ConfigErrorKind::MISSING_VOICE_ID, message});
    }

    Logger::debug("[CONFIG] Channel '" + channel_name + "' resolved to provider=" +
                  TtsProviders::getProviderName(*provider) + " voice=" + *voice_id);
    return SelectionResult::Success(ProviderSelection{*provider, *voice_id});
}

Result<SynthesisBinding, ConfigError> ProviderSelector::bind(const std::string &channel_name) const
{
    using BindingResult = Result<SynthesisBinding, ConfigError>;

    auto selection = resolve(channel_name);
    if (!selection.ok())
    {
        return BindingResult::Failure(selection.error());
    }

    auto it = synthesizers_.find(selection.value().provider);
    if (it == synthesizers_.end() || !it->second)
    {
        std::string message = "No synthesizer registered for provider: " +
                              TtsProviders::getProviderName(selection.value().provider);
        Logger::error("[CONFIG] " + message);
        return BindingResult::Failure({ConfigErrorKind::UNKNOWN_PROVIDER, message});
    }

    // resolve() succeeded, so the channel is present
    return BindingResult::Success(SynthesisBinding{*registry_->lookup(channel_name), selection.value(), it->second});
}
