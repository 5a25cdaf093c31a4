#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Speech synthesis backends known to the pipeline
 */
enum class TtsProvider
{
    EDGE,      // Cooperative network service
    ELEVENLABS // Blocking API client, runs on the blocking worker pool
};

class TtsProviders
{
public:
    /**
     * @brief Get the configuration identifier of a provider
     * @param provider The provider
     * @return Lowercase identifier as used in settings and channel files
     */
    static std::string getProviderName(TtsProvider provider)
    {
        switch (provider)
        {
        case TtsProvider::EDGE:
            return "edge";
        case TtsProvider::ELEVENLABS:
            return "elevenlabs";
        default:
            return "unknown";
        }
    }

    /**
     * @brief Convert a configuration identifier to a provider, ignoring case
     * @param provider_str Identifier such as "edge" or "ElevenLabs"
     * @return The provider, or std::nullopt when the identifier is not enumerated
     */
    static std::optional<TtsProvider> fromString(const std::string &provider_str)
    {
        std::string lowered = provider_str;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        for (TtsProvider provider : all())
        {
            if (lowered == getProviderName(provider))
                return provider;
        }
        return std::nullopt;
    }

    static std::vector<TtsProvider> all()
    {
        return {TtsProvider::EDGE, TtsProvider::ELEVENLABS};
    }
};
