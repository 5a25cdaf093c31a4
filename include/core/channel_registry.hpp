#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include "core/tts_provider.hpp"

/**
 * @brief Content identity of one channel
 *
 * A provider without an entry in voice_ids has no voice for this channel.
 * There is no fallback between providers.
 */
struct ChannelConfig
{
    std::string name;
    std::string language;
    std::map<TtsProvider, std::string> voice_ids;

    std::optional<std::string> voiceIdFor(TtsProvider provider) const;
};

/**
 * @brief Read-only mapping of channel name to channel configuration.
 *
 * Built once from configuration and never mutated afterwards, so a single
 * instance is shared by concurrent pipeline runs without locking.
 */
class ChannelRegistry
{
public:
    /**
     * @brief Build the registry
     * @param channels Channel definitions, names must be unique and non-empty
     * @throws std::invalid_argument on an empty or duplicate channel name
     */
    explicit ChannelRegistry(const std::vector<ChannelConfig> &channels);

    /**
     * @brief Look up a channel by name
     * @return The configuration, or std::nullopt when the channel is not registered
     */
    std::optional<ChannelConfig> lookup(const std::string &channel_name) const;

    bool contains(const std::string &channel_name) const;

    // Sorted by name
    std::vector<std::string> channelNames() const;

    size_t size() const { return channels_.size(); }

private:
    const std::map<std::string, ChannelConfig> channels_;

    static std::map<std::string, ChannelConfig> index(const std::vector<ChannelConfig> &channels);
};
