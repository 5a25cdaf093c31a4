#include "core/channel_registry.hpp"
#include "logging/logger.hpp"
#include <stdexcept>

std::optional<std::string> ChannelConfig::voiceIdFor(TtsProvider provider) const
{
    auto it = voice_ids.find(provider);
    if (it == voice_ids.end() || it->second.empty())
    {
        return std::nullopt;
    }
    return it->second;
}

ChannelRegistry::ChannelRegistry(const std::vector<ChannelConfig> &channels)
    : channels_(index(channels))
{
    Logger::info("[CONFIG] Channel registry loaded with " + std::to_string(channels_.size()) + " channels");
}

std::map<std::string, ChannelConfig> ChannelRegistry::index(const std::vector<ChannelConfig> &channels)
{
    std::map<std::string, ChannelConfig> indexed;
    for (const auto &channel : channels)
    {
        if (channel.name.empty())
        {
            throw std::invalid_argument("Channel name must not be empty");
        }
        if (!indexed.emplace(channel.name, channel).second)
        {
            throw std::invalid_argument("Duplicate channel name: " + channel.name);
        }
    }
    return indexed;
}

std::optional<ChannelConfig> ChannelRegistry::lookup(const std::string &channel_name) const
{
    auto it = channels_.find(channel_name);
    if (it == channels_.end())
    {
        Logger::debug("[CONFIG] Channel not found: " + channel_name);
        return std::nullopt;
    }
    return it->second;
}

bool ChannelRegistry::contains(const std::string &channel_name) const
{
    return channels_.find(channel_name) != channels_.end();
}

std::vector<std::string> ChannelRegistry::channelNames() const
{
    std::vector<std::string> names;
    names.reserve(channels_.size());
    for (const auto &[name, channel] : channels_)
    {
        names.push_back(name);
    }
    return names;
}
