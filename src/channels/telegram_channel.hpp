#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

#include <tgbot/tgbot.h>

#include "channels/channel_base.hpp"
#include "config/config_schema.hpp"

namespace osintpipe::channels {

// Long-polls the Bot API for channel posts (and messages in chats the bot
// is a member of). Media is downloaded into the spool directory and
// referenced from the envelope as file:// URIs.
class TelegramChannel : public ChannelBase {
public:
    TelegramChannel(const config::TelegramConfig& config,
                    const std::string& spool_dir,
                    EnqueueFn enqueue);
    void Start() override;
    void Stop() override;

    // Envelope fields from one post. Media refs are filled in by the caller.
    static queue::MessageEnvelope BuildEnvelope(const TgBot::Message& message);

private:
    void OnPost(const TgBot::Message::Ptr& message);
    std::string SpoolMedia(const TgBot::Message& message, queue::Metadata& metadata);
    std::filesystem::path ResolveMediaPath(const std::string& chat_id,
                                           std::int64_t message_id,
                                           const std::string& file_id,
                                           const std::string& ext) const;

    config::TelegramConfig config_;
    std::filesystem::path spool_dir_;
    std::unique_ptr<TgBot::HttpClient> http_client_;
    std::unique_ptr<TgBot::Bot> bot_;
    std::unique_ptr<TgBot::TgLongPoll> long_poll_;
    std::unique_ptr<std::thread> polling_thread_;
    std::atomic<bool> polling_{false};
};

std::string GetMediaExtension(const std::string& media_type, const std::string& mime_type);

}  // namespace osintpipe::channels
