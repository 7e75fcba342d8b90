#include "channels/telegram_channel.hpp"

#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <fstream>
#include <tgbot/net/CurlHttpClient.h>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace osintpipe::channels {
namespace {

void LogEvent(utils::LogLevel level,
              const std::string& message,
              std::vector<std::pair<std::string, std::string>> fields = {}) {
    utils::Log(level, "telegram", message, std::move(fields));
}

bool ProxyConfigured() {
    for (const char* name : {"OSINTPIPE_TELEGRAM_USE_CURL", "HTTPS_PROXY", "HTTP_PROXY", "ALL_PROXY",
                             "https_proxy", "http_proxy", "all_proxy"}) {
        if (std::getenv(name) != nullptr) {
            return true;
        }
    }
    return false;
}

}  // namespace

std::string GetMediaExtension(const std::string& media_type, const std::string& mime_type) {
    if (mime_type == "image/jpeg") return ".jpg";
    if (mime_type == "image/png") return ".png";
    if (mime_type == "image/gif") return ".gif";
    if (mime_type == "video/mp4") return ".mp4";
    if (mime_type == "audio/ogg") return ".ogg";
    if (mime_type == "audio/mpeg") return ".mp3";
    if (mime_type == "audio/mp4") return ".m4a";

    if (media_type == "photo") return ".jpg";
    if (media_type == "video") return ".mp4";
    if (media_type == "voice") return ".ogg";
    if (media_type == "audio") return ".mp3";
    return ".bin";
}

TelegramChannel::TelegramChannel(const config::TelegramConfig& config,
                                 const std::string& spool_dir,
                                 EnqueueFn enqueue)
    : ChannelBase("telegram", std::move(enqueue), config.allow_from,
                  static_cast<std::size_t>(config.buffer_limit))
    , config_(config)
    , spool_dir_(utils::ExpandHome(spool_dir)) {}

queue::MessageEnvelope TelegramChannel::BuildEnvelope(const TgBot::Message& message) {
    queue::MessageEnvelope envelope{};
    envelope.source_id = message.chat ? std::to_string(message.chat->id) : std::string();
    envelope.message_id = std::to_string(message.messageId);
    envelope.text = message.text.empty() ? message.caption : message.text;
    envelope.posted_at = utils::FromMs(static_cast<long long>(message.date) * 1000);

    auto& metadata = envelope.raw_metadata;
    if (message.chat) {
        if (!message.chat->title.empty()) {
            metadata["chat_title"] = message.chat->title;
        }
        if (!message.chat->username.empty()) {
            metadata["chat_username"] = message.chat->username;
        }
    }
    if (message.forwardFromChat) {
        metadata["forward_from"] = message.forwardFromChat->username.empty()
            ? std::to_string(message.forwardFromChat->id)
            : message.forwardFromChat->username;
        metadata["forward_from_message_id"] = std::to_string(message.forwardFromMessageId);
    }
    if (!message.authorSignature.empty()) {
        metadata["author_signature"] = message.authorSignature;
    }
    if (!message.mediaGroupId.empty()) {
        metadata["media_group_id"] = message.mediaGroupId;
    }
    return envelope;
}

std::filesystem::path TelegramChannel::ResolveMediaPath(const std::string& chat_id,
                                                        std::int64_t message_id,
                                                        const std::string& file_id,
                                                        const std::string& ext) const {
    std::error_code ec;
    std::filesystem::create_directories(spool_dir_, ec);
    const auto filename = chat_id + "_" + std::to_string(message_id) + "_" + file_id.substr(0, 16) + ext;
    return spool_dir_ / filename;
}

std::string TelegramChannel::SpoolMedia(const TgBot::Message& message, queue::Metadata& metadata) {
    std::string media_type;
    std::string mime_type;
    std::string file_id;
    if (!message.photo.empty()) {
        media_type = "photo";
        file_id = message.photo.back()->fileId;
    } else if (message.video) {
        media_type = "video";
        file_id = message.video->fileId;
        mime_type = message.video->mimeType;
    } else if (message.voice) {
        media_type = "voice";
        file_id = message.voice->fileId;
        mime_type = message.voice->mimeType;
    } else if (message.audio) {
        media_type = "audio";
        file_id = message.audio->fileId;
        mime_type = message.audio->mimeType;
    } else if (message.document) {
        media_type = "document";
        file_id = message.document->fileId;
        mime_type = message.document->mimeType;
    }
    if (file_id.empty()) {
        return {};
    }
    metadata["media_type"] = media_type;

    const auto chat_id = message.chat ? std::to_string(message.chat->id) : std::string("unknown");
    const auto path = ResolveMediaPath(chat_id, message.messageId, file_id,
                                       GetMediaExtension(media_type, mime_type));
    try {
        auto file = bot_->getApi().getFile(file_id);
        const auto content = bot_->getApi().downloadFile(file->filePath);
        std::ofstream output(path, std::ios::binary);
        output.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!output) {
            throw std::runtime_error("write failed: " + path.string());
        }
    } catch (const std::exception& ex) {
        metadata["media_download_error"] = ex.what();
        LogEvent(utils::LogLevel::kWarn, "media download failed",
            {{"chat", chat_id}, {"message", std::to_string(message.messageId)}, {"error", ex.what()}});
        return {};
    }
    return "file://" + path.string();
}

void TelegramChannel::OnPost(const TgBot::Message::Ptr& message) {
    if (!message || !message->chat) {
        return;
    }
    if (message->text.rfind("/", 0) == 0) {
        return;
    }
    auto envelope = BuildEnvelope(*message);
    if (!IsAllowed(envelope.source_id)) {
        return;
    }
    const auto media_ref = SpoolMedia(*message, envelope.raw_metadata);
    if (!media_ref.empty()) {
        envelope.media_refs.push_back(media_ref);
    }
    if (envelope.text.empty() && envelope.media_refs.empty()) {
        return;
    }
    LogEvent(utils::LogLevel::kDebug, "post received", {{"key", envelope.Key()}});
    HandleMessage(std::move(envelope));
}

void TelegramChannel::Start() {
    if (running_) {
        return;
    }
    if (config_.token.empty()) {
        LogEvent(utils::LogLevel::kWarn, "token is empty; channel disabled");
        running_ = false;
        return;
    }
    running_ = true;
    polling_ = true;

    if (ProxyConfigured()) {
#ifdef HAVE_CURL
        http_client_ = std::make_unique<TgBot::CurlHttpClient>();
        bot_ = std::make_unique<TgBot::Bot>(config_.token, *http_client_);
        LogEvent(utils::LogLevel::kInfo, "bot initialized with CurlHttpClient (proxy-aware)");
#else
        bot_ = std::make_unique<TgBot::Bot>(config_.token);
        LogEvent(utils::LogLevel::kWarn, "curl not available, fallback to BoostHttpOnlySslClient");
#endif
    } else {
        bot_ = std::make_unique<TgBot::Bot>(config_.token);
        LogEvent(utils::LogLevel::kInfo, "bot initialized with BoostHttpOnlySslClient");
    }

    // Channel posts and group messages both arrive through the message handler.
    bot_->getEvents().onAnyMessage([this](TgBot::Message::Ptr message) {
        OnPost(message);
    });

    polling_thread_ = std::make_unique<std::thread>([this]() {
        long_poll_ = std::make_unique<TgBot::TgLongPoll>(*bot_, 100, config_.poll_timeout_s);
        while (running_ && polling_) {
            try {
                long_poll_->start();
            } catch (const std::exception& ex) {
                LogEvent(utils::LogLevel::kError, "long poll error", {{"error", ex.what()}});
                std::this_thread::sleep_for(std::chrono::seconds(1));
            }
        }
    });
}

void TelegramChannel::Stop() {
    running_ = false;
    polling_ = false;
    if (polling_thread_ && polling_thread_->joinable()) {
        polling_thread_->join();
    }
    polling_thread_.reset();
    long_poll_.reset();
    bot_.reset();
    http_client_.reset();
}

}  // namespace osintpipe::channels
