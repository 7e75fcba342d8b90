#include "channels/channel_manager.hpp"

#include "channels/telegram_channel.hpp"

namespace osintpipe::channels {

ChannelManager::ChannelManager(const config::Config& config, ChannelBase::EnqueueFn enqueue)
    : config_(config)
    , enqueue_(std::move(enqueue)) {
    InitChannels();
}

ChannelManager::~ChannelManager() {
    StopAll();
}

void ChannelManager::InitChannels() {
    RegisterTelegram(config_.channels.telegram);
}

void ChannelManager::Register(std::unique_ptr<ChannelBase> channel) {
    auto name = channel->Name();
    channels_.emplace(std::move(name), std::move(channel));
}

ChannelBase* ChannelManager::GetChannel(const std::string& name) {
    auto it = channels_.find(name);
    if (it == channels_.end()) {
        return nullptr;
    }
    return it->second.get();
}

void ChannelManager::StartAll() {
    for (auto& [_, channel] : channels_) {
        channel->Start();
    }
    if (!flush_running_) {
        flush_running_ = true;
        flush_thread_ = std::thread([this] { RunBufferFlusher(); });
    }
}

void ChannelManager::StopAll() {
    flush_running_ = false;
    if (flush_thread_.joinable()) {
        flush_thread_.join();
    }
    for (auto& [_, channel] : channels_) {
        channel->Stop();
    }
}

std::unordered_map<std::string, bool> ChannelManager::Status() const {
    std::unordered_map<std::string, bool> status;
    for (const auto& [name, channel] : channels_) {
        status[name] = channel->IsRunning();
    }
    return status;
}

std::size_t ChannelManager::Buffered() const {
    std::size_t total = 0;
    for (const auto& [_, channel] : channels_) {
        total += channel->Buffered();
    }
    return total;
}

void ChannelManager::RegisterTelegram(const config::TelegramConfig& config) {
    if (!config.enabled) {
        return;
    }
    Register(std::make_unique<TelegramChannel>(config, config_.media.spool_dir, enqueue_));
}

void ChannelManager::RunBufferFlusher() {
    while (flush_running_) {
        std::this_thread::sleep_for(flush_interval_);
        for (auto& [_, channel] : channels_) {
            channel->FlushBuffer();
        }
    }
}

}  // namespace osintpipe::channels
