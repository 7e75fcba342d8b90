#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <unordered_map>

#include "channels/channel_base.hpp"
#include "config/config_schema.hpp"

namespace osintpipe::channels {

class ChannelManager {
public:
    ChannelManager(const config::Config& config, ChannelBase::EnqueueFn enqueue);
    ~ChannelManager();

    void Register(std::unique_ptr<ChannelBase> channel);
    ChannelBase* GetChannel(const std::string& name);
    void StartAll();
    void StopAll();

    std::unordered_map<std::string, bool> Status() const;
    std::size_t Buffered() const;

private:
    void InitChannels();
    void RegisterTelegram(const config::TelegramConfig& config);
    void RunBufferFlusher();

    config::Config config_;
    ChannelBase::EnqueueFn enqueue_;
    std::atomic<bool> flush_running_{false};
    std::thread flush_thread_;
    std::chrono::milliseconds flush_interval_{1000};

    std::unordered_map<std::string, std::unique_ptr<ChannelBase>> channels_;
};

}  // namespace osintpipe::channels
