#pragma once

#include "common/config.hpp"
#include "events/contact_directory.hpp"
#include "events/message_normalizer.hpp"
#include "events/webhook_client.hpp"
#include "transport/transport.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace thread_pool {
class ThreadPool;
}

namespace relay {
namespace events {

// 处理一批消息所需的会话上下文
struct RelayContext {
    std::string account_id;
    std::string self_id;
    std::shared_ptr<ContactDirectory> contacts;
    std::shared_ptr<transport::Transport> transport;  // 用于下载媒体
};

// 把传输层消息规范化后转发给 webhook; pool 为空时在调用线程同步执行
class EventRelay {
public:
    EventRelay(std::shared_ptr<WebhookClient> webhook,
               std::shared_ptr<AssetStorageClient> assets,
               thread_pool::ThreadPool* pool,
               std::string source,
               std::string key_prefix);
    virtual ~EventRelay() = default;

    virtual void RelayMessages(const RelayContext& context, const transport::MessagesEvent& event);
    // fire-and-forget, 失败只记录日志
    virtual void NotifyConnected(const std::string& account_id, const std::string& identity);

    // 同步处理单条消息, 返回 webhook 投递结果
    common::Status ProcessMessage(const RelayContext& context, const transport::InboundMessage& message);

    std::size_t Delivered() const {
        return delivered_.load();
    }
    std::size_t Failed() const {
        return failed_.load();
    }

private:
    void Dispatch(std::function<void()> work);
    void AttachMedia(const RelayContext& context,
                     const transport::InboundMessage& message,
                     NormalizedMessage& normalized);

    std::shared_ptr<WebhookClient> webhook_;
    std::shared_ptr<AssetStorageClient> assets_;
    thread_pool::ThreadPool* pool_;
    std::string source_;
    std::string key_prefix_;
    std::atomic<std::size_t> delivered_{0};
    std::atomic<std::size_t> failed_{0};
};

}
}
