#pragma once

#include "transport/transport.hpp"

#include "transport_bridge.grpc.pb.h"
#include "transport_bridge.pb.h"

#include <grpcpp/grpcpp.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <thread>

namespace relay {
namespace transport {

// 桥接进程消息与内部类型互转
std::optional<TransportEvent> FromBridgeEvent(const proto::bridge::BridgeEvent& event);
InboundMessage FromWireMessage(const proto::bridge::WireMessage& message);
proto::bridge::WireMessage ToWireMessage(const InboundMessage& message);
common::Status FromGrpcStatus(const grpc::Status& status);

// 通过 gRPC 连接协议桥接进程; 事件流在独立线程上读取
class GrpcTransport : public Transport {
public:
    GrpcTransport(std::string account_id,
                  std::shared_ptr<proto::bridge::TransportBridge::StubInterface> stub,
                  std::chrono::milliseconds rpc_timeout);
    ~GrpcTransport() override;

    GrpcTransport(const GrpcTransport&) = delete;
    GrpcTransport& operator=(const GrpcTransport&) = delete;

    common::Status Connect(const std::optional<std::string>& credentials, EventSink sink) override;
    common::StatusOr<std::string> SendText(const std::string& destination, const std::string& text) override;
    common::Status Logout() override;
    void Close() override;
    std::string SelfId() const override;

    common::StatusOr<std::string> DownloadMedia(const InboundMessage& message) override;
    common::StatusOr<std::vector<Conversation>> ListConversations() override;
    common::StatusOr<std::vector<InboundMessage>> ListMessages(const std::string& conversation_id,
                                                                int limit) override;

private:
    void ReadLoop(std::unique_ptr<grpc::ClientReaderInterface<proto::bridge::BridgeEvent>> reader);
    void Deliver(TransportEvent event);
    void PrepareContext(grpc::ClientContext& context) const;

    const std::string account_id_;
    std::shared_ptr<proto::bridge::TransportBridge::StubInterface> stub_;
    const std::chrono::milliseconds rpc_timeout_;

    mutable std::mutex mutex_;
    std::unique_ptr<grpc::ClientContext> stream_context_;
    std::thread reader_;
    EventSink sink_;
    std::string self_id_;
    bool started_ = false;
    std::atomic<bool> closed_{false};
};

class GrpcTransportFactory : public TransportFactory {
public:
    GrpcTransportFactory(std::shared_ptr<grpc::Channel> channel, std::chrono::milliseconds rpc_timeout);

    std::shared_ptr<Transport> Create(const std::string& account_id) override;

private:
    std::shared_ptr<proto::bridge::TransportBridge::StubInterface> stub_;
    std::chrono::milliseconds rpc_timeout_;
};

}
}
