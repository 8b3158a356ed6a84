#include "transport/grpc_transport.hpp"
#include "fake_transport.hpp"

#include <gtest/gtest.h>
#include <grpcpp/grpcpp.h>

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace relay::transport;
using testutils::WaitUntil;

namespace {

// 进程内桥接服务: Connect 按脚本推送事件, 其余调用只记录
class FakeBridgeService final : public proto::bridge::TransportBridge::Service {
public:
    grpc::Status Connect(grpc::ServerContext* context,
                         const proto::bridge::ConnectRequest* request,
                         grpc::ServerWriter<proto::bridge::BridgeEvent>* writer) override {
        {
            std::lock_guard<std::mutex> lock(mutex);
            connect_requests.push_back(*request);
            auto it = context->client_metadata().find("x-account-id");
            if (it != context->client_metadata().end()) {
                stream_account.assign(it->second.data(), it->second.size());
            }
        }
        for (const auto& event : script) {
            writer->Write(event);
        }
        if (end_stream_after_script) {
            return grpc::Status::OK;
        }
        while (!context->IsCancelled()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return grpc::Status::CANCELLED;
    }

    grpc::Status SendText(grpc::ServerContext*,
                          const proto::bridge::SendTextRequest* request,
                          proto::bridge::SendTextResponse* response) override {
        if (request->destination().empty()) {
            return {grpc::StatusCode::INVALID_ARGUMENT, "destination required"};
        }
        std::lock_guard<std::mutex> lock(mutex);
        sent.push_back(*request);
        response->set_message_id("WIRE-" + std::to_string(sent.size()));
        return grpc::Status::OK;
    }

    grpc::Status Logout(grpc::ServerContext*, const proto::bridge::AccountRequest*, proto::bridge::Ack* ack) override {
        logouts.fetch_add(1);
        ack->set_ok(true);
        return grpc::Status::OK;
    }

    grpc::Status End(grpc::ServerContext*, const proto::bridge::AccountRequest*, proto::bridge::Ack* ack) override {
        ends.fetch_add(1);
        ack->set_ok(true);
        return grpc::Status::OK;
    }

    grpc::Status DownloadMedia(grpc::ServerContext*,
                               const proto::bridge::DownloadMediaRequest* request,
                               proto::bridge::DownloadMediaResponse* response) override {
        if (!request->message().has_content()) {
            return {grpc::StatusCode::NOT_FOUND, "no media"};
        }
        response->set_data("media:" + request->message().id());
        return grpc::Status::OK;
    }

    grpc::Status ListChats(grpc::ServerContext*,
                           const proto::bridge::AccountRequest*,
                           proto::bridge::ListChatsResponse* response) override {
        auto* chat = response->add_chats();
        chat->set_id("120363000000@g.us");
        chat->set_name("Familia");
        chat->set_is_group(true);
        chat->set_unread(4);
        return grpc::Status::OK;
    }

    grpc::Status ListMessages(grpc::ServerContext*,
                              const proto::bridge::ListMessagesRequest* request,
                              proto::bridge::ListMessagesResponse* response) override {
        for (int i = 0; i < request->limit(); ++i) {
            auto* message = response->add_messages();
            message->set_id("H" + std::to_string(i));
            message->set_remote_id(request->chat_id());
            message->mutable_content()->set_text("old");
        }
        return grpc::Status::OK;
    }

    std::vector<proto::bridge::BridgeEvent> script;
    bool end_stream_after_script = false;

    std::mutex mutex;
    std::vector<proto::bridge::ConnectRequest> connect_requests;
    std::vector<proto::bridge::SendTextRequest> sent;
    std::string stream_account;
    std::atomic<int> logouts{0};
    std::atomic<int> ends{0};
};

proto::bridge::BridgeEvent OpenedEvent(const std::string& self) {
    proto::bridge::BridgeEvent event;
    event.mutable_opened()->set_self_id(self);
    return event;
}

// 线程安全地收集事件
class EventCollector {
public:
    EventSink Sink() {
        return [this](TransportEvent event) {
            std::lock_guard<std::mutex> lock(mutex_);
            events_.push_back(std::move(event));
        };
    }
    std::vector<TransportEvent> Events() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }
    std::size_t Size() {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_.size();
    }

private:
    std::mutex mutex_;
    std::vector<TransportEvent> events_;
};

class GrpcTransportTest : public ::testing::Test {
protected:
    void StartBridge() {
        grpc::ServerBuilder builder;
        builder.RegisterService(&service_);
        builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &port_);
        server_ = builder.BuildAndStart();
        ASSERT_TRUE(server_);
        channel_ = grpc::CreateChannel("127.0.0.1:" + std::to_string(port_), grpc::InsecureChannelCredentials());
        factory_ = std::make_unique<GrpcTransportFactory>(channel_, std::chrono::milliseconds(2000));
    }

    void TearDown() override {
        transport_.reset();
        if (server_) {
            server_->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(1));
        }
    }

    FakeBridgeService service_;
    std::unique_ptr<grpc::Server> server_;
    std::shared_ptr<grpc::Channel> channel_;
    std::unique_ptr<GrpcTransportFactory> factory_;
    std::shared_ptr<Transport> transport_;
    int port_ = 0;
};

} // namespace

TEST(BridgeConversionTest, ConvertsMessagesEvent) {
    proto::bridge::BridgeEvent event;
    auto* batch = event.mutable_messages();
    batch->set_delivery(proto::bridge::DELIVERY_APPEND);
    auto* wire = batch->add_messages();
    wire->set_id("M1");
    wire->set_remote_id("120363000000@g.us");
    wire->set_participant("5215551234567@s.whatsapp.net");
    wire->set_timestamp(1700000000);
    auto* media = wire->mutable_content()->mutable_media();
    media->set_kind(proto::bridge::MEDIA_AUDIO);
    media->set_push_to_talk(true);
    media->set_duration_seconds(9);
    wire->mutable_content()->mutable_quoted()->set_text("antes");
    batch->add_messages()->set_id("PROTO");

    auto converted = FromBridgeEvent(event);
    ASSERT_TRUE(converted.has_value());
    const auto* messages = std::get_if<MessagesEvent>(&*converted);
    ASSERT_NE(messages, nullptr);
    EXPECT_EQ(messages->delivery, DeliveryClass::kAppend);
    ASSERT_EQ(messages->messages.size(), 2u);

    const auto& first = messages->messages[0];
    EXPECT_EQ(first.participant, "5215551234567@s.whatsapp.net");
    ASSERT_TRUE(first.content.has_value());
    ASSERT_TRUE(first.content->media.has_value());
    EXPECT_EQ(first.content->media->kind, MediaKind::kAudio);
    EXPECT_TRUE(first.content->media->push_to_talk);
    EXPECT_EQ(first.content->media->duration_seconds, 9);
    ASSERT_TRUE(first.content->quoted.has_value());
    EXPECT_EQ(first.content->quoted->text, "antes");

    // 未设置 content 的是协议消息
    EXPECT_FALSE(messages->messages[1].content.has_value());
}

TEST(BridgeConversionTest, ConvertsConnectionEvents) {
    proto::bridge::BridgeEvent closed;
    closed.mutable_closed()->set_status_code(401);
    closed.mutable_closed()->set_logged_out(true);
    auto converted = FromBridgeEvent(closed);
    ASSERT_TRUE(converted.has_value());
    const auto* close = std::get_if<ConnectionClosedEvent>(&*converted);
    ASSERT_NE(close, nullptr);
    EXPECT_EQ(close->status_code, 401);
    EXPECT_TRUE(close->logged_out);

    proto::bridge::BridgeEvent contacts;
    auto* contact = contacts.mutable_contacts_update()->add_contacts();
    contact->set_id("99887766@lid");
    contact->set_routable_id("5215551234567@s.whatsapp.net");
    converted = FromBridgeEvent(contacts);
    ASSERT_TRUE(converted.has_value());
    const auto* update = std::get_if<ContactsUpdateEvent>(&*converted);
    ASSERT_NE(update, nullptr);
    ASSERT_EQ(update->contacts.size(), 1u);
    EXPECT_EQ(update->contacts[0].routable_id, "5215551234567@s.whatsapp.net");

    EXPECT_FALSE(FromBridgeEvent(proto::bridge::BridgeEvent{}).has_value());
}

TEST(BridgeConversionTest, MapsGrpcStatus) {
    EXPECT_TRUE(FromGrpcStatus(grpc::Status::OK).IsOk());
    EXPECT_EQ(FromGrpcStatus({grpc::StatusCode::UNAVAILABLE, "down"}).Code(),
              relay::common::StatusCode::kUnavailable);
    EXPECT_EQ(FromGrpcStatus({grpc::StatusCode::DATA_LOSS, "x"}).Code(), relay::common::StatusCode::kInternal);
}

TEST_F(GrpcTransportTest, StreamsEventsAndRecordsSelfId) {
    proto::bridge::BridgeEvent pairing;
    pairing.mutable_pairing_code()->set_code("QR-1");
    service_.script = {pairing, OpenedEvent("5215550001111@s.whatsapp.net")};
    StartBridge();

    EventCollector collector;
    transport_ = factory_->Create("agent-1");
    ASSERT_TRUE(transport_->Connect(std::string("stored-creds"), collector.Sink()).IsOk());
    ASSERT_TRUE(WaitUntil([&] { return collector.Size() == 2; }));

    auto events = collector.Events();
    EXPECT_TRUE(std::holds_alternative<PairingCodeEvent>(events[0]));
    EXPECT_TRUE(std::holds_alternative<ConnectionOpenedEvent>(events[1]));
    EXPECT_EQ(transport_->SelfId(), "5215550001111@s.whatsapp.net");

    {
        std::lock_guard<std::mutex> lock(service_.mutex);
        ASSERT_EQ(service_.connect_requests.size(), 1u);
        EXPECT_TRUE(service_.connect_requests[0].has_credentials());
        EXPECT_EQ(service_.connect_requests[0].credentials(), "stored-creds");
        EXPECT_EQ(service_.stream_account, "agent-1");
    }

    transport_->Close();
    EXPECT_EQ(service_.ends.load(), 1);
    // 重复关闭无副作用
    transport_->Close();
    EXPECT_EQ(service_.ends.load(), 1);
}

// 事件流意外结束时投递可恢复的断开事件
TEST_F(GrpcTransportTest, UnexpectedStreamEndBecomesClose) {
    service_.script = {OpenedEvent("5215550001111@s.whatsapp.net")};
    service_.end_stream_after_script = true;
    StartBridge();

    EventCollector collector;
    transport_ = factory_->Create("agent-1");
    ASSERT_TRUE(transport_->Connect(std::nullopt, collector.Sink()).IsOk());
    ASSERT_TRUE(WaitUntil([&] { return collector.Size() == 2; }));

    auto events = collector.Events();
    const auto* close = std::get_if<ConnectionClosedEvent>(&events[1]);
    ASSERT_NE(close, nullptr);
    EXPECT_FALSE(close->logged_out);
    std::lock_guard<std::mutex> lock(service_.mutex);
    EXPECT_FALSE(service_.connect_requests[0].has_credentials());
}

TEST_F(GrpcTransportTest, UnaryCallsReachBridge) {
    StartBridge();
    EventCollector collector;
    transport_ = factory_->Create("agent-1");
    ASSERT_TRUE(transport_->Connect(std::nullopt, collector.Sink()).IsOk());

    auto sent = transport_->SendText("5215551234567@s.whatsapp.net", "hola");
    ASSERT_TRUE(sent.IsOk()) << sent.GetStatus().Message();
    EXPECT_EQ(sent.Value(), "WIRE-1");
    EXPECT_EQ(transport_->SendText("", "hola").GetStatus().Code(), relay::common::StatusCode::kInvalidArgument);

    auto chats = transport_->ListConversations();
    ASSERT_TRUE(chats.IsOk());
    ASSERT_EQ(chats.Value().size(), 1u);
    EXPECT_TRUE(chats.Value()[0].is_group);
    EXPECT_EQ(chats.Value()[0].unread, 4);

    auto history = transport_->ListMessages("120363000000@g.us", 3);
    ASSERT_TRUE(history.IsOk());
    EXPECT_EQ(history.Value().size(), 3u);

    InboundMessage media;
    media.id = "IMG1";
    media.content = MessageContent{"", MediaAttachment{}, std::nullopt};
    auto bytes = transport_->DownloadMedia(media);
    ASSERT_TRUE(bytes.IsOk());
    EXPECT_EQ(bytes.Value(), "media:IMG1");

    InboundMessage empty;
    empty.id = "P1";
    EXPECT_EQ(transport_->DownloadMedia(empty).GetStatus().Code(), relay::common::StatusCode::kNotFound);

    EXPECT_TRUE(transport_->Logout().IsOk());
    EXPECT_EQ(service_.logouts.load(), 1);
    transport_->Close();
}
