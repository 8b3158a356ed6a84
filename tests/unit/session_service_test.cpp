#include "config_path.hpp"
#include "core/auth/auth_store.hpp"
#include "core/session/errors.hpp"
#include "server/health_service.hpp"
#include "server/session_service_impl.hpp"
#include "thread_pool/thread_pool.hpp"
#include "fake_transport.hpp"

#include "health.grpc.pb.h"
#include "session_service.grpc.pb.h"

#include <gtest/gtest.h>
#include <grpcpp/grpcpp.h>

#include <memory>
#include <string>

using namespace relay;
using testutils::FakeTransport;
using testutils::FakeTransportFactory;

namespace {

constexpr const char kSecret[] = "control-secret";
constexpr const char kSelf[] = "5215550001111:3@s.whatsapp.net";

common::SessionsConfig TestSessionsConfig() {
    common::SessionsConfig config;
    config.max_concurrent_sessions = 2;
    config.pairing_timeout_seconds = 60;
    config.init_timeout_seconds = 2;
    config.reconnect_base_delay_ms = 10;
    config.reconnect_max_delay_ms = 20;
    config.event_queue_capacity = 32;
    return config;
}

class SessionServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        factory_ = std::make_shared<FakeTransportFactory>();
        manager_ = std::make_shared<core::SessionManager>(TestSessionsConfig(),
                                                          std::make_shared<core::InMemoryAuthStore>(),
                                                          factory_, nullptr, nullptr);
        health_pool_ = std::make_unique<thread_pool::ThreadPool>(1, 16);
        health_pool_->Start();
        StartServer(kSecret);
    }

    void TearDown() override {
        if (server_) {
            server_->Shutdown();
        }
        manager_->Shutdown();
        health_pool_->Stop();
    }

    void StartServer(const std::string& secret) {
        session_service_ = std::make_unique<server::SessionServiceImpl>(
            manager_, secret, common::GetThreadPoolConfigPath());
        health_service_ = std::make_unique<server::HealthServiceImpl>(*health_pool_, manager_);

        grpc::ServerBuilder builder;
        builder.RegisterService(session_service_.get());
        builder.RegisterService(health_service_.get());
        builder.AddListeningPort("127.0.0.1:0", grpc::InsecureServerCredentials(), &selected_port_);
        server_ = builder.BuildAndStart();
        ASSERT_TRUE(server_);

        auto channel = grpc::CreateChannel("127.0.0.1:" + std::to_string(selected_port_),
                                           grpc::InsecureChannelCredentials());
        stub_ = proto::session::SessionService::NewStub(channel);
        health_stub_ = proto::health::HealthService::NewStub(channel);
    }

    // 带鉴权头的客户端上下文
    static void Authorize(grpc::ClientContext& context, const std::string& secret = kSecret) {
        context.AddMetadata("authorization", "Bearer " + secret);
    }

    grpc::Status CallInit(const std::string& agent, proto::session::InitResponse* response) {
        proto::session::InitRequest request;
        request.set_agent_id(agent);
        grpc::ClientContext context;
        Authorize(context);
        return stub_->Init(&context, request, response);
    }

    std::shared_ptr<FakeTransportFactory> factory_;
    std::shared_ptr<core::SessionManager> manager_;
    std::unique_ptr<thread_pool::ThreadPool> health_pool_;
    std::unique_ptr<server::SessionServiceImpl> session_service_;
    std::unique_ptr<server::HealthServiceImpl> health_service_;
    std::unique_ptr<grpc::Server> server_;
    std::unique_ptr<proto::session::SessionService::Stub> stub_;
    std::unique_ptr<proto::health::HealthService::Stub> health_stub_;
    int selected_port_ = 0;
};

} // namespace

TEST(CheckAuthorizationTest, ValidatesBearerHeader) {
    std::multimap<grpc::string_ref, grpc::string_ref> metadata;
    EXPECT_EQ(server::CheckAuthorization(metadata, kSecret).Code(), common::StatusCode::kUnauthenticated);

    metadata.emplace("authorization", "Basic abc");
    EXPECT_FALSE(server::CheckAuthorization(metadata, kSecret).IsOk());

    metadata.clear();
    metadata.emplace("authorization", "Bearer control-secret");
    EXPECT_TRUE(server::CheckAuthorization(metadata, kSecret).IsOk());
    // 未配置 secret 时拒绝所有请求
    EXPECT_FALSE(server::CheckAuthorization(metadata, "").IsOk());
}

TEST(ToGrpcStatusTest, MapsCodes) {
    EXPECT_TRUE(server::ToGrpcStatus(common::Status::OK()).ok());
    EXPECT_EQ(server::ToGrpcStatus(common::Status::ResourceExhausted("full")).error_code(),
              grpc::StatusCode::RESOURCE_EXHAUSTED);
    EXPECT_EQ(server::ToGrpcStatus(common::Status::NotFound("x")).error_code(), grpc::StatusCode::NOT_FOUND);
    EXPECT_EQ(server::ToGrpcStatus(common::Status::FailedPrecondition("x")).error_code(),
              grpc::StatusCode::FAILED_PRECONDITION);
    EXPECT_EQ(server::ToGrpcStatus(common::Status::DeadlineExceeded("x")).error_message(), "x");
}

TEST_F(SessionServiceTest, RejectsMissingOrWrongSecret) {
    proto::session::GetStatusRequest request;
    request.set_agent_id("agent-1");

    grpc::ClientContext anonymous;
    proto::session::GetStatusResponse response;
    auto status = stub_->GetStatus(&anonymous, request, &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAUTHENTICATED);

    grpc::ClientContext wrong;
    Authorize(wrong, "nope");
    status = stub_->GetStatus(&wrong, request, &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAUTHENTICATED);
    EXPECT_EQ(factory_->Count(), 0u);
}

TEST_F(SessionServiceTest, RequiresFields) {
    proto::session::InitResponse init;
    auto status = CallInit("", &init);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);

    proto::session::SendRequest send;
    send.set_agent_id("agent-1");
    send.set_to("5215551234567");
    grpc::ClientContext context;
    Authorize(context);
    proto::session::SendResponse send_response;
    status = stub_->Send(&context, send, &send_response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);

    proto::session::ListMessagesRequest list;
    list.set_agent_id("agent-1");
    grpc::ClientContext list_context;
    Authorize(list_context);
    proto::session::ListMessagesResponse list_response;
    status = stub_->ListMessages(&list_context, list, &list_response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::INVALID_ARGUMENT);
}

TEST_F(SessionServiceTest, InitReturnsPairingCode) {
    factory_->SetScript([](FakeTransport& t) { t.EmitPairing("QR-DATA"); });

    proto::session::InitResponse response;
    auto status = CallInit("agent-1", &response);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_EQ(response.error().code(), 0);
    EXPECT_FALSE(response.connected());
    EXPECT_EQ(response.qr_code(), "QR-DATA");
    EXPECT_EQ(response.pairing_timeout_seconds(), 60);
    EXPECT_GT(response.qr_expires_at(), 0);

    proto::session::GetStatusRequest request;
    request.set_agent_id("agent-1");
    grpc::ClientContext context;
    Authorize(context);
    proto::session::GetStatusResponse state;
    ASSERT_TRUE(stub_->GetStatus(&context, request, &state).ok());
    EXPECT_EQ(state.state(), "pairing_pending");
    EXPECT_EQ(state.qr_code(), "QR-DATA");
    EXPECT_EQ(state.qr_expires_at(), response.qr_expires_at());
}

TEST_F(SessionServiceTest, ConnectedSessionSendsAndLists) {
    factory_->SetScript([](FakeTransport& t) {
        t.conversations = {relay::transport::Conversation{"5215551234567@s.whatsapp.net", "Ana", false, 1700000000, 2}};
        t.EmitOpened(kSelf);
    });

    proto::session::InitResponse init;
    ASSERT_TRUE(CallInit("agent-1", &init).ok());
    EXPECT_TRUE(init.connected());
    EXPECT_EQ(init.phone_number(), "5215550001111");

    proto::session::SendRequest send;
    send.set_agent_id("agent-1");
    send.set_to("+52 155 5123 4567");
    send.set_content("hola");
    grpc::ClientContext send_context;
    Authorize(send_context);
    proto::session::SendResponse send_response;
    auto status = stub_->Send(&send_context, send, &send_response);
    ASSERT_TRUE(status.ok()) << status.error_message();
    EXPECT_FALSE(send_response.message_id().empty());

    auto sent = factory_->Latest()->Sent();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].first, "5215551234567@s.whatsapp.net");
    EXPECT_EQ(sent[0].second, "hola");

    proto::session::ListChatsRequest chats;
    chats.set_agent_id("agent-1");
    grpc::ClientContext chats_context;
    Authorize(chats_context);
    proto::session::ListChatsResponse chats_response;
    ASSERT_TRUE(stub_->ListChats(&chats_context, chats, &chats_response).ok());
    ASSERT_EQ(chats_response.chats_size(), 1);
    EXPECT_EQ(chats_response.chats(0).id(), "5215551234567@s.whatsapp.net");
    EXPECT_EQ(chats_response.chats(0).unread(), 2);
}

TEST_F(SessionServiceTest, SendToUnknownAccountFails) {
    proto::session::SendRequest send;
    send.set_agent_id("ghost");
    send.set_to("5215551234567");
    send.set_content("hola");
    grpc::ClientContext context;
    Authorize(context);
    proto::session::SendResponse response;
    auto status = stub_->Send(&context, send, &response);
    EXPECT_EQ(status.error_code(), grpc::StatusCode::NOT_FOUND);
    EXPECT_EQ(response.error().code(), static_cast<int>(core::SessionErrorCode::kNotFound));
}

// 未知账号断开同样返回成功
TEST_F(SessionServiceTest, DisconnectAlwaysSucceeds) {
    proto::session::DisconnectRequest request;
    request.set_agent_id("ghost");
    grpc::ClientContext context;
    Authorize(context);
    proto::session::DisconnectResponse response;
    ASSERT_TRUE(stub_->Disconnect(&context, request, &response).ok());
    EXPECT_TRUE(response.success());
}

TEST_F(SessionServiceTest, DisconnectRemovesSession) {
    factory_->SetScript([](FakeTransport& t) { t.EmitOpened(kSelf); });
    proto::session::InitResponse init;
    ASSERT_TRUE(CallInit("agent-1", &init).ok());

    proto::session::DisconnectRequest request;
    request.set_agent_id("agent-1");
    grpc::ClientContext context;
    Authorize(context);
    proto::session::DisconnectResponse response;
    ASSERT_TRUE(stub_->Disconnect(&context, request, &response).ok());
    EXPECT_TRUE(response.success());
    EXPECT_FALSE(manager_->Status("agent-1").state.has_value());
    EXPECT_EQ(factory_->Latest()->Logouts(), 1);
}

TEST_F(SessionServiceTest, HealthReportsSessionCounts) {
    factory_->SetScript([](FakeTransport& t) { t.EmitPairing("QR"); });
    proto::session::InitResponse init;
    ASSERT_TRUE(CallInit("agent-1", &init).ok());

    proto::health::HealthCheckRequest request;
    request.set_source("test");
    grpc::ClientContext context;
    proto::health::HealthCheckResponse response;
    ASSERT_TRUE(health_stub_->Check(&context, request, &response).ok());
    EXPECT_EQ(response.status(), "SERVING");
    EXPECT_EQ(response.active_sessions(), 1);
    EXPECT_EQ(response.pending_pairings(), 1);
    EXPECT_EQ(response.open_sessions(), 0);
    EXPECT_EQ(response.max_sessions(), 2);
}
