#include "server/session_service_impl.hpp"

#include "common/logger.hpp"
#include "core/session/errors.hpp"
#include "events/identity.hpp"

#include <chrono>
#include <exception>

namespace relay {
namespace server {

namespace {

constexpr const char kBearerPrefix[] = "Bearer ";

// 创建请求处理线程池
std::unique_ptr<thread_pool::ThreadPool> CreateSessionThreadPool(const std::string& path) {
    auto config_loader = thread_pool::ThreadPoolConfigLoader::FromFile(path);
    if (config_loader.has_value()) {
        return std::make_unique<thread_pool::ThreadPool>(config_loader->GetConfig());
    }
    RELAY_LOG_WARN("[SessionService] Thread pool config {} unavailable, using defaults", path);
    return std::make_unique<thread_pool::ThreadPool>(4, 1024);
}

std::int64_t ToUnixSeconds(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

// 线程池拒绝任务时 future 抛出异常
template <typename Future>
auto AwaitOrStatus(Future& future) -> decltype(future.get()) {
    try {
        return future.get();
    } catch (const std::exception& ex) {
        RELAY_LOG_ERROR("[SessionService] Request task failed: {}", ex.what());
        return common::Status::Unavailable("Server busy");
    }
}

}

common::Status CheckAuthorization(const std::multimap<grpc::string_ref, grpc::string_ref>& metadata,
                                  const std::string& secret) {
    auto it = metadata.find("authorization");
    if (it == metadata.end()) {
        return common::Status::Unauthenticated("Missing authorization header");
    }
    const std::string value(it->second.data(), it->second.size());
    const std::string prefix(kBearerPrefix);
    if (value.compare(0, prefix.size(), prefix) != 0) {
        return common::Status::Unauthenticated("Malformed authorization header");
    }
    if (secret.empty() || value.substr(prefix.size()) != secret) {
        return common::Status::Unauthenticated("Unauthorized");
    }
    return common::Status::OK();
}

grpc::Status ToGrpcStatus(const common::Status& status) {
    if (status.IsOk()) {
        return grpc::Status::OK;
    }
    return {static_cast<grpc::StatusCode>(status.Code()), status.Message()};
}

SessionServiceImpl::SessionServiceImpl(std::shared_ptr<core::SessionManager> manager,
                                       std::string auth_secret,
                                       const std::string& thread_pool_config_path)
    : manager_(std::move(manager))
    , auth_secret_(std::move(auth_secret))
    , thread_pool_(CreateSessionThreadPool(thread_pool_config_path)) {
    if (auth_secret_.empty()) {
        RELAY_LOG_WARN("[SessionService] auth.secret is empty; every request will be rejected");
    }
    thread_pool_->Start();
}

SessionServiceImpl::~SessionServiceImpl() {
    thread_pool_->Stop();
}

bool SessionServiceImpl::Authorize(const grpc::ServerContext* context,
                                   ::proto::common::Error* error,
                                   grpc::Status* out) {
    auto status = CheckAuthorization(context->client_metadata(), auth_secret_);
    if (status.IsOk()) {
        return true;
    }
    core::ErrorToProto(status, error);
    *out = ToGrpcStatus(status);
    return false;
}

grpc::Status SessionServiceImpl::Init(grpc::ServerContext* context
                                     , const proto::session::InitRequest* request
                                     , proto::session::InitResponse* response) {
    grpc::Status denied;
    if (!Authorize(context, response->mutable_error(), &denied)) {
        return denied;
    }
    if (request->agent_id().empty()) {
        auto status = common::Status::InvalidArgument("agent_id is required");
        core::ErrorToProto(status, response->mutable_error());
        return ToGrpcStatus(status);
    }
    RELAY_LOG_INFO("[SessionService] Init agent={}", request->agent_id());

    // Init 可能阻塞到首个配对码, 直接在请求线程上执行
    auto result = manager_->Init(request->agent_id());
    if (!result.IsOk()) {
        core::ErrorToProto(result.GetStatus(), response->mutable_error());
        return ToGrpcStatus(result.GetStatus());
    }

    const auto& init = result.Value();
    response->set_connected(init.connected);
    if (init.connected) {
        response->set_phone_number(events::JidToPhone(init.identity));
    }
    if (init.artifact) {
        response->set_qr_code(init.artifact->rendered_code);
        response->set_qr_expires_at(ToUnixSeconds(init.artifact->expiry_deadline));
        response->set_pairing_timeout_seconds(init.pairing_timeout_seconds);
    }
    core::ErrorToProto(common::Status::OK(), response->mutable_error());
    return grpc::Status::OK;
}

grpc::Status SessionServiceImpl::GetStatus(grpc::ServerContext* context
                                          , const proto::session::GetStatusRequest* request
                                          , proto::session::GetStatusResponse* response) {
    grpc::Status denied;
    if (!Authorize(context, response->mutable_error(), &denied)) {
        return denied;
    }
    if (request->agent_id().empty()) {
        auto status = common::Status::InvalidArgument("agent_id is required");
        core::ErrorToProto(status, response->mutable_error());
        return ToGrpcStatus(status);
    }

    auto status = manager_->Status(request->agent_id());
    response->set_connected(status.connected);
    response->set_state(status.state ? core::ConnectionStateName(*status.state) : "none");
    if (status.connected) {
        response->set_phone_number(events::JidToPhone(status.identity));
    }
    if (status.artifact) {
        response->set_qr_code(status.artifact->rendered_code);
        response->set_qr_expires_at(ToUnixSeconds(status.artifact->expiry_deadline));
    }
    core::ErrorToProto(common::Status::OK(), response->mutable_error());
    return grpc::Status::OK;
}

grpc::Status SessionServiceImpl::Send(grpc::ServerContext* context
                                     , const proto::session::SendRequest* request
                                     , proto::session::SendResponse* response) {
    grpc::Status denied;
    if (!Authorize(context, response->mutable_error(), &denied)) {
        return denied;
    }
    if (request->agent_id().empty() || request->to().empty() || request->content().empty()) {
        auto status = common::Status::InvalidArgument("agent_id, to and content are required");
        core::ErrorToProto(status, response->mutable_error());
        return ToGrpcStatus(status);
    }
    RELAY_LOG_INFO("[SessionService] Send agent={} to={}", request->agent_id(), request->to());

    auto future = thread_pool_->Submit([this, agent = request->agent_id(), to = request->to(),
                                        content = request->content()]() {
        return manager_->Send(agent, to, content);
    });
    common::StatusOr<std::string> result = AwaitOrStatus(future);
    if (!result.IsOk()) {
        core::ErrorToProto(result.GetStatus(), response->mutable_error());
        return ToGrpcStatus(result.GetStatus());
    }
    response->set_message_id(result.Value());
    core::ErrorToProto(common::Status::OK(), response->mutable_error());
    return grpc::Status::OK;
}

grpc::Status SessionServiceImpl::ListChats(grpc::ServerContext* context
                                          , const proto::session::ListChatsRequest* request
                                          , proto::session::ListChatsResponse* response) {
    grpc::Status denied;
    if (!Authorize(context, response->mutable_error(), &denied)) {
        return denied;
    }
    if (request->agent_id().empty()) {
        auto status = common::Status::InvalidArgument("agent_id is required");
        core::ErrorToProto(status, response->mutable_error());
        return ToGrpcStatus(status);
    }

    auto future = thread_pool_->Submit([this, agent = request->agent_id()]() {
        return manager_->ListConversations(agent);
    });
    common::StatusOr<std::vector<core::ConversationSummary>> result = AwaitOrStatus(future);
    if (!result.IsOk()) {
        core::ErrorToProto(result.GetStatus(), response->mutable_error());
        return ToGrpcStatus(result.GetStatus());
    }
    for (const auto& summary : result.Value()) {
        auto* chat = response->add_chats();
        chat->set_id(summary.id);
        chat->set_name(summary.name);
        chat->set_is_group(summary.is_group);
        chat->set_last_activity(summary.last_activity);
        chat->set_unread(summary.unread);
    }
    core::ErrorToProto(common::Status::OK(), response->mutable_error());
    return grpc::Status::OK;
}

grpc::Status SessionServiceImpl::ListMessages(grpc::ServerContext* context
                                             , const proto::session::ListMessagesRequest* request
                                             , proto::session::ListMessagesResponse* response) {
    grpc::Status denied;
    if (!Authorize(context, response->mutable_error(), &denied)) {
        return denied;
    }
    if (request->agent_id().empty() || request->chat_id().empty()) {
        auto status = common::Status::InvalidArgument("agent_id and chat_id are required");
        core::ErrorToProto(status, response->mutable_error());
        return ToGrpcStatus(status);
    }

    auto future = thread_pool_->Submit([this, agent = request->agent_id(), chat = request->chat_id(),
                                        limit = request->limit()]() {
        return manager_->ListMessages(agent, chat, limit);
    });
    common::StatusOr<std::vector<core::MessageSummary>> result = AwaitOrStatus(future);
    if (!result.IsOk()) {
        core::ErrorToProto(result.GetStatus(), response->mutable_error());
        return ToGrpcStatus(result.GetStatus());
    }
    for (const auto& summary : result.Value()) {
        auto* message = response->add_messages();
        message->set_id(summary.id);
        message->set_body(summary.body);
        message->set_timestamp(summary.timestamp);
        message->set_from_me(summary.from_me);
        message->set_has_media(summary.has_media);
        message->set_from(summary.from);
        message->set_to(summary.to);
    }
    core::ErrorToProto(common::Status::OK(), response->mutable_error());
    return grpc::Status::OK;
}

grpc::Status SessionServiceImpl::Disconnect(grpc::ServerContext* context
                                           , const proto::session::DisconnectRequest* request
                                           , proto::session::DisconnectResponse* response) {
    grpc::Status denied;
    if (!Authorize(context, response->mutable_error(), &denied)) {
        return denied;
    }
    if (request->agent_id().empty()) {
        auto status = common::Status::InvalidArgument("agent_id is required");
        core::ErrorToProto(status, response->mutable_error());
        return ToGrpcStatus(status);
    }
    RELAY_LOG_INFO("[SessionService] Disconnect agent={}", request->agent_id());

    auto future = thread_pool_->Submit([this, agent = request->agent_id()]() {
        return manager_->Disconnect(agent);
    });
    common::Status status = AwaitOrStatus(future);
    // 断开总是成功, 失败只记录日志
    if (!status.IsOk()) {
        RELAY_LOG_WARN("[SessionService] Disconnect {} reported: {}", request->agent_id(), status.Message());
    }
    response->set_success(true);
    core::ErrorToProto(common::Status::OK(), response->mutable_error());
    return grpc::Status::OK;
}

}
}
