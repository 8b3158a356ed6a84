#pragma once

// 项目头文件
#include "core/session/session_manager.hpp"
#include "thread_pool/thread_pool.hpp"

// gRPC 生成的头文件
#include "session_service.grpc.pb.h"

// 第三方库
#include <grpcpp/grpcpp.h>

// C++ 标准库
#include <map>
#include <memory>
#include <string>

namespace relay {
namespace server {

// 校验 "authorization: Bearer <secret>", 配置的 secret 为空时拒绝所有请求
common::Status CheckAuthorization(const std::multimap<grpc::string_ref, grpc::string_ref>& metadata,
                                  const std::string& secret);

grpc::Status ToGrpcStatus(const common::Status& status);

class SessionServiceImpl final : public proto::session::SessionService::Service {
public:
    SessionServiceImpl(std::shared_ptr<core::SessionManager> manager,
                       std::string auth_secret,
                       const std::string& thread_pool_config_path);
    ~SessionServiceImpl() override;

    grpc::Status Init(grpc::ServerContext* context
                     , const proto::session::InitRequest* request
                     , proto::session::InitResponse* response) override;

    grpc::Status GetStatus(grpc::ServerContext* context
                          , const proto::session::GetStatusRequest* request
                          , proto::session::GetStatusResponse* response) override;

    grpc::Status Send(grpc::ServerContext* context
                     , const proto::session::SendRequest* request
                     , proto::session::SendResponse* response) override;

    grpc::Status ListChats(grpc::ServerContext* context
                          , const proto::session::ListChatsRequest* request
                          , proto::session::ListChatsResponse* response) override;

    grpc::Status ListMessages(grpc::ServerContext* context
                             , const proto::session::ListMessagesRequest* request
                             , proto::session::ListMessagesResponse* response) override;

    grpc::Status Disconnect(grpc::ServerContext* context
                           , const proto::session::DisconnectRequest* request
                           , proto::session::DisconnectResponse* response) override;

private:
    // 鉴权失败时同时填充响应中的 error
    bool Authorize(const grpc::ServerContext* context, ::proto::common::Error* error, grpc::Status* out);

private:
    std::shared_ptr<core::SessionManager> manager_;
    std::string auth_secret_;
    std::unique_ptr<thread_pool::ThreadPool> thread_pool_;
};

}
}
