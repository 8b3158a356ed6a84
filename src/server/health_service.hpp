#pragma once

#include "health.grpc.pb.h"
#include "health.pb.h"

#include <grpcpp/grpcpp.h>

#include <memory>

namespace thread_pool {
class ThreadPool;
}

namespace relay {
namespace core {
class SessionManager;
}

namespace server {

class HealthServiceImpl final : public proto::health::HealthService::Service {
public:
    HealthServiceImpl(thread_pool::ThreadPool& pool, std::shared_ptr<core::SessionManager> manager);

    grpc::Status Check(grpc::ServerContext* context,
                    const proto::health::HealthCheckRequest* request,
                    proto::health::HealthCheckResponse* response) override;
private:
    thread_pool::ThreadPool& pool_;
    std::shared_ptr<core::SessionManager> manager_;
};

}
}
