#include "server/health_service.hpp"

#include "common/logger.hpp"
#include "core/session/session_manager.hpp"
#include "thread_pool/thread_pool.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <string>
#include <utility>

namespace relay {
namespace server {

HealthServiceImpl::HealthServiceImpl(thread_pool::ThreadPool& pool, std::shared_ptr<core::SessionManager> manager)
    : pool_(pool), manager_(std::move(manager)) {}

grpc::Status HealthServiceImpl::Check(grpc::ServerContext* /*context*/,
                                        const proto::health::HealthCheckRequest* request,
                                        proto::health::HealthCheckResponse* response) {
    using Result = std::int64_t;

    auto timestamp_future = pool_.Submit(
        []() -> Result {
            const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch());
            return now.count();
        });

    std::int64_t timestamp = 0;
    try {
        timestamp = timestamp_future.get();
    } catch (const std::exception& ex) {
        RELAY_LOG_ERROR("[health] async timestamp task failed: {}", ex.what());
        return {grpc::StatusCode::INTERNAL, "timestamp task failed"};
    }

    response->set_status("SERVING");
    response->set_timestamp(timestamp);
    if (manager_) {
        const auto& config = manager_->Config();
        response->set_active_sessions(static_cast<std::int32_t>(manager_->ActiveSessions()));
        response->set_open_sessions(static_cast<std::int32_t>(manager_->OpenSessions()));
        response->set_pending_pairings(static_cast<std::int32_t>(manager_->PendingPairings()));
        response->set_max_sessions(config.max_concurrent_sessions);
        response->set_pairing_timeout_seconds(config.pairing_timeout_seconds);
    }

    pool_.Post([source = std::string(request->source())] {
        RELAY_LOG_DEBUG("[health] Check handled for '{}'", source);
    });

    return grpc::Status::OK;
}

}
}
