#pragma once

#include "common.pb.h"
#include "common/status.hpp"

#include <string>

namespace relay {
namespace core {

enum class SessionErrorCode {
    kOk = 0,
    kCapacity = 1,
    kNotFound = 2,
    kNotConnected = 3,
    kTransport = 4,
    kTimeout = 5,
    kInvalidRequest = 6,
    kUnauthorized = 7,
};

// 将 SessionErrorCode 转换为通用 Status
inline common::Status FromSessionError(SessionErrorCode error, std::string message = "") {
    using common::Status;
    switch (error) {
        case SessionErrorCode::kOk:
            return Status::OK();
        case SessionErrorCode::kCapacity:
            return Status::ResourceExhausted(message.empty() ? "Session limit reached" : message);
        case SessionErrorCode::kNotFound:
            return Status::NotFound(message.empty() ? "Session not found" : message);
        case SessionErrorCode::kNotConnected:
            return Status::FailedPrecondition(message.empty() ? "Session not connected" : message);
        case SessionErrorCode::kTransport:
            return Status::Unavailable(message.empty() ? "Transport error" : message);
        case SessionErrorCode::kTimeout:
            return Status::DeadlineExceeded(message.empty() ? "Pairing expired" : message);
        case SessionErrorCode::kInvalidRequest:
            return Status::InvalidArgument(message.empty() ? "Invalid request" : message);
        case SessionErrorCode::kUnauthorized:
            return Status::Unauthenticated(message.empty() ? "Unauthorized" : message);
    }
    return Status::Internal("Unknown session error");
}

// 反向映射, 用于填充响应中的错误码
inline SessionErrorCode ToSessionError(const common::Status& status) {
    switch (status.Code()) {
        case common::StatusCode::kOk:
            return SessionErrorCode::kOk;
        case common::StatusCode::kResourceExhausted:
            return SessionErrorCode::kCapacity;
        case common::StatusCode::kNotFound:
            return SessionErrorCode::kNotFound;
        case common::StatusCode::kFailedPrecondition:
            return SessionErrorCode::kNotConnected;
        case common::StatusCode::kDeadlineExceeded:
            return SessionErrorCode::kTimeout;
        case common::StatusCode::kInvalidArgument:
            return SessionErrorCode::kInvalidRequest;
        case common::StatusCode::kUnauthenticated:
            return SessionErrorCode::kUnauthorized;
        default:
            return SessionErrorCode::kTransport;
    }
}

// 将错误信息填充到 protobuf Error 消息中
inline void ErrorToProto(const common::Status& status, ::proto::common::Error* error_proto) {
    if (!error_proto) {
        return;
    }
    error_proto->set_code(static_cast<int32_t>(ToSessionError(status)));
    error_proto->set_message(status.Message());
}

}
}
