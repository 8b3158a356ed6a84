#pragma once

#include <string>
#include <utility>

namespace relay {
namespace common {

// 取值与 grpc::StatusCode 一致, 服务层直接转换
enum class StatusCode {
    kOk = 0,
    kInvalidArgument = 3,
    kDeadlineExceeded = 4,
    kNotFound = 5,
    kResourceExhausted = 8,
    kFailedPrecondition = 9,
    kInternal = 13,
    kUnavailable = 14,
    kUnauthenticated = 16,
};

class Status {
public:
    Status() = default;
    Status(StatusCode code, std::string message) : code_(code), message_(std::move(message)) {}

    static Status OK() { return Status(); }

    static Status InvalidArgument(std::string msg) { return {StatusCode::kInvalidArgument, std::move(msg)}; }
    static Status DeadlineExceeded(std::string msg) { return {StatusCode::kDeadlineExceeded, std::move(msg)}; }
    static Status NotFound(std::string msg) { return {StatusCode::kNotFound, std::move(msg)}; }
    static Status ResourceExhausted(std::string msg) { return {StatusCode::kResourceExhausted, std::move(msg)}; }
    static Status FailedPrecondition(std::string msg) { return {StatusCode::kFailedPrecondition, std::move(msg)}; }
    static Status Internal(std::string msg) { return {StatusCode::kInternal, std::move(msg)}; }
    static Status Unavailable(std::string msg) { return {StatusCode::kUnavailable, std::move(msg)}; }
    static Status Unauthenticated(std::string msg) { return {StatusCode::kUnauthenticated, std::move(msg)}; }

    bool IsOk() const { return code_ == StatusCode::kOk; }
    StatusCode Code() const { return code_; }
    const std::string& Message() const { return message_; }

private:
    StatusCode code_ = StatusCode::kOk;
    std::string message_;
};

}
}
