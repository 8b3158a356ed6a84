#include "core/session/session.hpp"

namespace relay {
namespace core {

Session::Session(std::string account_id, std::uint64_t generation, std::size_t queue_capacity)
    : account_id_(std::move(account_id)),
      generation_(generation),
      created_at_(std::chrono::system_clock::now()),
      channel_(std::make_shared<EventChannel>(queue_capacity)),
      contacts_(std::make_shared<events::ContactDirectory>()) {}

ConnectionState Session::State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

bool Session::CompareAndSetState(ConnectionState expected, ConnectionState desired) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (torn_down_ || state_ != expected) {
        return false;
    }
    state_ = desired;
    if (desired != ConnectionState::kPairingPending) {
        artifact_.reset();
    }
    return true;
}

std::string Session::Identity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return identity_;
}

void Session::SetIdentity(std::string identity) {
    std::lock_guard<std::mutex> lock(mutex_);
    identity_ = std::move(identity);
}

bool Session::SetPairingArtifact(PairingArtifact artifact, Clock::time_point deadline) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (torn_down_ || state_ != ConnectionState::kPairingPending) {
        return false;
    }
    // 新的配对码替换旧计时
    pairing_deadline_ = deadline;
    artifact_ = std::move(artifact);
    return true;
}

std::optional<PairingArtifact> Session::Artifact() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return artifact_;
}

std::optional<Session::Clock::time_point> Session::PairingDeadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pairing_deadline_;
}

void Session::ClearPairing() {
    std::lock_guard<std::mutex> lock(mutex_);
    artifact_.reset();
    pairing_deadline_.reset();
}

int Session::ReconnectAttempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reconnect_attempts_;
}

int Session::IncrementReconnectAttempts() {
    std::lock_guard<std::mutex> lock(mutex_);
    return ++reconnect_attempts_;
}

void Session::ResetReconnectAttempts() {
    std::lock_guard<std::mutex> lock(mutex_);
    reconnect_attempts_ = 0;
}

std::optional<std::uint64_t> Session::InstallTransport(std::shared_ptr<transport::Transport> next,
                                                      std::shared_ptr<transport::Transport>& previous) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (torn_down_) {
        return std::nullopt;
    }
    previous = std::move(transport_);
    transport_ = std::move(next);
    return ++transport_epoch_;
}

std::shared_ptr<transport::Transport> Session::CurrentTransport() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transport_;
}

std::uint64_t Session::TransportEpoch() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transport_epoch_;
}

std::future<InitOutcome> Session::TakeInitFuture() {
    return init_promise_.get_future();
}

bool Session::ResolveInit(InitOutcome outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (init_resolved_) {
        return false;
    }
    init_resolved_ = true;
    init_promise_.set_value(std::move(outcome));
    return true;
}

bool Session::InitResolved() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return init_resolved_;
}

bool Session::BeginTeardown(std::shared_ptr<transport::Transport>& transport) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (torn_down_) {
            return false;
        }
        torn_down_ = true;
        state_ = ConnectionState::kClosing;
        artifact_.reset();
        pairing_deadline_.reset();
        transport = std::move(transport_);
        ++transport_epoch_;  // 之后到达的事件全部过期
    }
    stop_cv_.notify_all();
    // 先关闭事件通道, 阻塞在投递上的传输线程随之返回
    channel_->Close();
    return true;
}

bool Session::TornDown() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return torn_down_;
}

void Session::MarkClosed() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = ConnectionState::kClosed;
}

bool Session::WaitForStop(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    return stop_cv_.wait_for(lock, delay, [this] { return torn_down_; });
}

bool Session::StopRequested() const {
    return TornDown();
}

}
}
