#include "core/session/session_manager.hpp"

#include "common/logger.hpp"
#include "core/session/errors.hpp"
#include "events/identity.hpp"
#include "events/message_normalizer.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <system_error>
#include <thread>

namespace relay {
namespace core {

namespace {

constexpr int kDefaultMessageLimit = 100;

// 显式断开类的销毁会尝试登出
bool ShouldLogout(TeardownReason reason) {
    switch (reason) {
        case TeardownReason::kDisconnect:
        case TeardownReason::kReplace:
        case TeardownReason::kSweep:
        case TeardownReason::kPairingExpired:
            return true;
        default:
            return false;
    }
}

bool ShouldEraseCredentials(TeardownReason reason) {
    return ShouldLogout(reason) || reason == TeardownReason::kLoggedOut;
}

std::string CloseDescription(const transport::ConnectionClosedEvent& event) {
    return fmt::format("Connection closed: {} - {}", event.status_code,
                       event.message.empty() ? "Unknown" : event.message);
}

}

SessionManager::SessionManager(common::SessionsConfig config,
                               std::shared_ptr<AuthStore> auth_store,
                               std::shared_ptr<transport::TransportFactory> transport_factory,
                               std::shared_ptr<events::PairingRenderer> renderer,
                               std::shared_ptr<events::EventRelay> relay)
    : config_(std::move(config)),
      auth_store_(std::move(auth_store)),
      transport_factory_(std::move(transport_factory)),
      renderer_(std::move(renderer)),
      relay_(std::move(relay)) {
    if (!renderer_) {
        renderer_ = std::make_shared<events::TextPairingRenderer>();
    }
}

SessionManager::~SessionManager() {
    Shutdown();
}

common::StatusOr<InitResult> SessionManager::Init(const std::string& account_id) {
    if (!IsValidAccountId(account_id)) {
        return common::Status::InvalidArgument("agent_id is invalid");
    }

    SessionPtr session;
    std::future<InitOutcome> outcome;
    {
        std::shared_lock admission(admission_mutex_);
        if (shutting_down_.load()) {
            return common::Status::Unavailable("Session manager is shutting down");
        }
        auto guard = registry_.LockAccount(account_id);

        if (auto existing = registry_.Find(account_id)) {
            if (existing->State() == ConnectionState::kOpen) {
                RELAY_LOG_INFO("Account {} already connected", account_id);
                InitResult result;
                result.connected = true;
                result.identity = existing->Identity();
                return common::StatusOr<InitResult>(std::move(result));
            }
            RELAY_LOG_INFO("Replacing non-open session for {} (state={})",
                           account_id, ConnectionStateName(existing->State()));
            TeardownLocked(existing, TeardownReason::kReplace);
        }

        const auto open = registry_.CountInState(ConnectionState::kOpen, account_id);
        if (open >= static_cast<std::size_t>(config_.max_concurrent_sessions)) {
            RELAY_LOG_WARN("Session limit reached ({}/{}), rejecting {}",
                           open, config_.max_concurrent_sessions, account_id);
            return FromSessionError(SessionErrorCode::kCapacity,
                fmt::format("Session limit reached ({}/{})", open, config_.max_concurrent_sessions));
        }

        session = std::make_shared<Session>(account_id, ++next_generation_,
            static_cast<std::size_t>(std::max(1, config_.event_queue_capacity)));
        outcome = session->TakeInitFuture();
        if (!registry_.Install(session)) {
            return common::Status::Internal("Session for " + account_id + " already registered");
        }
        RELAY_LOG_INFO("Creating session for {} (generation {})", account_id, session->Generation());

        auto status = ConnectTransport(session);
        if (status.IsOk()) {
            status = StartDriver(session);
        }
        if (!status.IsOk()) {
            RELAY_LOG_ERROR("Failed to start session for {}: {}", account_id, status.Message());
            TeardownLocked(session, TeardownReason::kInitFailed);
            return FromSessionError(SessionErrorCode::kTransport, status.Message());
        }
    }

    if (outcome.wait_for(std::chrono::seconds(config_.init_timeout_seconds)) != std::future_status::ready) {
        RELAY_LOG_ERROR("Init for {} timed out after {}s", account_id, config_.init_timeout_seconds);
        Teardown(session, TeardownReason::kInitFailed);
        return FromSessionError(SessionErrorCode::kTransport, "Init timed out waiting for the transport");
    }
    return outcome.get();
}

SessionStatus SessionManager::Status(const std::string& account_id) const {
    SessionStatus status;
    auto session = registry_.Find(account_id);
    if (!session) {
        return status;
    }
    status.state = session->State();
    status.connected = *status.state == ConnectionState::kOpen;
    status.identity = session->Identity();
    status.artifact = session->Artifact();
    return status;
}

common::StatusOr<std::shared_ptr<transport::Transport>> SessionManager::RequireOpen(
    const std::string& account_id) const {
    auto session = registry_.Find(account_id);
    if (!session) {
        return FromSessionError(SessionErrorCode::kNotFound, "Client not found: " + account_id);
    }
    if (session->State() != ConnectionState::kOpen) {
        return FromSessionError(SessionErrorCode::kNotConnected, "Client not connected: " + account_id);
    }
    auto transport = session->CurrentTransport();
    if (!transport) {
        return FromSessionError(SessionErrorCode::kNotConnected, "Client not connected: " + account_id);
    }
    return common::StatusOr<std::shared_ptr<transport::Transport>>(std::move(transport));
}

common::StatusOr<std::string> SessionManager::Send(const std::string& account_id,
                                                   const std::string& destination,
                                                   const std::string& content) {
    if (destination.empty() || content.empty()) {
        return common::Status::InvalidArgument("to and content are required");
    }
    auto transport = RequireOpen(account_id);
    if (!transport.IsOk()) {
        return transport.GetStatus();
    }
    const auto formatted = events::FormatDestination(destination);
    auto result = transport.Value()->SendText(formatted, content);
    if (!result.IsOk()) {
        RELAY_LOG_ERROR("Send from {} to {} failed: {}", account_id, formatted, result.GetStatus().Message());
        return FromSessionError(SessionErrorCode::kTransport, result.GetStatus().Message());
    }
    RELAY_LOG_INFO("Message sent from {} to {}: {}", account_id, formatted, result.Value());
    return result;
}

common::StatusOr<std::vector<ConversationSummary>> SessionManager::ListConversations(
    const std::string& account_id) {
    auto transport = RequireOpen(account_id);
    if (!transport.IsOk()) {
        return transport.GetStatus();
    }
    auto conversations = transport.Value()->ListConversations();
    if (!conversations.IsOk()) {
        return FromSessionError(SessionErrorCode::kTransport, conversations.GetStatus().Message());
    }
    std::vector<ConversationSummary> result;
    result.reserve(conversations.Value().size());
    for (const auto& conversation : conversations.Value()) {
        ConversationSummary summary;
        summary.id = conversation.id;
        summary.name = conversation.name.empty() ? events::JidToPhone(conversation.id) : conversation.name;
        summary.is_group = events::IsGroupId(conversation.id);
        summary.last_activity = conversation.last_activity;
        summary.unread = conversation.unread;
        result.push_back(std::move(summary));
    }
    return common::StatusOr<std::vector<ConversationSummary>>(std::move(result));
}

common::StatusOr<std::vector<MessageSummary>> SessionManager::ListMessages(const std::string& account_id,
                                                                           const std::string& conversation_id,
                                                                           int limit) {
    if (conversation_id.empty()) {
        return common::Status::InvalidArgument("chat_id is required");
    }
    auto transport = RequireOpen(account_id);
    if (!transport.IsOk()) {
        return transport.GetStatus();
    }
    auto messages = transport.Value()->ListMessages(conversation_id, limit > 0 ? limit : kDefaultMessageLimit);
    if (!messages.IsOk()) {
        return FromSessionError(SessionErrorCode::kTransport, messages.GetStatus().Message());
    }
    std::vector<MessageSummary> result;
    result.reserve(messages.Value().size());
    for (const auto& message : messages.Value()) {
        MessageSummary summary;
        summary.id = message.id;
        summary.timestamp = message.timestamp;
        summary.from_me = message.from_me;
        summary.from = message.remote_id;
        summary.to = message.from_me ? message.remote_id : "";
        if (message.content) {
            summary.body = events::ExtractText(*message.content);
            summary.has_media = events::IsFileMedia(*message.content);
        }
        result.push_back(std::move(summary));
    }
    return common::StatusOr<std::vector<MessageSummary>>(std::move(result));
}

common::Status SessionManager::Disconnect(const std::string& account_id) {
    if (!IsValidAccountId(account_id)) {
        return common::Status::OK();
    }
    auto guard = registry_.LockAccount(account_id);
    if (auto session = registry_.Find(account_id)) {
        TeardownLocked(session, TeardownReason::kDisconnect);
        return common::Status::OK();
    }
    // 无会话时仍清理残留凭证
    auto status = auth_store_->Remove(account_id);
    if (!status.IsOk()) {
        RELAY_LOG_WARN("Failed to remove credentials for {}: {}", account_id, status.Message());
    }
    return common::Status::OK();
}

std::size_t SessionManager::SweepStranded() {
    const auto now = Session::Clock::now();
    const auto sessions = registry_.Snapshot();
    std::size_t reaped = 0;
    for (const auto& session : sessions) {
        const auto state = session->State();
        bool stranded = state == ConnectionState::kClosing || state == ConnectionState::kClosed;
        if (state == ConnectionState::kPairingPending) {
            auto deadline = session->PairingDeadline();
            stranded = deadline && *deadline <= now;
        }
        if (!stranded) {
            continue;
        }
        RELAY_LOG_INFO("Sweeping stranded session {} (state={})", session->AccountId(), ConnectionStateName(state));
        Teardown(session, TeardownReason::kSweep);
        ++reaped;
    }
    RELAY_LOG_INFO("Sweep finished: {} sessions checked, {} reaped, {} remaining",
                   sessions.size(), reaped, registry_.Size());
    return reaped;
}

void SessionManager::Shutdown() {
    {
        std::unique_lock admission(admission_mutex_);
        shutting_down_.store(true);
    }
    for (auto sessions = registry_.Snapshot(); !sessions.empty(); sessions = registry_.Snapshot()) {
        for (const auto& session : sessions) {
            Teardown(session, TeardownReason::kShutdown);
        }
    }
    std::unique_lock<std::mutex> lock(drivers_mutex_);
    drivers_cv_.wait(lock, [this] { return active_drivers_ == 0; });
}

std::size_t SessionManager::ActiveSessions() const {
    return registry_.Size();
}

std::size_t SessionManager::OpenSessions() const {
    return registry_.CountInState(ConnectionState::kOpen);
}

std::size_t SessionManager::PendingPairings() const {
    return registry_.CountInState(ConnectionState::kPairingPending);
}

common::Status SessionManager::ConnectTransport(const SessionPtr& session) {
    const auto& account_id = session->AccountId();
    std::optional<std::string> credentials;
    auto stored = auth_store_->Load(account_id);
    if (stored.IsOk()) {
        credentials = std::move(stored).Value();
    } else {
        RELAY_LOG_WARN("Failed to load credentials for {}: {}", account_id, stored.GetStatus().Message());
    }

    auto transport = transport_factory_->Create(account_id);
    if (!transport) {
        return common::Status::Unavailable("No transport available for " + account_id);
    }
    std::shared_ptr<transport::Transport> previous;
    auto epoch = session->InstallTransport(transport, previous);
    if (previous) {
        previous->Close();
    }
    if (!epoch) {
        return common::Status::Unavailable("Session for " + account_id + " was torn down");
    }

    auto channel = session->Channel();
    const auto current_epoch = *epoch;
    auto status = transport->Connect(credentials, [channel, current_epoch](transport::TransportEvent event) {
        // 通道关闭说明会话已销毁, 事件直接丢弃
        const bool queued = channel->WaitPush(SessionEvent{current_epoch, std::move(event)});
        if (!queued) {
            RELAY_LOG_DEBUG("Dropped transport event for a closed session");
        }
    });
    if (!status.IsOk()) {
        return common::Status::Unavailable(status.Message());
    }
    RELAY_LOG_INFO("Transport connecting for {} (epoch {}, stored credentials: {})",
                   account_id, current_epoch, credentials.has_value());
    return common::Status::OK();
}

common::Status SessionManager::StartDriver(SessionPtr session) {
    {
        std::lock_guard<std::mutex> lock(drivers_mutex_);
        ++active_drivers_;
    }
    try {
        std::thread([this, session]() mutable {
            RunDriver(session);
            session.reset();
            std::lock_guard<std::mutex> lock(drivers_mutex_);
            --active_drivers_;
            drivers_cv_.notify_all();
        }).detach();
    } catch (const std::system_error& e) {
        std::lock_guard<std::mutex> lock(drivers_mutex_);
        --active_drivers_;
        drivers_cv_.notify_all();
        return common::Status::Internal(std::string("Failed to start session driver: ") + e.what());
    }
    return common::Status::OK();
}

void SessionManager::RunDriver(SessionPtr session) {
    const auto channel = session->Channel();
    while (!session->StopRequested()) {
        SessionEvent item;
        if (auto deadline = session->PairingDeadline()) {
            const auto result = channel->WaitPopUntil(item, *deadline);
            if (result == thread_pool::PopResult::Closed) {
                break;
            }
            if (result == thread_pool::PopResult::Timeout) {
                if (session->State() != ConnectionState::kOpen && session->PairingDeadline()) {
                    RELAY_LOG_WARN("Pairing timeout expired for {}", session->AccountId());
                    session->ResolveInit(FromSessionError(SessionErrorCode::kTimeout));
                    Teardown(session, TeardownReason::kPairingExpired);
                    break;
                }
                continue;
            }
        } else {
            auto next = channel->WaitPop();
            if (!next) {
                break;
            }
            item = std::move(*next);
        }

        if (item.epoch != session->TransportEpoch()) {
            RELAY_LOG_DEBUG("Discarding event from superseded transport for {}", session->AccountId());
            continue;
        }
        if (!HandleEvent(session, item.event)) {
            break;
        }
    }
    RELAY_LOG_DEBUG("Driver for {} (generation {}) exited", session->AccountId(), session->Generation());
}

bool SessionManager::HandleEvent(const SessionPtr& session, transport::TransportEvent& event) {
    if (auto* pairing = std::get_if<transport::PairingCodeEvent>(&event)) {
        return OnPairingCode(session, *pairing);
    }
    if (auto* opened = std::get_if<transport::ConnectionOpenedEvent>(&event)) {
        return OnOpened(session, *opened);
    }
    if (auto* closed = std::get_if<transport::ConnectionClosedEvent>(&event)) {
        return OnClosed(session, *closed);
    }
    if (auto* messages = std::get_if<transport::MessagesEvent>(&event)) {
        if (relay_) {
            events::RelayContext context;
            context.account_id = session->AccountId();
            context.self_id = session->Identity();
            context.contacts = session->Contacts();
            context.transport = session->CurrentTransport();
            relay_->RelayMessages(context, *messages);
        }
        return true;
    }
    if (auto* creds = std::get_if<transport::CredentialsChangedEvent>(&event)) {
        auto status = auth_store_->Save(session->AccountId(), creds->blob);
        if (!status.IsOk()) {
            RELAY_LOG_ERROR("Failed to persist credentials for {}: {}", session->AccountId(), status.Message());
        }
        return true;
    }
    if (auto* upsert = std::get_if<transport::ContactsUpsertEvent>(&event)) {
        session->Contacts()->Upsert(upsert->contacts);
        return true;
    }
    if (auto* update = std::get_if<transport::ContactsUpdateEvent>(&event)) {
        session->Contacts()->Merge(update->contacts);
    }
    return true;
}

bool SessionManager::OnPairingCode(const SessionPtr& session, const transport::PairingCodeEvent& event) {
    const auto& account_id = session->AccountId();
    auto rendered = renderer_->Render(account_id, event.code);
    if (!rendered.IsOk()) {
        RELAY_LOG_ERROR("Failed to render pairing code for {}: {}", account_id, rendered.GetStatus().Message());
        if (session->ResolveInit(FromSessionError(SessionErrorCode::kTransport, rendered.GetStatus().Message()))) {
            Teardown(session, TeardownReason::kInitFailed);
            return false;
        }
        return true;
    }

    if (!session->CompareAndSetState(ConnectionState::kConnecting, ConnectionState::kPairingPending)
        && session->State() != ConnectionState::kPairingPending) {
        RELAY_LOG_DEBUG("Ignoring pairing code for {} in state {}", account_id,
                        ConnectionStateName(session->State()));
        return true;
    }

    const auto timeout = std::chrono::seconds(config_.pairing_timeout_seconds);
    PairingArtifact artifact{account_id, std::move(rendered).Value(), std::chrono::system_clock::now() + timeout};
    if (!session->SetPairingArtifact(std::move(artifact), Session::Clock::now() + timeout)) {
        return true;
    }
    RELAY_LOG_INFO("Pairing code ready for {} (timeout {}s)", account_id, config_.pairing_timeout_seconds);

    InitResult result;
    result.connected = false;
    result.artifact = session->Artifact();
    result.pairing_timeout_seconds = config_.pairing_timeout_seconds;
    session->ResolveInit(common::StatusOr<InitResult>(std::move(result)));
    return true;
}

bool SessionManager::OnOpened(const SessionPtr& session, const transport::ConnectionOpenedEvent& event) {
    const auto& account_id = session->AccountId();
    const bool opened = session->CompareAndSetState(ConnectionState::kConnecting, ConnectionState::kOpen)
        || session->CompareAndSetState(ConnectionState::kPairingPending, ConnectionState::kOpen);
    if (!opened) {
        RELAY_LOG_DEBUG("Ignoring open event for {} in state {}", account_id, ConnectionStateName(session->State()));
        return true;
    }

    std::string identity = event.self_id;
    if (identity.empty()) {
        if (auto transport = session->CurrentTransport()) {
            identity = transport->SelfId();
        }
    }
    session->ClearPairing();
    session->ResetReconnectAttempts();
    session->SetIdentity(identity);
    RELAY_LOG_INFO("Session {} open as {}", account_id, events::JidToPhone(identity));

    InitResult result;
    result.connected = true;
    result.identity = identity;
    session->ResolveInit(common::StatusOr<InitResult>(std::move(result)));

    if (relay_) {
        relay_->NotifyConnected(account_id, identity);
    }
    return true;
}

bool SessionManager::OnClosed(const SessionPtr& session, const transport::ConnectionClosedEvent& event) {
    const auto& account_id = session->AccountId();
    const auto description = CloseDescription(event);
    RELAY_LOG_WARN("Connection closed for {} (state={}): {}, logged_out={}",
                   account_id, ConnectionStateName(session->State()), description, event.logged_out);

    if (event.logged_out) {
        session->ResolveInit(FromSessionError(SessionErrorCode::kTransport, description));
        Teardown(session, TeardownReason::kLoggedOut);
        return false;
    }
    if (session->ResolveInit(FromSessionError(SessionErrorCode::kTransport, description))) {
        // 首个结果之前就断开, init 失败
        Teardown(session, TeardownReason::kInitFailed);
        return false;
    }

    const bool closing = session->CompareAndSetState(ConnectionState::kOpen, ConnectionState::kClosing)
        || session->CompareAndSetState(ConnectionState::kConnecting, ConnectionState::kClosing)
        || session->CompareAndSetState(ConnectionState::kPairingPending, ConnectionState::kClosing);
    if (!closing) {
        return !session->StopRequested();
    }
    // 旧连接的配对计时不延续到重连
    session->ClearPairing();
    return Reconnect(session);
}

bool SessionManager::Reconnect(const SessionPtr& session) {
    const auto& account_id = session->AccountId();
    for (;;) {
        const int attempt = session->IncrementReconnectAttempts();
        if (attempt > config_.max_reconnect_attempts) {
            RELAY_LOG_WARN("Max reconnect attempts ({}) reached for {}", config_.max_reconnect_attempts, account_id);
            Teardown(session, TeardownReason::kReconnectExhausted);
            return false;
        }
        const auto delay = ReconnectDelay(attempt);
        RELAY_LOG_INFO("Reconnect attempt {}/{} for {} in {}ms",
                       attempt, config_.max_reconnect_attempts, account_id, delay.count());
        if (session->WaitForStop(delay)) {
            return false;
        }
        if (!StillOwned(session)) {
            RELAY_LOG_INFO("Session {} generation {} superseded, abandoning reconnect",
                           account_id, session->Generation());
            return false;
        }
        if (!session->CompareAndSetState(ConnectionState::kClosing, ConnectionState::kConnecting)) {
            return false;
        }
        auto status = ConnectTransport(session);
        if (status.IsOk()) {
            return true;
        }
        RELAY_LOG_WARN("Reconnect attempt {} for {} failed: {}", attempt, account_id, status.Message());
        if (!session->CompareAndSetState(ConnectionState::kConnecting, ConnectionState::kClosing)) {
            return false;
        }
    }
}

bool SessionManager::StillOwned(const SessionPtr& session) const {
    auto current = registry_.Find(session->AccountId());
    return current && current->Generation() == session->Generation() && !session->TornDown();
}

void SessionManager::Teardown(const SessionPtr& session, TeardownReason reason) {
    auto guard = registry_.LockAccount(session->AccountId());
    TeardownLocked(session, reason);
}

void SessionManager::TeardownLocked(const SessionPtr& session, TeardownReason reason) {
    const auto& account_id = session->AccountId();
    std::shared_ptr<transport::Transport> transport;
    if (!session->BeginTeardown(transport)) {
        return;
    }
    RELAY_LOG_INFO("Destroying session for {} (generation {}, reason {})",
                   account_id, session->Generation(), TeardownReasonName(reason));

    if (transport) {
        if (ShouldLogout(reason)) {
            auto status = transport->Logout();
            if (!status.IsOk()) {
                RELAY_LOG_WARN("Error logging out {}: {}", account_id, status.Message());
            }
        }
        transport->Close();
    }
    if (ShouldEraseCredentials(reason)) {
        auto status = auth_store_->Remove(account_id);
        if (!status.IsOk()) {
            RELAY_LOG_WARN("Error deleting credentials for {}: {}", account_id, status.Message());
        }
    }

    const auto code = reason == TeardownReason::kPairingExpired ? SessionErrorCode::kTimeout
                                                                : SessionErrorCode::kTransport;
    session->ResolveInit(FromSessionError(code, fmt::format("Session closed ({})", TeardownReasonName(reason))));
    registry_.Remove(account_id, session.get());
    session->MarkClosed();
}

std::chrono::milliseconds SessionManager::ReconnectDelay(int attempt) const {
    const long long delay = static_cast<long long>(attempt) * config_.reconnect_base_delay_ms;
    return std::chrono::milliseconds(std::min<long long>(delay, config_.reconnect_max_delay_ms));
}

}
}
