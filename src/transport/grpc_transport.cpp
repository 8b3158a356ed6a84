#include "transport/grpc_transport.hpp"

#include "common/logger.hpp"

#include <system_error>

namespace relay {
namespace transport {

namespace {

MediaKind FromWireKind(proto::bridge::MediaKind kind) {
    switch (kind) {
        case proto::bridge::MEDIA_VIDEO:
            return MediaKind::kVideo;
        case proto::bridge::MEDIA_AUDIO:
            return MediaKind::kAudio;
        case proto::bridge::MEDIA_DOCUMENT:
            return MediaKind::kDocument;
        case proto::bridge::MEDIA_STICKER:
            return MediaKind::kSticker;
        default:
            return MediaKind::kImage;
    }
}

proto::bridge::MediaKind ToWireKind(MediaKind kind) {
    switch (kind) {
        case MediaKind::kVideo:
            return proto::bridge::MEDIA_VIDEO;
        case MediaKind::kAudio:
            return proto::bridge::MEDIA_AUDIO;
        case MediaKind::kDocument:
            return proto::bridge::MEDIA_DOCUMENT;
        case MediaKind::kSticker:
            return proto::bridge::MEDIA_STICKER;
        case MediaKind::kImage:
            break;
    }
    return proto::bridge::MEDIA_IMAGE;
}

std::vector<Contact> FromWireContacts(const proto::bridge::Contacts& contacts) {
    std::vector<Contact> result;
    result.reserve(contacts.contacts_size());
    for (const auto& wire : contacts.contacts()) {
        Contact contact;
        contact.id = wire.id();
        contact.routable_id = wire.routable_id();
        contact.name = wire.name();
        contact.notify = wire.notify();
        contact.verified_name = wire.verified_name();
        result.push_back(std::move(contact));
    }
    return result;
}

}

common::Status FromGrpcStatus(const grpc::Status& status) {
    switch (status.error_code()) {
        case grpc::StatusCode::OK:
            return common::Status::OK();
        case grpc::StatusCode::INVALID_ARGUMENT:
            return common::Status::InvalidArgument(status.error_message());
        case grpc::StatusCode::NOT_FOUND:
            return common::Status::NotFound(status.error_message());
        case grpc::StatusCode::DEADLINE_EXCEEDED:
            return common::Status::DeadlineExceeded(status.error_message());
        case grpc::StatusCode::FAILED_PRECONDITION:
            return common::Status::FailedPrecondition(status.error_message());
        case grpc::StatusCode::UNAUTHENTICATED:
            return common::Status::Unauthenticated(status.error_message());
        case grpc::StatusCode::UNAVAILABLE:
            return common::Status::Unavailable(status.error_message());
        default:
            return common::Status::Internal(status.error_message());
    }
}

InboundMessage FromWireMessage(const proto::bridge::WireMessage& wire) {
    InboundMessage message;
    message.id = wire.id();
    message.remote_id = wire.remote_id();
    message.participant = wire.participant();
    message.from_me = wire.from_me();
    message.push_name = wire.push_name();
    message.timestamp = wire.timestamp();
    if (wire.has_content()) {
        const auto& wire_content = wire.content();
        MessageContent content;
        content.text = wire_content.text();
        if (wire_content.has_media()) {
            const auto& wire_media = wire_content.media();
            MediaAttachment media;
            media.kind = FromWireKind(wire_media.kind());
            media.mime_type = wire_media.mime_type();
            media.caption = wire_media.caption();
            media.file_name = wire_media.file_name();
            media.duration_seconds = wire_media.duration_seconds();
            media.push_to_talk = wire_media.push_to_talk();
            content.media = std::move(media);
        }
        if (wire_content.has_quoted()) {
            content.quoted = QuotedMessage{wire_content.quoted().id(),
                                           wire_content.quoted().participant(),
                                           wire_content.quoted().text()};
        }
        message.content = std::move(content);
    }
    return message;
}

proto::bridge::WireMessage ToWireMessage(const InboundMessage& message) {
    proto::bridge::WireMessage wire;
    wire.set_id(message.id);
    wire.set_remote_id(message.remote_id);
    wire.set_participant(message.participant);
    wire.set_from_me(message.from_me);
    wire.set_push_name(message.push_name);
    wire.set_timestamp(message.timestamp);
    if (message.content) {
        auto* content = wire.mutable_content();
        content->set_text(message.content->text);
        if (message.content->media) {
            const auto& media = *message.content->media;
            auto* wire_media = content->mutable_media();
            wire_media->set_kind(ToWireKind(media.kind));
            wire_media->set_mime_type(media.mime_type);
            wire_media->set_caption(media.caption);
            wire_media->set_file_name(media.file_name);
            wire_media->set_duration_seconds(media.duration_seconds);
            wire_media->set_push_to_talk(media.push_to_talk);
        }
        if (message.content->quoted) {
            auto* quoted = content->mutable_quoted();
            quoted->set_id(message.content->quoted->id);
            quoted->set_participant(message.content->quoted->participant);
            quoted->set_text(message.content->quoted->text);
        }
    }
    return wire;
}

std::optional<TransportEvent> FromBridgeEvent(const proto::bridge::BridgeEvent& event) {
    switch (event.event_case()) {
        case proto::bridge::BridgeEvent::kPairingCode:
            return TransportEvent(PairingCodeEvent{event.pairing_code().code()});
        case proto::bridge::BridgeEvent::kOpened:
            return TransportEvent(ConnectionOpenedEvent{event.opened().self_id()});
        case proto::bridge::BridgeEvent::kClosed:
            return TransportEvent(ConnectionClosedEvent{event.closed().status_code(),
                                                        event.closed().message(),
                                                        event.closed().logged_out()});
        case proto::bridge::BridgeEvent::kMessages: {
            MessagesEvent messages;
            messages.delivery = event.messages().delivery() == proto::bridge::DELIVERY_APPEND
                                    ? DeliveryClass::kAppend
                                    : DeliveryClass::kNotify;
            for (const auto& wire : event.messages().messages()) {
                messages.messages.push_back(FromWireMessage(wire));
            }
            return TransportEvent(std::move(messages));
        }
        case proto::bridge::BridgeEvent::kCredentialsChanged:
            return TransportEvent(CredentialsChangedEvent{event.credentials_changed().blob()});
        case proto::bridge::BridgeEvent::kContactsUpsert:
            return TransportEvent(ContactsUpsertEvent{FromWireContacts(event.contacts_upsert())});
        case proto::bridge::BridgeEvent::kContactsUpdate:
            return TransportEvent(ContactsUpdateEvent{FromWireContacts(event.contacts_update())});
        case proto::bridge::BridgeEvent::EVENT_NOT_SET:
            break;
    }
    return std::nullopt;
}

GrpcTransport::GrpcTransport(std::string account_id,
                             std::shared_ptr<proto::bridge::TransportBridge::StubInterface> stub,
                             std::chrono::milliseconds rpc_timeout)
    : account_id_(std::move(account_id)), stub_(std::move(stub)), rpc_timeout_(rpc_timeout) {}

GrpcTransport::~GrpcTransport() {
    Close();
}

void GrpcTransport::PrepareContext(grpc::ClientContext& context) const {
    context.set_deadline(std::chrono::system_clock::now() + rpc_timeout_);
    context.AddMetadata("x-account-id", account_id_);
}

common::Status GrpcTransport::Connect(const std::optional<std::string>& credentials, EventSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_.load()) {
        return common::Status::FailedPrecondition("Transport already closed");
    }
    if (started_) {
        return common::Status::FailedPrecondition("Transport already connected");
    }

    proto::bridge::ConnectRequest request;
    request.set_account_id(account_id_);
    if (credentials) {
        request.set_has_credentials(true);
        request.set_credentials(*credentials);
    }

    // 事件流不设截止时间, 由 Close 取消
    stream_context_ = std::make_unique<grpc::ClientContext>();
    stream_context_->AddMetadata("x-account-id", account_id_);
    auto reader = stub_->Connect(stream_context_.get(), request);
    if (!reader) {
        return common::Status::Unavailable("Failed to open bridge event stream");
    }
    sink_ = std::move(sink);
    started_ = true;
    try {
        reader_ = std::thread(&GrpcTransport::ReadLoop, this, std::move(reader));
    } catch (const std::system_error& ex) {
        started_ = false;
        stream_context_->TryCancel();
        return common::Status::Internal(std::string("Failed to start stream reader: ") + ex.what());
    }
    return common::Status::OK();
}

void GrpcTransport::Deliver(TransportEvent event) {
    if (closed_.load()) {
        return;
    }
    sink_(std::move(event));
}

void GrpcTransport::ReadLoop(std::unique_ptr<grpc::ClientReaderInterface<proto::bridge::BridgeEvent>> reader) {
    proto::bridge::BridgeEvent wire;
    bool close_delivered = false;
    while (!closed_.load() && reader->Read(&wire)) {
        auto event = FromBridgeEvent(wire);
        if (!event) {
            continue;
        }
        if (auto* opened = std::get_if<ConnectionOpenedEvent>(&*event)) {
            std::lock_guard<std::mutex> lock(mutex_);
            self_id_ = opened->self_id;
        }
        const bool is_close = std::holds_alternative<ConnectionClosedEvent>(*event);
        Deliver(std::move(*event));
        if (is_close) {
            close_delivered = true;
            break;
        }
    }
    if (close_delivered) {
        // 关闭事件之后不再读取, 直接取消流
        stream_context_->TryCancel();
    }
    grpc::Status status = reader->Finish();
    if (closed_.load() || close_delivered) {
        return;
    }
    // 流意外结束按可恢复的断开处理
    RELAY_LOG_WARN("[transport] Event stream for {} ended: code={} message={}",
                   account_id_, static_cast<int>(status.error_code()), status.error_message());
    Deliver(ConnectionClosedEvent{static_cast<int>(status.error_code()),
                                  status.ok() ? "stream ended" : status.error_message(),
                                  false});
}

common::StatusOr<std::string> GrpcTransport::SendText(const std::string& destination, const std::string& text) {
    proto::bridge::SendTextRequest request;
    request.set_account_id(account_id_);
    request.set_destination(destination);
    request.set_text(text);
    proto::bridge::SendTextResponse response;
    grpc::ClientContext context;
    PrepareContext(context);
    auto status = stub_->SendText(&context, request, &response);
    if (!status.ok()) {
        return FromGrpcStatus(status);
    }
    return common::StatusOr<std::string>(response.message_id());
}

common::Status GrpcTransport::Logout() {
    proto::bridge::AccountRequest request;
    request.set_account_id(account_id_);
    proto::bridge::Ack response;
    grpc::ClientContext context;
    PrepareContext(context);
    return FromGrpcStatus(stub_->Logout(&context, request, &response));
}

void GrpcTransport::Close() {
    if (closed_.exchange(true)) {
        return;
    }
    std::thread reader;
    bool started = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        started = started_;
        reader = std::move(reader_);
    }
    if (!started) {
        return;
    }

    proto::bridge::AccountRequest request;
    request.set_account_id(account_id_);
    proto::bridge::Ack response;
    grpc::ClientContext context;
    PrepareContext(context);
    auto status = stub_->End(&context, request, &response);
    if (!status.ok()) {
        RELAY_LOG_DEBUG("[transport] End for {} failed: {}", account_id_, status.error_message());
    }

    stream_context_->TryCancel();
    if (reader.joinable()) {
        reader.join();
    }
}

std::string GrpcTransport::SelfId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return self_id_;
}

common::StatusOr<std::string> GrpcTransport::DownloadMedia(const InboundMessage& message) {
    proto::bridge::DownloadMediaRequest request;
    request.set_account_id(account_id_);
    *request.mutable_message() = ToWireMessage(message);
    proto::bridge::DownloadMediaResponse response;
    grpc::ClientContext context;
    PrepareContext(context);
    auto status = stub_->DownloadMedia(&context, request, &response);
    if (!status.ok()) {
        return FromGrpcStatus(status);
    }
    return common::StatusOr<std::string>(response.data());
}

common::StatusOr<std::vector<Conversation>> GrpcTransport::ListConversations() {
    proto::bridge::AccountRequest request;
    request.set_account_id(account_id_);
    proto::bridge::ListChatsResponse response;
    grpc::ClientContext context;
    PrepareContext(context);
    auto status = stub_->ListChats(&context, request, &response);
    if (!status.ok()) {
        return FromGrpcStatus(status);
    }
    std::vector<Conversation> chats;
    chats.reserve(response.chats_size());
    for (const auto& wire : response.chats()) {
        chats.push_back(Conversation{wire.id(), wire.name(), wire.is_group(), wire.last_activity(), wire.unread()});
    }
    return common::StatusOr<std::vector<Conversation>>(std::move(chats));
}

common::StatusOr<std::vector<InboundMessage>> GrpcTransport::ListMessages(const std::string& conversation_id,
                                                                           int limit) {
    proto::bridge::ListMessagesRequest request;
    request.set_account_id(account_id_);
    request.set_chat_id(conversation_id);
    request.set_limit(limit);
    proto::bridge::ListMessagesResponse response;
    grpc::ClientContext context;
    PrepareContext(context);
    auto status = stub_->ListMessages(&context, request, &response);
    if (!status.ok()) {
        return FromGrpcStatus(status);
    }
    std::vector<InboundMessage> messages;
    messages.reserve(response.messages_size());
    for (const auto& wire : response.messages()) {
        messages.push_back(FromWireMessage(wire));
    }
    return common::StatusOr<std::vector<InboundMessage>>(std::move(messages));
}

GrpcTransportFactory::GrpcTransportFactory(std::shared_ptr<grpc::Channel> channel,
                                           std::chrono::milliseconds rpc_timeout)
    : stub_(proto::bridge::TransportBridge::NewStub(channel)), rpc_timeout_(rpc_timeout) {}

std::shared_ptr<Transport> GrpcTransportFactory::Create(const std::string& account_id) {
    return std::make_shared<GrpcTransport>(account_id, stub_, rpc_timeout_);
}

}
}
