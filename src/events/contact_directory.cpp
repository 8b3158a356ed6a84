#include "events/contact_directory.hpp"

#include <mutex>

namespace relay {
namespace events {

void ContactDirectory::Upsert(const std::vector<transport::Contact>& contacts) {
    std::unique_lock lock(mutex_);
    for (const auto& contact : contacts) {
        if (contact.id.empty()) {
            continue;
        }
        contacts_[contact.id] = contact;
    }
}

void ContactDirectory::Merge(const std::vector<transport::Contact>& updates) {
    std::unique_lock lock(mutex_);
    for (const auto& update : updates) {
        auto it = contacts_.find(update.id);
        if (it == contacts_.end()) {
            continue;
        }
        auto& existing = it->second;
        if (!update.routable_id.empty()) {
            existing.routable_id = update.routable_id;
        }
        if (!update.name.empty()) {
            existing.name = update.name;
        }
        if (!update.notify.empty()) {
            existing.notify = update.notify;
        }
        if (!update.verified_name.empty()) {
            existing.verified_name = update.verified_name;
        }
    }
}

std::optional<transport::Contact> ContactDirectory::Find(const std::string& id) const {
    std::shared_lock lock(mutex_);
    auto it = contacts_.find(id);
    if (it == contacts_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t ContactDirectory::Size() const {
    std::shared_lock lock(mutex_);
    return contacts_.size();
}

}
}
