#include "events/identity.hpp"

#include "events/contact_directory.hpp"

#include <cctype>

namespace relay {
namespace events {

namespace {
constexpr const char* kGroupSuffix = "@g.us";
constexpr const char* kAliasMarker = "@lid";
constexpr const char* kLegacyUserSuffix = "@c.us";
constexpr const char* kUserSuffix = "@s.whatsapp.net";
constexpr const char* kUnknownGroup = "Unknown Group";

bool EndsWith(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size()
        && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}
}

std::string JidToPhone(const std::string& jid) {
    auto user = jid.substr(0, jid.find('@'));
    return user.substr(0, user.find(':'));
}

bool IsGroupId(const std::string& jid) {
    return EndsWith(jid, kGroupSuffix);
}

bool IsAliasId(const std::string& jid) {
    return jid.find(kAliasMarker) != std::string::npos;
}

std::string ResolveCounterparty(const std::string& jid, const ContactDirectory& directory) {
    if (!IsAliasId(jid)) {
        return jid;
    }
    auto contact = directory.Find(jid);
    if (contact && !contact->routable_id.empty() && !IsAliasId(contact->routable_id)) {
        return contact->routable_id;
    }
    return jid;
}

std::string ContactName(const std::string& jid, const ContactDirectory& directory, const std::string& push_name) {
    if (auto found = directory.Find(jid)) {
        const auto& contact = *found;
        for (const std::string* candidate : {&contact.name, &contact.notify, &contact.verified_name, &push_name}) {
            if (!candidate->empty()) {
                return *candidate;
            }
        }
        return JidToPhone(jid);
    }
    return push_name.empty() ? JidToPhone(jid) : push_name;
}

// 群组没有 push name, 目录缺失时退回到 id 的用户部分
std::string GroupName(const std::string& jid, const ContactDirectory& directory) {
    auto name = ContactName(jid, directory, "");
    return name.empty() ? kUnknownGroup : name;
}

std::string FormatDestination(const std::string& to) {
    if (to.find(kGroupSuffix) != std::string::npos) {
        return to;
    }
    const auto legacy = to.find(kLegacyUserSuffix);
    if (legacy != std::string::npos) {
        std::string formatted = to;
        formatted.replace(legacy, std::string(kLegacyUserSuffix).size(), kUserSuffix);
        return formatted;
    }
    std::string digits;
    for (char c : to) {
        if (std::isdigit(static_cast<unsigned char>(c))) {
            digits.push_back(c);
        }
    }
    return digits + kUserSuffix;
}

}
}
