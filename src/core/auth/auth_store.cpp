#include "core/auth/auth_store.hpp"

#include "common/logger.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>

namespace relay {
namespace core {

namespace {

constexpr const char* kCredsFile = "creds.json";

common::Status InvalidAccount(const std::string& account_id) {
    return common::Status::InvalidArgument("Invalid account id: '" + account_id + "'");
}

}

bool IsValidAccountId(const std::string& account_id) {
    if (account_id.empty() || account_id == "." || account_id == "..") {
        return false;
    }
    for (char c : account_id) {
        if (c == '/' || c == '\\' || c == '\0') {
            return false;
        }
    }
    return true;
}

// ---- InMemoryAuthStore ----

common::StatusOr<std::optional<std::string>> InMemoryAuthStore::Load(const std::string& account_id) {
    std::shared_lock lock(mutex_);
    auto it = blobs_.find(account_id);
    if (it == blobs_.end()) {
        return common::StatusOr<std::optional<std::string>>(std::optional<std::string>{});
    }
    return common::StatusOr<std::optional<std::string>>(std::optional<std::string>{it->second});
}

common::Status InMemoryAuthStore::Save(const std::string& account_id, const std::string& blob) {
    if (account_id.empty()) {
        return InvalidAccount(account_id);
    }
    std::unique_lock lock(mutex_);
    blobs_[account_id] = blob;
    return common::Status::OK();
}

common::Status InMemoryAuthStore::Remove(const std::string& account_id) {
    std::unique_lock lock(mutex_);
    blobs_.erase(account_id);
    return common::Status::OK();
}

bool InMemoryAuthStore::Contains(const std::string& account_id) const {
    std::shared_lock lock(mutex_);
    return blobs_.count(account_id) > 0;
}

// ---- FileAuthStore ----

FileAuthStore::FileAuthStore(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path FileAuthStore::AccountDir(const std::string& account_id) const {
    return root_ / account_id;
}

common::StatusOr<std::optional<std::string>> FileAuthStore::Load(const std::string& account_id) {
    if (!IsValidAccountId(account_id)) {
        return InvalidAccount(account_id);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto path = AccountDir(account_id) / kCredsFile;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return common::StatusOr<std::optional<std::string>>(std::optional<std::string>{});
    }
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs.is_open()) {
        return common::Status::Internal("Failed to open credentials file: " + path.string());
    }
    std::string blob((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
    return common::StatusOr<std::optional<std::string>>(std::optional<std::string>{std::move(blob)});
}

common::Status FileAuthStore::Save(const std::string& account_id, const std::string& blob) {
    if (!IsValidAccountId(account_id)) {
        return InvalidAccount(account_id);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto dir = AccountDir(account_id);
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return common::Status::Internal("Failed to create auth directory " + dir.string() + ": " + ec.message());
    }

    // 先写临时文件再 rename, 避免读到半截数据
    const auto target = dir / kCredsFile;
    auto temp = target;
    temp += ".tmp";
    {
        std::ofstream ofs(temp, std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            return common::Status::Internal("Failed to open temp credentials file: " + temp.string());
        }
        ofs.write(blob.data(), static_cast<std::streamsize>(blob.size()));
        if (!ofs.good()) {
            return common::Status::Internal("Failed to write credentials file: " + temp.string());
        }
    }
    std::filesystem::rename(temp, target, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        return common::Status::Internal("Failed to replace credentials file " + target.string());
    }
    return common::Status::OK();
}

common::Status FileAuthStore::Remove(const std::string& account_id) {
    if (!IsValidAccountId(account_id)) {
        return InvalidAccount(account_id);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const auto dir = AccountDir(account_id);
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    if (ec) {
        return common::Status::Internal("Failed to delete auth directory " + dir.string() + ": " + ec.message());
    }
    RELAY_LOG_INFO("Auth data removed for account {}", account_id);
    return common::Status::OK();
}

}
}
