#include "session_registry.hpp"

bool SessionRegistry::add(std::shared_ptr<Session> session) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.count(session->id)) return false;
    by_client_[session->client_id].insert(session->id);
    sessions_.emplace(session->id, std::move(session));
    return true;
}

std::shared_ptr<Session> SessionRegistry::get(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<Session> SessionRegistry::remove(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return nullptr;

    auto session = std::move(it->second);
    sessions_.erase(it);

    auto owner = by_client_.find(session->client_id);
    if (owner != by_client_.end()) {
        owner->second.erase(session_id);
        if (owner->second.empty()) by_client_.erase(owner);
    }
    return session;
}

bool SessionRegistry::contains(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.count(session_id) > 0;
}

std::vector<std::string> SessionRegistry::sessions_for(const std::string& client_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = by_client_.find(client_id);
    if (it == by_client_.end()) return {};
    return std::vector<std::string>(it->second.begin(), it->second.end());
}

std::vector<std::string> SessionRegistry::all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& kv : sessions_) ids.push_back(kv.first);
    return ids;
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}
