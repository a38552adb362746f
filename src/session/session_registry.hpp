#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "session.hpp"

// Table of live sessions plus a per-client index.
// One mutex, held only for the table mutation itself.
class SessionRegistry {
public:
    // False if a session with the same id is already registered.
    bool add(std::shared_ptr<Session> session);
    std::shared_ptr<Session> get(const std::string& session_id) const;
    // Returns the removed session, or nullptr if it was not registered.
    std::shared_ptr<Session> remove(const std::string& session_id);

    bool contains(const std::string& session_id) const;
    std::vector<std::string> sessions_for(const std::string& client_id) const;
    std::vector<std::string> all() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
    std::map<std::string, std::set<std::string>> by_client_;
};
