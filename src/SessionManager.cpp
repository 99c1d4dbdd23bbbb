#include <strings.h>

#include "SessionManager.h"
#include "Config.h"
#include "Database.h"
#include "dhutils.h"
#include "utils.h"

// singleton instance
SessionManager& SessionManager::instance() {
    static SessionManager inst;     // instantiated once on first-call
    return inst;
}

std::string SessionManager::hashToken(const std::string& token) {
    return sha256Hex(token);
}

// extract the token from a HttpRequest header
std::string SessionManager::bearerToken(const drogon::HttpRequestPtr& req) {
  auto h = req->getHeader("authorization");
  if (h.size() >= 7 && strncasecmp(h.c_str(), "Bearer ", 7) == 0)
    return trim(h.substr(7));
  return "";
}

// validate token inside HttpRequest header
// RETURN: username if token is valid, else empty string
std::string SessionManager::usernameIfValid(const drogon::HttpRequestPtr& req) {
    const std::string token = bearerToken(req);
    return usernameIfValid(token);
}

// validate token
// RETURN: username if token is valid, else empty string
std::string SessionManager::usernameIfValid(const std::string& token) {
    if (token.empty()) return {};   // no token

    const std::string hash = hashToken(token);
    const auto now = Clock::now();

    {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = sessions_.find(hash);
        if (it != sessions_.end()) {
            if (it->second.recheckAt > now)
                return it->second.username;
            sessions_.erase(it);
        }
    }

    // not cached (or cached too long ago): ask the database
    const std::string username = Database::get().usernameForTokenHash(hash, nowMs());
    if (username.empty()) return {};

    const auto recheck = now + std::chrono::seconds(Config::get().tokenCacheSecs());

    std::lock_guard<std::mutex> lk(mu_);
    pruneExpired(); // do some housekeeping first
    sessions_[hash] = Session{username, recheck};
    return username;
}

// pruneExpired(): drop stale cache entries
// note: assumes you have already locked the mutex
void SessionManager::pruneExpired() {
    const auto now = Clock::now();
    for (auto it = sessions_.begin(); it != sessions_.end(); ) {
        if (it->second.recheckAt <= now) it = sessions_.erase(it);
        else ++it;
    }
}
