#ifndef BOOKPAGED_SESSIONMANAGER_H
#define BOOKPAGED_SESSIONMANAGER_H

#include <unordered_map>
#include <mutex>
#include <string>
#include <chrono>

#include <drogon/drogon.h>

//
// SessionManager:  checks bearer tokens.
//   Tokens are issued by the account service, which stores sha256(token)
//   in api_tokens.  A token that checks out is remembered for a short while
//   so busy readers don't hit the database on every window fetch.
//
class SessionManager {
public:
    using Clock = std::chrono::system_clock;

    // robust singleton - no copying or assignment
    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;
    SessionManager(SessionManager&&) = delete;
    SessionManager& operator=(SessionManager&&) = delete;

    static SessionManager& instance();  // singleton instance

    // returns username if token valid (non-empty), else empty string.
    std::string usernameIfValid(const drogon::HttpRequestPtr& req);
    std::string usernameIfValid(const std::string& token);

    // lowercase hex sha256, as stored in api_tokens.token_hash
    static std::string hashToken(const std::string& token);

    static std::string bearerToken(const drogon::HttpRequestPtr& req);

private:
    struct Session {
        std::string username;
        std::chrono::time_point<Clock> recheckAt;   // look in the database again after this
    };

    SessionManager() = default; // singleton

    void pruneExpired();                        // drops stale cache entries

    std::unordered_map<std::string, Session> sessions_;    // by token hash
    std::mutex mu_;
};

#endif // BOOKPAGED_SESSIONMANAGER_H
