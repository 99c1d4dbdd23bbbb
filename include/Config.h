#pragma once
#include <string>
#include <unordered_map>

class Config {
public:
    // Singleton accessor
    static Config& get();

    // Load once from file
    void load(const std::string& overridePath = "");

    // Getters
    const std::string& host() const { return host_; }
    int port() const { return port_; }
    int threads() const { return threads_; }                           // 0 = one per core
    long long maxFileSize() const { return static_cast<long long>(maxFileSizeMB_) * 1024 * 1024; } // in bytes
    int maxFileSizeMB() const { return maxFileSizeMB_; }               // returns in MB
    int parseTimeout() const  { return parseTimeout_; }                // returns in secs
    int tokenCacheSecs() const { return tokenCacheSecs_; }             // returns in secs
    const std::string& dbPath() const { return dbPath_; }
    const std::string& blobRoot() const { return blobRoot_; }
    const std::string& blobUrl() const { return blobUrl_; }
    const std::string& uploadPath() const { return uploadPath_; }

    std::string toShortString() const;
    std::string toString() const;

private:
    // Private constructor
    Config() = default;

    // Disable copy
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Values
    std::string host_ = "127.0.0.1";
    int port_ = 9000;
    int threads_ = 0;
    int maxFileSizeMB_ = 200;   // MB
    int parseTimeout_ = 300;    // secs
    int tokenCacheSecs_ = 60;   // secs
    std::string dbPath_     = "/var/lib/bookpaged/app.db";
    std::string blobRoot_   = "/var/lib/bookpaged/blobs";
    std::string blobUrl_    = "/blob";
    std::string uploadPath_ = "/var/lib/bookpaged/tmp";
};
