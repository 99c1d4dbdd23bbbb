#ifndef BOOKPAGED_PROGRESSCLIENT_H
#define BOOKPAGED_PROGRESSCLIENT_H

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>

#include <drogon/HttpClient.h>
#include <trantor/net/EventLoopThread.h>

#include "ReadingPositionTracker.h"

//
// ProgressClient: ProgressSink that posts to a bookpaged server's /progress.
//   Requests go out on the client's own event loop thread, so save() never
//   blocks the caller.  Failed saves are logged and dropped; the next save
//   carries the newer position anyway.
//
class ProgressClient : public ProgressSink {
public:
    // hostUrl: "http://host:port"
    ProgressClient(const std::string& hostUrl, std::string token);
    ~ProgressClient() override;

    void save(const ProgressSnapshot& snap) override;
    void saveBeacon(const ProgressSnapshot& snap) override;

    // GET /progress for the book, blocking (never call it from the client's loop).
    // RETURNS: false if the server has nothing saved or couldn't be asked
    bool fetch(const std::string& bookId, double& percentage, std::string& location);

    // RETURNS: false if requests were still in flight when the timeout ran out
    bool waitIdle(std::chrono::milliseconds timeout);

    int failures() const;

    static Json::Value toJson(const ProgressSnapshot& snap);

private:
    trantor::EventLoopThread loopThread_;
    drogon::HttpClientPtr client_;
    std::string token_;

    mutable std::mutex mu_;
    std::condition_variable idle_;
    int inFlight_ = 0;
    int failures_ = 0;

    void post(const ProgressSnapshot& snap, bool beacon);
};

#endif // BOOKPAGED_PROGRESSCLIENT_H
