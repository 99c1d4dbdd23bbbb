#include <syslog.h>

#include <drogon/drogon.h>

#include "ProgressClient.h"
#include "utils.h"

ProgressClient::ProgressClient(const std::string& hostUrl, std::string token)
    : loopThread_("ProgressClient"), token_(std::move(token)) {
    loopThread_.run();
    client_ = drogon::HttpClient::newHttpClient(hostUrl, loopThread_.getLoop());
}

ProgressClient::~ProgressClient() {
    waitIdle(std::chrono::milliseconds(2000));
}

Json::Value ProgressClient::toJson(const ProgressSnapshot& snap) {
    Json::Value j(Json::objectValue);
    j["bookId"] = snap.bookId;
    if (!snap.location.empty())
        j["currentLocation"] = snap.location;
    j["percentage"]    = snap.percentage;
    j["readTimeDelta"] = static_cast<Json::Int64>(snap.readTimeDelta);
    return j;
}

void ProgressClient::save(const ProgressSnapshot& snap) {
    post(snap, false);
}

void ProgressClient::saveBeacon(const ProgressSnapshot& snap) {
    post(snap, true);
}

void ProgressClient::post(const ProgressSnapshot& snap, bool beacon) {
    auto req = drogon::HttpRequest::newHttpJsonRequest(toJson(snap));
    req->setMethod(drogon::Post);
    req->setPath("/progress");
    req->addHeader("Authorization", "Bearer " + token_);

    {
        std::lock_guard<std::mutex> lk(mu_);
        ++inFlight_;
    }

    const std::string bookId = snap.bookId;
    client_->sendRequest(req,
        [this, bookId, beacon](drogon::ReqResult result, const drogon::HttpResponsePtr& resp) {
            bool ok = (result == drogon::ReqResult::Ok) && resp && resp->getStatusCode() == drogon::k200OK;
            if (ok) {
                auto body = resp->getJsonObject();
                ok = body && (*body)["ok"].asBool();
            }
            if (!ok) {
                syslog(SYSLOG_WARNING, "progress %s for [%s] failed (result=%d, status=%d)",
                       beacon ? "beacon" : "save", bookId.c_str(), static_cast<int>(result),
                       resp ? static_cast<int>(resp->getStatusCode()) : 0);
            }

            std::lock_guard<std::mutex> lk(mu_);
            if (!ok) ++failures_;
            --inFlight_;
            idle_.notify_all();
        },
        10.0);
}

bool ProgressClient::fetch(const std::string& bookId, double& percentage, std::string& location) {
    auto req = drogon::HttpRequest::newHttpRequest();
    req->setMethod(drogon::Get);
    req->setPath("/progress");
    req->setParameter("bookId", bookId);
    req->addHeader("Authorization", "Bearer " + token_);

    auto [result, resp] = client_->sendRequest(req, 10.0);
    if (result != drogon::ReqResult::Ok || !resp || resp->getStatusCode() != drogon::k200OK) {
        syslog(SYSLOG_WARNING, "progress fetch for [%s] failed (result=%d, status=%d)", bookId.c_str(),
               static_cast<int>(result), resp ? static_cast<int>(resp->getStatusCode()) : 0);
        return false;
    }

    auto body = resp->getJsonObject();
    if (!body || !(*body)["ok"].asBool() || !(*body)["progress"].isObject())
        return false;

    const Json::Value& p = (*body)["progress"];
    percentage = p["percentage"].asDouble();
    location   = p["currentLocation"].isString() ? p["currentLocation"].asString() : std::string();
    return true;
}

bool ProgressClient::waitIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    return idle_.wait_for(lk, timeout, [this] { return inFlight_ == 0; });
}

int ProgressClient::failures() const {
    std::lock_guard<std::mutex> lk(mu_);
    return failures_;
}
