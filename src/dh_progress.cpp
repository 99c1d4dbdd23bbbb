//*****************************************************
// drogon handlers for "GET /progress" and "POST /progress"
//*****************************************************
#include <syslog.h>
#include <drogon/drogon.h>

#include "Book.h"
#include "Database.h"
#include "SessionManager.h"
#include "utils.h"
#include "dhutils.h"
#include "handlers.h"

using drogon::HttpRequestPtr;
using drogon::HttpResponsePtr;

int registerProgressHandler(void) {
    drogon::app().registerHandler("/progress",
        [](const HttpRequestPtr& req, std::function<void (const HttpResponsePtr &)> &&cb) {
            auto ok = [&](const Json::Value& progress) {
                Json::Value j;
                j["ok"]       = true;
                j["progress"] = progress;       // null if never saved
                auto r = drogon::HttpResponse::newHttpJsonResponse(j);
                r->setStatusCode(drogon::k200OK);
                cb(r);
            };
            auto err = [&](const char* code, const char* info = "") {
                Json::Value j;
                j["ok"]    = false;
                j["error"] = code;
                if (*info)
                    j["reason"] = info;
                auto r = drogon::HttpResponse::newHttpJsonResponse(j);
                r->setStatusCode(statusForError(code));
                cb(r);
            };

            // check whether token is valid
            const std::string username = SessionManager::instance().usernameIfValid(req);
            if (username.empty()) return err("unauthorised");

            Database& db = Database::get();

            if (req->method() == drogon::Get) {
                const std::string bookId = req->getParameter("bookId");
                if (bookId.empty())
                    return err("invalid_request", "no bookId");
                try {
                    Json::Value progress(Json::nullValue);
                    db.getProgress(username, bookId, progress);
                    return ok(progress);
                } catch (const std::exception& ex) {
                    syslog(SYSLOG_ERR, "GET /progress [%s] by %s: %s", bookId.c_str(), username.c_str(), ex.what());
                    return err("server_error");
                }
            }

            // POST: parse and validate json
            auto bodyPtr = req->getJsonObject();      // Drogon parses for us
            if (!bodyPtr)
                return err("invalid_request", "parsing failed");
            const auto& body = *bodyPtr;

            if (!body.isMember("bookId") || !body["bookId"].isString() || body["bookId"].asString().empty())
                return err("invalid_request", "no bookId");

            std::string location;
            const bool hasLocation = body.isMember("currentLocation") && !body["currentLocation"].isNull();
            if (hasLocation)
                location = toJsonString(body["currentLocation"]);

            double percentage = 0;
            const bool hasPercentage = body.isMember("percentage") && !body["percentage"].isNull();
            if (hasPercentage) {
                if (!body["percentage"].isNumeric())
                    return err("invalid_request", "invalid percentage");
                percentage = body["percentage"].asDouble();
            }

            long long readTimeDelta = 0;
            if (body.isMember("readTimeDelta") && !body["readTimeDelta"].isNull()) {
                if (!readTimeDeltaFromJson(body["readTimeDelta"], readTimeDelta))
                    return err("invalid_request", "invalid readTimeDelta");
            }

            const std::string bookId = body["bookId"].asString();

            try {
                BookRecord book;
                if (!db.getBook(bookId, book))
                    return err("not_found");

                db.upsertProgress(username, bookId, hasLocation ? &location : nullptr,
                                  hasPercentage ? &percentage : nullptr, readTimeDelta, nowMs());

                Json::Value progress(Json::nullValue);
                db.getProgress(username, bookId, progress);
                return ok(progress);
            } catch (const std::exception& ex) {
                syslog(SYSLOG_ERR, "POST /progress [%s] by %s: %s", bookId.c_str(), username.c_str(), ex.what());
                return err("server_error");
            }
        },
        {drogon::Get, drogon::Post}
    );

    return 0;
}
