//*******************************************
// drogon handler for "POST /delete" requests
//*******************************************
#include <syslog.h>
#include <drogon/drogon.h>

#include "Database.h"
#include "SessionManager.h"
#include "utils.h"
#include "dhutils.h"
#include "handlers.h"

using drogon::HttpRequestPtr;
using drogon::HttpResponsePtr;

int registerDeleteHandler(void) {
    drogon::app().registerHandler("/delete",
        [](const HttpRequestPtr& req, std::function<void (const HttpResponsePtr &)> &&cb) {
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

            // parse and validate json
            auto bodyPtr = req->getJsonObject();      // Drogon parses for us
            if (!bodyPtr)    return err("invalid_request", "parsing failed");
            const auto& body = *bodyPtr;

            if (!body.isMember("table") || !body["table"].isString())
                return err("invalid_request", "no tablename");
            if (!body.isMember("bookId") || !body["bookId"].isString())
                return err("invalid_request", "no bookId");
            if (!body.isMember("id"))
                return err("invalid_request", "no id");

            const std::string table  = body["table"].asString();
            const std::string bookId = body["bookId"].asString();
            if (table != "bookmark" && table != "highlight")
                return err("invalid_request", "unknown table");

            long long itemId = 0;
            if (!parseItemId(body["id"], itemId))
                return err("invalid_request", "bad id");

            try {
                if (!Database::get().deleteAnnotation(table, username, bookId, itemId))
                    return err("not_found");

                Json::Value j;
                j["ok"] = true;
                auto r = drogon::HttpResponse::newHttpJsonResponse(j);
                r->setStatusCode(drogon::k200OK);
                cb(r);
            } catch (const std::exception& ex) {
                syslog(SYSLOG_ERR, "POST /delete [%s/%s] by %s: %s", table.c_str(), bookId.c_str(), username.c_str(), ex.what());
                return err("server_error");
            }
        },
        {drogon::Post}  // limit to POST
    );

    return 0;
}
