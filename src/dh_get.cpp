//*******************************************
// drogon handler for "POST /get" requests
//   lists a reader's bookmarks or highlights for one book
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

int registerGetHandler(void) {
    drogon::app().registerHandler("/get",
        [](const HttpRequestPtr& req, std::function<void (const HttpResponsePtr &)> &&cb) {
            auto ok_rows = [&](const Json::Value& rows) {
                Json::Value j; j["ok"] = true; j["rows"] = rows;  // [0..n]
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

            // parse and validate json
            auto bodyPtr = req->getJsonObject();      // Drogon parses for us
            if (!bodyPtr)
                return err("invalid_request", "parsing failed");
            const auto& body = *bodyPtr;

            if (!body.isMember("table") || !body["table"].isString())
                return err("invalid_request", "no table");
            if (!body.isMember("bookId") || !body["bookId"].isString())
                return err("invalid_request", "no bookId");

            const std::string table  = body["table"].asString();
            const std::string bookId = body["bookId"].asString();
            if (table != "bookmark" && table != "highlight")
                return err("invalid_request", "unknown table");

            long long id = -1;      // -1 lists every row for the book
            if (body.isMember("id") && !parseItemId(body["id"], id))
                return err("invalid_request", "invalid id");

            try {
                Json::Value rows(Json::arrayValue);
                Database::get().listAnnotations(table, username, bookId, id, rows);
                return ok_rows(rows);
            } catch (const std::exception& ex) {
                syslog(SYSLOG_ERR, "POST /get [%s/%s] by %s: %s", table.c_str(), bookId.c_str(), username.c_str(), ex.what());
                return err("server_error");
            }
        },
        {drogon::Post}  // limit to POST
    );

    return 0;
}
