//*******************************************
// drogon handler for "POST /update" requests
//   creates or replaces one bookmark or highlight
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

int registerUpdateHandler(void) {
    drogon::app().registerHandler("/update",
        [](const HttpRequestPtr& req, std::function<void (const HttpResponsePtr &)> &&cb) {
            auto ok = [&](long long ts) {
                Json::Value j; j["ok"] = true; j["updatedAt"] = static_cast<Json::Int64>(ts);
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
            if (!bodyPtr)    return err("invalid_request", "parsing failed");
            const auto& body = *bodyPtr;

            if (!body.isMember("table") || !body["table"].isString())
                return err("invalid_request", "no tablename");
            if (!body.isMember("row")   || !body["row"].isObject())
                return err("invalid_request", "no row data");

            const std::string table = body["table"].asString();
            const Json::Value& row  = body["row"];
            if (table != "bookmark" && table != "highlight")
                return err("invalid_request", "unknown table");

            if (!row.isMember("bookId") || !row["bookId"].isString())
                return err("invalid_request", "no bookId");
            if (!row.isMember("id"))
                return err("invalid_request", "no id");
            long long itemId = 0;
            if (!parseItemId(row["id"], itemId))
                return err("invalid_request", "bad id");
            if (!row.isMember("location") || row["location"].isNull())
                return err("invalid_request", "no location");

            const std::string bookId   = row["bookId"].asString();
            const std::string location = toJsonString(row["location"]);
            const std::string note     = row.isMember("note")  ? row["note"].asString()  : "";
            const std::string color    = row.isMember("color") ? row["color"].asString() : "";

            try {
                Database& db = Database::get();

                BookRecord book;
                if (!db.getBook(bookId, book))
                    return err("not_found", "unknown bookId");

                const long long tnow = nowMs();
                db.upsertAnnotation(table, username, bookId, itemId, location, note, color, tnow);
                return ok(tnow);
            } catch (const std::exception& ex) {
                syslog(SYSLOG_ERR, "POST /update [%s/%s] by %s: %s", table.c_str(), bookId.c_str(), username.c_str(), ex.what());
                return err("server_error");
            }
        },
        {drogon::Post}  // limit to POST
    );

    return 0;
}
