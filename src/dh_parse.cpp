//*****************************************************
// drogon handler for "POST /chapters/parse" requests
//*****************************************************
#include <syslog.h>
#include <drogon/drogon.h>

#include "BookIngest.h"
#include "Database.h"
#include "SessionManager.h"
#include "utils.h"
#include "dhutils.h"
#include "handlers.h"

using drogon::HttpRequestPtr;
using drogon::HttpResponsePtr;

int registerParseHandler(BlobStore& blobs) {
    drogon::app().registerHandler("/chapters/parse",
        [&blobs](const HttpRequestPtr& req, std::function<void (const HttpResponsePtr &)> &&cb) {
            auto ok = [&](const std::string& bookId, const ParseSummary& sum, bool alreadyParsed) {
                Json::Value j;
                j["ok"]              = true;
                j["bookId"]          = bookId;
                j["totalChapters"]   = sum.totalChapters;
                j["totalCharacters"] = static_cast<Json::Int64>(sum.totalCharacters);
                j["alreadyParsed"]   = alreadyParsed;
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

            if (!body.isMember("bookId") || !body["bookId"].isString() || body["bookId"].asString().empty())
                return err("invalid_request", "no bookId");
            if (body.isMember("force") && !body["force"].isBool())
                return err("invalid_request", "invalid force");

            const std::string bookId = body["bookId"].asString();
            const bool force = body.get("force", false).asBool();

            try {
                BookIngest ingest(Database::get(), blobs);
                ParseSummary sum;
                const ParseStatus st = ingest.parseBook(bookId, force, sum);
                switch (st) {
                    case ParseStatus::Parsed:        return ok(bookId, sum, false);
                    case ParseStatus::AlreadyParsed: return ok(bookId, sum, true);
                    case ParseStatus::NotEpub:       return err(parseStatusCode(st), "only EPUB books are segmented");
                    case ParseStatus::NotParseable:  return err(parseStatusCode(st), "no readable EPUB package");
                    case ParseStatus::InProgress:    return err(parseStatusCode(st), "book is being parsed");
                    default:                         return err(parseStatusCode(st));
                }
            } catch (const std::exception& ex) {
                syslog(SYSLOG_ERR, "POST /chapters/parse [%s] by %s: %s", bookId.c_str(), username.c_str(), ex.what());
                return err("server_error");
            }
        },
        {drogon::Post}  // limit to POST
    );

    return 0;
}
