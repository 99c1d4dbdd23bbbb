//*****************************************************
// drogon handler for "POST /extractCovers" requests
//   backfills covers for the caller's EPUBs that have none
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

int registerExtractCoversHandler(BlobStore& blobs) {
    drogon::app().registerHandler("/extractCovers",
        [&blobs](const HttpRequestPtr& req, std::function<void (const HttpResponsePtr &)> &&cb) {
            auto err = [&](const char* code) {
                Json::Value j;
                j["ok"]    = false;
                j["error"] = code;
                auto r = drogon::HttpResponse::newHttpJsonResponse(j);
                r->setStatusCode(statusForError(code));
                cb(r);
            };

            // check whether token is valid
            const std::string username = SessionManager::instance().usernameIfValid(req);
            if (username.empty()) return err("unauthorised");

            try {
                BookIngest ingest(Database::get(), blobs);
                int total = 0;
                const int updated = ingest.backfillCovers(username, total);

                Json::Value j;
                j["ok"]      = true;
                j["updated"] = updated;
                j["total"]   = total;
                auto r = drogon::HttpResponse::newHttpJsonResponse(j);
                r->setStatusCode(drogon::k200OK);
                cb(r);
            } catch (const std::exception& ex) {
                syslog(SYSLOG_ERR, "POST /extractCovers by %s: %s", username.c_str(), ex.what());
                return err("server_error");
            }
        },
        {drogon::Post}  // limit to POST
    );

    return 0;
}
