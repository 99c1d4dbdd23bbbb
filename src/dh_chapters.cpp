//*****************************************************************
// drogon handlers for "GET /chapters/meta" and "GET /chapters"
//   public: anyone who knows a bookId may read its chapters
//*****************************************************************
#include <syslog.h>
#include <drogon/drogon.h>

#include "Database.h"
#include "PaginationWindowService.h"
#include "utils.h"
#include "dhutils.h"
#include "handlers.h"

using drogon::HttpRequestPtr;
using drogon::HttpResponsePtr;

int registerChaptersHandler(void) {
    drogon::app().registerHandler("/chapters/meta",
        [](const HttpRequestPtr& req, std::function<void (const HttpResponsePtr &)> &&cb) {
            auto ok = [&](Json::Value j) {
                j["ok"] = true;
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

            const std::string bookId = req->getParameter("bookId");

            try {
                PaginationWindowService service(Database::get());
                Json::Value meta;
                const WindowStatus st = service.fetchMeta(bookId, meta);
                switch (st) {
                    case WindowStatus::Ok:            return ok(meta);
                    case WindowStatus::MissingBookId: return err(windowStatusCode(st), "no bookId");
                    case WindowStatus::NotReady:      return err(windowStatusCode(st), "book has not been parsed yet");
                    default:                          return err(windowStatusCode(st));
                }
            } catch (const std::exception& ex) {
                syslog(SYSLOG_ERR, "GET /chapters/meta [%s]: %s", bookId.c_str(), ex.what());
                return err("server_error");
            }
        },
        {drogon::Get}  // limit to GET
    );

    drogon::app().registerHandler("/chapters",
        [](const HttpRequestPtr& req, std::function<void (const HttpResponsePtr &)> &&cb) {
            auto ok = [&](Json::Value j) {
                j["ok"] = true;
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

            const std::string bookId = req->getParameter("bookId");

            try {
                PaginationWindowService service(Database::get());
                Json::Value window;
                const WindowStatus st = service.fetchWindow(bookId, req->getParameter("from"),
                                                            req->getParameter("to"), window);
                switch (st) {
                    case WindowStatus::Ok:            return ok(window);
                    case WindowStatus::MissingBookId: return err(windowStatusCode(st), "no bookId");
                    case WindowStatus::BadRange:      return err(windowStatusCode(st), "invalid from/to");
                    case WindowStatus::NotReady:      return err(windowStatusCode(st), "book has not been parsed yet");
                    default:                          return err(windowStatusCode(st));
                }
            } catch (const std::exception& ex) {
                syslog(SYSLOG_ERR, "GET /chapters [%s]: %s", bookId.c_str(), ex.what());
                return err("server_error");
            }
        },
        {drogon::Get}  // limit to GET
    );

    return 0;
}
