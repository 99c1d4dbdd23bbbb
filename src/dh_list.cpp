//*****************************************************************
// drogon handler for "GET /list"
//   the library, one page at a time; with a valid bearer token each
//   book also carries the caller's reading progress
//*****************************************************************
#include <algorithm>
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

int registerListHandler(void) {
    drogon::app().registerHandler("/list",
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

            // anonymous readers get the list without progress
            const std::string username = SessionManager::instance().usernameIfValid(req);

            BookListQuery query;
            query.search = trim(req->getParameter("search"));

            const std::string sort = req->getParameter("sort");
            if (!sort.empty()) {
                if (sort != "recent" && sort != "added" && sort != "title")
                    return err("invalid_request", "sort must be recent, added or title");
                query.sort = sort;
            }

            long long n = 0;
            const std::string page = req->getParameter("page");
            if (!page.empty()) {
                if (!parseUnsigned(page, n) || n < 1 || n > 1000000)
                    return err("invalid_request", "bad page");
                query.page = static_cast<int>(n);
            }
            const std::string limit = req->getParameter("limit");
            if (!limit.empty()) {
                if (!parseUnsigned(limit, n) || n < 1)
                    return err("invalid_request", "bad limit");
                query.limit = static_cast<int>(std::min<long long>(n, MAX_LIST_LIMIT));
            }

            try {
                Json::Value list(Json::arrayValue);
                const long long total = Database::get().listBooks(query, username, list);

                Json::Value pagination;
                pagination["page"]       = query.page;
                pagination["limit"]      = query.limit;
                pagination["total"]      = static_cast<Json::Int64>(total);
                pagination["totalPages"] = static_cast<Json::Int64>((total + query.limit - 1) / query.limit);

                Json::Value j;
                j["ok"]         = true;
                j["list"]       = list;
                j["pagination"] = pagination;
                auto r = drogon::HttpResponse::newHttpJsonResponse(j);
                r->setStatusCode(drogon::k200OK);
                cb(r);
            } catch (const std::exception& ex) {
                syslog(SYSLOG_ERR, "GET /list by [%s]: %s", username.c_str(), ex.what());
                return err("server_error");
            }
        },
        {drogon::Get}  // limit to GET
    );

    return 0;
}
