//**************************************************
// drogon handler for "GET /book/{bookId}" requests
//**************************************************
#include <filesystem>
#include <syslog.h>
#include <drogon/drogon.h>

#include "BlobStore.h"
#include "Database.h"
#include "SessionManager.h"
#include "utils.h"
#include "dhutils.h"
#include "handlers.h"

using drogon::HttpRequestPtr;
using drogon::HttpResponsePtr;

int registerGetBookHandler(FileBlobStore& blobs) {
    drogon::app().registerHandler("/book/{1}",
        [&blobs](const HttpRequestPtr& req,
                 std::function<void (const HttpResponsePtr &)> &&cb,
                 const std::string& bookId) {
            auto jsonErr = [&](const char* code, const char* info = "") {
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
            if (username.empty())
                return jsonErr("unauthorised");

            // --- lookup book metadata ---
            BookRecord book;
            try {
                if (!Database::get().getBook(bookId, book) || book.owner != username)
                    return jsonErr("not_found", "book record not found");
            } catch (const std::exception& ex) {
                syslog(SYSLOG_ERR, "GET /book/%s: %s", bookId.c_str(), ex.what());
                return jsonErr("server_error");
            }

            // --- basic file checks before streaming ---
            namespace fs = std::filesystem;
            const std::string path = blobs.pathFor(book.location);
            std::error_code ec;
            if (path.empty() || !fs::exists(path, ec) || ec)
                return jsonErr("not_found", "file not found");
            const auto actualSize = fs::file_size(path, ec);
            if (ec)
                return jsonErr("server_error", ec.message().c_str());
            if (static_cast<long long>(actualSize) != book.filesize) {
                // stored original doesn't match its row
                syslog(SYSLOG_ERR, "GET /book/%s: size mismatch (%lld on disk, %lld recorded)", bookId.c_str(),
                       static_cast<long long>(actualSize), book.filesize);
                return jsonErr("server_error", "size mismatch");
            }

            // --- stream the file ---
            auto resp = drogon::HttpResponse::newFileResponse(path, book.filename, drogon::CT_NONE,
                                                              mimeTypeForPath(book.location));
            resp->setStatusCode(drogon::k200OK);
            resp->addHeader("X-Checksum-SHA256", book.sha256);
            resp->addHeader("X-Filename", book.filename);
            cb(resp);
        },
        {drogon::Get}  // limit to GET
    );

    return 0;
}
