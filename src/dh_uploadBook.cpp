//**************************************************
// drogon handler for "POST /uploadBook" requests
//**************************************************
#include <syslog.h>
#include <drogon/drogon.h>

#include "BookIngest.h"
#include "Config.h"
#include "Database.h"
#include "SessionManager.h"
#include "utils.h"
#include "dhutils.h"
#include "handlers.h"

using drogon::HttpRequestPtr;
using drogon::HttpResponsePtr;

int registerUploadBookHandler(BlobStore& blobs) {
    drogon::app().registerHandler("/uploadBook",
        [&blobs](const HttpRequestPtr& req,
                 std::function<void (const HttpResponsePtr &)> &&cb) {
            auto ok = [&](const BookRecord& book) {
                Json::Value j;
                j["ok"]   = true;
                j["book"] = book.toJson();
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

            // parse multipart
            drogon::MultiPartParser parser;
            if (parser.parse(req) != 0)
                return err("invalid_request", "failed to parse");

            const auto& files = parser.getFiles();
            if (files.empty())
                return err("invalid_request", "no file part");
            const auto& file = files.front();

            std::string filename, format, title, author, shaHex;
            for (const auto& p : parser.getParameters()) {
                const auto& name = p.first;
                const auto& val  = p.second;
                if (name == "filename")    filename = trim(val);
                else if (name == "format") format   = toLower(trim(val));
                else if (name == "title")  title    = trim(val);
                else if (name == "author") author   = trim(val);
                else if (name == "sha256") shaHex   = trim(val);
            }
            if (filename.empty())
                filename = baseName(file.getFileName());
            if (filename.empty())
                return err("invalid_request", "no filename");

            // format from the form, else from the file's extension
            if (format.empty()) {
                const auto dot = filename.rfind('.');
                if (dot != std::string::npos)
                    format = toLower(filename.substr(dot + 1));
            }
            if (!isSupportedFormat(format))
                return err("unsupported_format", format.c_str());

            // policy size check
            const long long size = static_cast<long long>(file.fileLength());
            const long long maxSize = Config::get().maxFileSize();
            if (size <= 0)
                return err("invalid_request", "empty file");
            if ((maxSize > 0) && (size > maxSize))
                return err("too_large");

            try {
                const std::string bytes(file.fileContent().data(), file.fileContent().size());

                // client checksum is optional; when given it must match
                const std::string actualSha = sha256Hex(bytes);
                if (!shaHex.empty()) {
                    if (!isHex64(shaHex))
                        return err("invalid_request", "bad checksum");
                    if (shaHex != actualSha)
                        return err("checksum_mismatch");
                }

                BookRecord book;
                book.id       = drogon::utils::getUuid();
                book.owner    = username;
                book.format   = format;
                book.filename = filename;
                book.filesize = size;
                book.sha256   = actualSha;
                book.title    = title;
                book.author   = author;

                BookIngest ingest(Database::get(), blobs);
                ingest.createBook(book, bytes);
                return ok(book);
            } catch (const std::exception& ex) {
                syslog(SYSLOG_ERR, "POST /uploadBook [%s] by %s: %s", filename.c_str(), username.c_str(), ex.what());
                return err("server_error");
            }
        },
        {drogon::Post}  // limit to POST
    );

    return 0;
}
