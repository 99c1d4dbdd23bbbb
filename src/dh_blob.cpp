//*****************************************************
// drogon handler for "GET /blob/<key>" requests
//   serves covers and re-hosted book resources
//*****************************************************
#include <filesystem>
#include <drogon/drogon.h>

#include "BlobStore.h"
#include "utils.h"
#include "handlers.h"

using drogon::HttpRequestPtr;
using drogon::HttpResponsePtr;

int registerBlobHandler(FileBlobStore& blobs) {
    drogon::app().registerHandlerViaRegex("/blob/(.+)",
        [&blobs](const HttpRequestPtr&,
                 std::function<void (const HttpResponsePtr &)> &&cb,
                 const std::string& key) {
            auto notFound = [&]() {
                Json::Value j;
                j["ok"]    = false;
                j["error"] = "not_found";
                auto r = drogon::HttpResponse::newHttpJsonResponse(j);
                r->setStatusCode(drogon::k404NotFound);
                cb(r);
            };

            const std::string path = blobs.pathFor(key);
            if (path.empty())
                return notFound();      // key tries to leave the blob root

            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec) || ec)
                return notFound();

            // blobs are written once under a key that names their content
            auto resp = drogon::HttpResponse::newFileResponse(path, "", drogon::CT_NONE, mimeTypeForPath(key));
            resp->addHeader("Cache-Control", "public, max-age=31536000, immutable");
            cb(resp);
        },
        {drogon::Get}  // limit to GET
    );

    return 0;
}
