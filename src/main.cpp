#include <drogon/drogon.h>
#include <iostream>
#include <sodium.h>
#include <syslog.h>
#include <signal.h>
#include <stdlib.h>
#include <stdexcept>

#include "BlobStore.h"
#include "Config.h"
#include "Database.h"
#include "handlers.h"
#include "utils.h"

void handleSignal(int sig) {
    syslog(LOG_ERR, "bookpaged terminated by signal %d", sig);
    closelog();
    exit(1);
}

int main(int argc, char* argv[]) {

    // open syslog
    openlog("bookpaged", LOG_PID | LOG_CONS, LOG_DAEMON);

    // catch signals
    signal(SIGINT,  handleSignal);
    signal(SIGTERM, handleSignal);
    signal(SIGSEGV, handleSignal); // crash (segfault)

    try {
        ////////////////////////////////////////////////////////////////////////
        // configure the daemon
        //   optional argv[1] overrides $BOOKPAGED_CONF and the default path
        //
        if (sodium_init() < 0)
            throw std::runtime_error("libsodium failed to initialise");

        Config& cfg = Config::get();
        cfg.load(argc > 1 ? argv[1] : "");

        std::string msg = std::string("bookpaged ") + cfg.toString() + " starting";
        std::cout << msg << std::endl;
        syslog(LOG_INFO, "%s", msg.c_str());

        ////////////////////////////////////////////////////////////////////////
        // start sqlite server
        //
        Database::get().open(cfg.dbPath());

        FileBlobStore blobs(cfg.blobRoot(), cfg.blobUrl());

        ////////////////////////////////////////////////////////////////////////
        // start the server (app) and wait for http events/requests to roll in
        //
        registerRootHandler();
        registerUploadBookHandler(blobs);
        registerGetBookHandler(blobs);
        registerParseHandler(blobs);
        registerChaptersHandler();
        registerListHandler();
        registerProgressHandler();
        registerExtractCoversHandler(blobs);
        registerGetHandler();
        registerUpdateHandler();
        registerDeleteHandler();
        registerBlobHandler(blobs);
        std::cout << "Running..." << std::endl;

        drogon::app()
            .setClientMaxBodySize(cfg.maxFileSize())                   // limit upload requests to maxFileSize
            .setClientMaxMemoryBodySize(2 * 1024 * 1024)               // keep 2 MB in RAM, then packetize
            .setUploadPath(cfg.uploadPath())                           // temp dir for large files
            .setIdleConnectionTimeout(cfg.parseTimeout());             // a parse can keep a request busy this long

        if (cfg.threads() > 0)
            drogon::app().setThreadNum(static_cast<size_t>(cfg.threads()));

        drogon::app()
            .addListener(cfg.host(), static_cast<uint16_t>(cfg.port()))
            .run();

    } catch (const std::exception &ex) {
        logFatal(ex, 1);
    }

    syslog(LOG_INFO, "bookpaged shutting down");
    Database::get().close();
    closelog();
    return 0;
}
