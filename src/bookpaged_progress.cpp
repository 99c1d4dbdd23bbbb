//
// bookpaged-progress: feeds reading positions to a bookpaged server the way
// a reading client does.
//
//   usage: bookpaged-progress <http://host:port> <token> <bookId>
//
//   stdin, one event per line:
//     <percentage> [location]     reader moved
//     hide                        reader went away (sends a beacon)
//   end of input behaves like "hide".
//
#include <iostream>
#include <sstream>
#include <string>
#include <poll.h>
#include <syslog.h>
#include <unistd.h>

#include "ProgressClient.h"
#include "ReadingPositionTracker.h"
#include "utils.h"

static constexpr int TICK_MS = 250;

int main(int argc, char* argv[]) {
    if (argc != 4) {
        std::cerr << "usage: " << argv[0] << " <http://host:port> <token> <bookId>" << std::endl;
        return 2;
    }
    openlog("bookpaged-progress", LOG_PID | LOG_PERROR, LOG_USER);

    const std::string bookId = argv[3];
    try {
        ProgressClient client(argv[1], argv[2]);
        ReadingPositionTracker tracker(bookId, client, nowMs());

        double pct = 0;
        std::string loc;
        if (client.fetch(bookId, pct, loc) && tracker.applyServerProgress(pct, loc))
            std::cout << "resuming at " << pct << "%" << (loc.empty() ? "" : " (" + loc + ")") << std::endl;

        double shown = -1;
        bool done = false;
        while (!done) {
            // lines already buffered by cin don't show up in poll()
            pollfd pfd{STDIN_FILENO, POLLIN, 0};
            const int rc = std::cin.rdbuf()->in_avail() > 0 ? 1 : poll(&pfd, 1, TICK_MS);
            if (rc < 0) {
                syslog(SYSLOG_ERR, "poll: %m");
                break;
            }

            if (rc > 0) {
                std::string line;
                if (!std::getline(std::cin, line) || trim(line) == "hide") {
                    done = true;
                } else if (!trim(line).empty()) {
                    std::istringstream in(line);
                    double p = 0;
                    if (in >> p) {
                        std::string rest;
                        std::getline(in, rest);
                        tracker.navigate(p, trim(rest), nowMs());
                    } else {
                        std::cerr << "ignored: " << line << std::endl;
                    }
                }
            }

            tracker.tick(nowMs());
            if (tracker.displayPercentage() != shown) {
                shown = tracker.displayPercentage();
                std::cout << "progress " << shown << "%" << std::endl;
            }
        }

        tracker.hide(nowMs());
        if (!client.waitIdle(std::chrono::milliseconds(5000)))
            std::cerr << "some saves were still in flight" << std::endl;
        std::cout << "read for " << tracker.totalReadTime() << "s, "
                  << client.failures() << " failed saves" << std::endl;
        closelog();
        return client.failures() == 0 ? 0 : 1;
    } catch (const std::exception& ex) {
        logFatal(ex, 1);
    }
}
