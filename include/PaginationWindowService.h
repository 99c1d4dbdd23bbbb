#ifndef BOOKPAGED_PAGINATIONWINDOWSERVICE_H
#define BOOKPAGED_PAGINATIONWINDOWSERVICE_H

#include <string>

#include <json/value.h>

#include "Database.h"

enum class WindowStatus {
    Ok,
    MissingBookId,
    BadRange,       // from < 0, to < from, or not an integer
    NotFound,
    NotReady,       // uploaded but never parsed
};

// wire error code for a failed status ("invalid_request", "not_found", "not_ready")
const char* windowStatusCode(WindowStatus st);

//
// PaginationWindowService: the two reads a reading client makes.  Metadata
// once (no html) to estimate pages, then windows of chapter content as it
// scrolls.
//
class PaginationWindowService {
public:
    static constexpr int MAX_WINDOW     = 20;   // chapters per window, hard ceiling
    static constexpr int DEFAULT_WINDOW = 10;   // to = from + 9 when not given

    explicit PaginationWindowService(Database& db) : db_(db) {}

    // out: {totalChapters, totalCharacters, styles, chapters:[{chapterIndex, href, charOffset, charLength}]}
    WindowStatus fetchMeta(const std::string& bookId, Json::Value& out);

    // from/to are the raw query parameters (empty = not given)
    // out: {chapters:[{chapterIndex, href, html, charOffset, charLength}]}, to clamped to from+19
    WindowStatus fetchWindow(const std::string& bookId, const std::string& fromParam,
                             const std::string& toParam, Json::Value& out);

    // apply defaults, validate and clamp.  RETURNS false on a bad range.
    static bool parseRange(const std::string& fromParam, const std::string& toParam, int& from, int& to);

private:
    Database& db_;

    WindowStatus checkBook(const std::string& bookId, BookRecord& book);
};

#endif // BOOKPAGED_PAGINATIONWINDOWSERVICE_H
