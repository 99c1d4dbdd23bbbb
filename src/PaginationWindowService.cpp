#include <climits>

#include "PaginationWindowService.h"
#include "utils.h"

const char* windowStatusCode(WindowStatus st) {
    switch (st) {
        case WindowStatus::Ok:            return "ok";
        case WindowStatus::MissingBookId: return "invalid_request";
        case WindowStatus::BadRange:      return "invalid_request";
        case WindowStatus::NotFound:      return "not_found";
        case WindowStatus::NotReady:      return "not_ready";
    }
    return "server_error";
}

bool PaginationWindowService::parseRange(const std::string& fromParam, const std::string& toParam,
                                         int& from, int& to) {
    long long f = 0;
    if (!fromParam.empty() && !parseUnsigned(fromParam, f))
        return false;
    if (f < 0 || f > INT_MAX)
        return false;

    long long t = f + DEFAULT_WINDOW - 1;
    if (!toParam.empty() && !parseUnsigned(toParam, t))
        return false;
    if (t < f)
        return false;

    // silently shrink oversized windows
    if (t > f + MAX_WINDOW - 1)
        t = f + MAX_WINDOW - 1;
    if (t > INT_MAX)
        t = INT_MAX;

    from = static_cast<int>(f);
    to   = static_cast<int>(t);
    return true;
}

WindowStatus PaginationWindowService::checkBook(const std::string& bookId, BookRecord& book) {
    if (trim(bookId).empty())
        return WindowStatus::MissingBookId;
    if (!db_.getBook(bookId, book))
        return WindowStatus::NotFound;
    if (!book.parsed())
        return WindowStatus::NotReady;
    return WindowStatus::Ok;
}

WindowStatus PaginationWindowService::fetchMeta(const std::string& bookId, Json::Value& out) {
    BookRecord book;
    const WindowStatus st = checkBook(bookId, book);
    if (st != WindowStatus::Ok)
        return st;

    Json::Value chapters(Json::arrayValue);
    db_.listChapterMeta(bookId, chapters);

    out = Json::Value(Json::objectValue);
    out["totalChapters"]   = book.totalChapters;
    out["totalCharacters"] = static_cast<Json::Int64>(book.totalCharacters);
    out["styles"]          = book.styles;
    out["chapters"]        = chapters;
    return WindowStatus::Ok;
}

WindowStatus PaginationWindowService::fetchWindow(const std::string& bookId, const std::string& fromParam,
                                                  const std::string& toParam, Json::Value& out) {
    if (trim(bookId).empty())
        return WindowStatus::MissingBookId;

    int from = 0, to = 0;
    if (!parseRange(fromParam, toParam, from, to))
        return WindowStatus::BadRange;

    BookRecord book;
    const WindowStatus st = checkBook(bookId, book);
    if (st != WindowStatus::Ok)
        return st;

    Json::Value chapters(Json::arrayValue);
    db_.listChapterRange(bookId, from, to, chapters);

    out = Json::Value(Json::objectValue);
    out["chapters"] = chapters;
    return WindowStatus::Ok;
}
