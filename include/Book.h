#ifndef BOOKPAGED_BOOK_H
#define BOOKPAGED_BOOK_H

#include <string>

#include <json/value.h>

// one row of "books"
struct BookRecord {
    std::string id;                 // server UUID
    std::string owner;              // uploading user
    std::string title;
    std::string author;
    std::string format;             // epub, pdf, txt, md, html, mobi, azw3
    std::string cover;              // blob URL, empty if none
    std::string location;           // blob key of the original file
    std::string filename;           // client's name for the file
    long long filesize = 0;
    std::string sha256;
    int totalChapters = 0;
    long long totalCharacters = 0;
    std::string styles;
    long long parsedAt  = 0;        // 0 = uploaded but never segmented
    long long createdAt = 0;

    bool parsed() const { return parsedAt != 0; }

    // client view (no location, no styles)
    Json::Value toJson() const;
};

// one page of the library listing
struct BookListQuery {
    std::string search;             // title or author contains this (case-insensitive); empty = all
    std::string sort = "recent";    // recent (last read, else added) | added | title
    int page  = 1;                  // from 1
    int limit = 20;                 // 1..MAX_LIST_LIMIT
};

constexpr int MAX_LIST_LIMIT = 50;

// formats the upload endpoint accepts
bool isSupportedFormat(const std::string& format);

// upper bound on the reading time one progress save may report (secs)
constexpr long long MAX_READ_TIME_DELTA = 24 * 60 * 60;

// readTimeDelta of a progress save, as whole seconds in [0, MAX_READ_TIME_DELTA]
// RETURNS: false if v is not a number
bool readTimeDeltaFromJson(const Json::Value& v, long long& secondsOut);

#endif // BOOKPAGED_BOOK_H
