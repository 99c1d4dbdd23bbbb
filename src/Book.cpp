#include <array>

#include "Book.h"

Json::Value BookRecord::toJson() const {
    Json::Value b(Json::objectValue);
    b["id"]              = id;
    b["title"]           = title;
    b["author"]          = author;
    b["format"]          = format;
    b["cover"]           = cover.empty() ? Json::Value(Json::nullValue) : Json::Value(cover);
    b["filename"]        = filename;
    b["filesize"]        = static_cast<Json::Int64>(filesize);
    b["sha256"]          = sha256;
    b["totalChapters"]   = totalChapters;
    b["totalCharacters"] = static_cast<Json::Int64>(totalCharacters);
    b["parsedAt"]        = parsedAt ? Json::Value(static_cast<Json::Int64>(parsedAt)) : Json::Value(Json::nullValue);
    b["createdAt"]       = static_cast<Json::Int64>(createdAt);
    return b;
}

bool isSupportedFormat(const std::string& format) {
    static const std::array<const char*, 7> FORMATS = {"epub", "pdf", "txt", "md", "html", "mobi", "azw3"};
    for (const char* f : FORMATS)
        if (format == f) return true;
    return false;
}

bool readTimeDeltaFromJson(const Json::Value& v, long long& secondsOut) {
    if (!v.isNumeric())
        return false;

    // clamp as a double: the JSON number may not fit a long long at all
    const double secs = v.asDouble();
    if (!(secs > 0))
        secondsOut = 0;
    else if (secs >= static_cast<double>(MAX_READ_TIME_DELTA))
        secondsOut = MAX_READ_TIME_DELTA;
    else
        secondsOut = static_cast<long long>(secs);
    return true;
}
