#ifndef BOOKPAGED_DHUTILS_H
#define BOOKPAGED_DHUTILS_H

#include <string>
#include <drogon/drogon.h>

// helpers shared by the drogon handlers
bool parseItemId(const Json::Value& v, long long& out);
std::string toJsonString(const Json::Value& v);
std::string sha256Hex(const std::string& bytes);

// HTTP status for an error code in a JSON reply
drogon::HttpStatusCode statusForError(const std::string& code);

#endif // BOOKPAGED_DHUTILS_H
