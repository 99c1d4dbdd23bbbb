#ifndef BOOKPAGED_UTILS_H
#define BOOKPAGED_UTILS_H

#include <exception>
#include <string>

// because Drogon redefines these, let's capture them as constants
extern const int SYSLOG_INFO, SYSLOG_WARNING, SYSLOG_ERR, SYSLOG_DEBUG;

// functions
[[noreturn]] void logFatal(const std::exception &ex, int exitCode);
long long nowMs(void);
bool isHex64(std::string& s);

// string helpers
std::string toLower(std::string s);
std::string trim(const std::string& s);
bool endsWithNoCase(const std::string& s, const std::string& suffix);

// archive path helpers (always '/' separated, never a leading '/')
std::string dirName(const std::string& path);        // "a/b/c.html" -> "a/b/" ; "c.html" -> ""
std::string baseName(const std::string& path);       // "a/b/c.html" -> "c.html"
std::string stripQueryAndFragment(const std::string& ref);
std::string resolveRelative(const std::string& docPath, const std::string& ref);
std::string decodePercent(const std::string& s);
std::string encodeUrlPath(const std::string& path);
std::string mimeTypeForPath(const std::string& path);

// whole-string base-10 number of at most 18 digits: no sign, no spaces
bool parseUnsigned(const std::string& s, long long& out);

// number of unicode code points in a UTF-8 string
long long utf8Length(const char* s, size_t len);

#endif // BOOKPAGED_UTILS_H
