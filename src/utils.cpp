// because Drogon redefines these, let's capture them as constants
// make sure this is done in utils.cpp before #including anything Drogon
#include "utils.h"  // this must be here to bring in externs (to keep C++ linker happy)
#include <syslog.h>
const int SYSLOG_INFO    = LOG_INFO;
const int SYSLOG_WARNING = LOG_WARNING;
const int SYSLOG_ERR     = LOG_ERR;
const int SYSLOG_DEBUG   = LOG_DEBUG;
// now you can safely include Drogon stuff if you want to...

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <vector>


// for logging fatal exceptions to syslog
[[noreturn]] void logFatal(const std::exception &ex, int exitCode) {
  std::string msg = std::string("Fatal: ") + ex.what();
  std::cerr << msg << std::endl;
  syslog(SYSLOG_ERR, "%s", msg.c_str());
  closelog();   // flush
  exit(exitCode);
}

// return UTC time at this moment in milliseconds
long long nowMs(void) {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// test for a 64-bit hex number
bool isHex64(std::string& s) {
    if (s.size() != 64) return false;
    for (auto& c : s) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c))); // normalize lowercase
    }
    return true;
}

std::string toLower(std::string s) {
    for (char& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string trim(const std::string& s) {
    const auto a = s.find_first_not_of(" \t\r\n\f\v");
    if (a == std::string::npos) return {};
    const auto b = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(a, b - a + 1);
}

bool endsWithNoCase(const std::string& s, const std::string& suffix) {
    if (suffix.size() > s.size()) return false;
    return toLower(s.substr(s.size() - suffix.size())) == toLower(suffix);
}

bool parseUnsigned(const std::string& s, long long& out) {
    if (s.empty() || s.size() > 18)
        return false;
    long long v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        v = v * 10 + (c - '0');
    }
    out = v;
    return true;
}

std::string dirName(const std::string& path) {
    const auto slash = path.rfind('/');
    return (slash == std::string::npos) ? std::string() : path.substr(0, slash + 1);
}

std::string baseName(const std::string& path) {
    const auto slash = path.rfind('/');
    return (slash == std::string::npos) ? path : path.substr(slash + 1);
}

std::string stripQueryAndFragment(const std::string& ref) {
    const auto cut = ref.find_first_of("?#");
    return (cut == std::string::npos) ? ref : ref.substr(0, cut);
}

// resolve "ref" against the directory of "docPath", collapsing "." and ".."
// a ref starting with '/' is archive-absolute
std::string resolveRelative(const std::string& docPath, const std::string& ref) {
    std::string joined = (!ref.empty() && ref[0] == '/') ? ref.substr(1) : dirName(docPath) + ref;

    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= joined.size()) {
        auto slash = joined.find('/', start);
        if (slash == std::string::npos) slash = joined.size();
        const std::string seg = joined.substr(start, slash - start);
        if (seg == "..") {
            if (!parts.empty()) parts.pop_back();  // can't climb above the archive root
        } else if (!seg.empty() && seg != ".") {
            parts.push_back(seg);
        }
        start = slash + 1;
    }

    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += '/';
        out += parts[i];
    }
    return out;
}

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// %XX decoding; malformed escapes are kept verbatim
std::string decodePercent(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            const int hi = hexValue(s[i + 1]);
            const int lo = hexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>((hi << 4) | lo);
                i += 2;
                continue;
            }
        }
        out += s[i];
    }
    return out;
}

// percent-encode everything except unreserved characters and '/'
std::string encodeUrlPath(const std::string& path) {
    static const char* HEX = "0123456789ABCDEF";
    std::string out;
    out.reserve(path.size());
    for (unsigned char c : path) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || c == '/') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        }
    }
    return out;
}

std::string mimeTypeForPath(const std::string& path) {
    const auto dot = path.rfind('.');
    const std::string ext = (dot == std::string::npos) ? std::string() : toLower(path.substr(dot + 1));

    if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
    if (ext == "png")   return "image/png";
    if (ext == "gif")   return "image/gif";
    if (ext == "webp")  return "image/webp";
    if (ext == "svg")   return "image/svg+xml";
    if (ext == "css")   return "text/css";
    if (ext == "ttf")   return "font/ttf";
    if (ext == "otf")   return "font/otf";
    if (ext == "woff")  return "font/woff";
    if (ext == "woff2") return "font/woff2";
    if (ext == "xhtml" || ext == "html" || ext == "htm") return "application/xhtml+xml";
    if (ext == "epub")  return "application/epub+zip";
    if (ext == "pdf")   return "application/pdf";
    return "application/octet-stream";
}

long long utf8Length(const char* s, size_t len) {
    long long n = 0;
    for (size_t i = 0; i < len; ++i) {
        if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) ++n;  // skip continuation bytes
    }
    return n;
}
