#include <sodium.h>

#include "dhutils.h"
#include "utils.h"

// Accept integer in JSON either as number or stringified digits
bool parseItemId(const Json::Value& v, long long& out) {
    if (v.isInt64()) { out = v.asInt64(); return out >= 0; }
    if (v.isString())
        return parseUnsigned(v.asString(), out);
    return false;
}

// stringify JSON fields (locations may be objects) if not already a string
std::string toJsonString(const Json::Value& v) {
    if (v.isString()) return v.asString();
    Json::StreamWriterBuilder wb; wb["indentation"] = "";
    return Json::writeString(wb, v);
}

std::string sha256Hex(const std::string& bytes) {
    unsigned char out[crypto_hash_sha256_BYTES];
    crypto_hash_sha256(out, reinterpret_cast<const unsigned char*>(bytes.data()), bytes.size());
    char hex[crypto_hash_sha256_BYTES * 2 + 1];
    sodium_bin2hex(hex, sizeof hex, out, sizeof out);
    return std::string(hex);
}

drogon::HttpStatusCode statusForError(const std::string& code) {
    if (code == "unauthorised")      return drogon::k401Unauthorized;
    if (code == "not_found")         return drogon::k404NotFound;
    if (code == "too_large")         return drogon::k413RequestEntityTooLarge;
    if (code == "not_ready")         return drogon::k409Conflict;
    if (code == "parse_in_progress") return drogon::k409Conflict;
    if (code == "server_error")      return drogon::k500InternalServerError;
    return drogon::k400BadRequest;      // invalid_request, unsupported_format, not_epub, ...
}
