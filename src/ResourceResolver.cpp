#include <syslog.h>

#include "ResourceResolver.h"
#include "utils.h"

ResourceResolver::ResourceResolver(const ContainerReader::Entries& entries, BlobStore& blobs, std::string keyPrefix)
    : entries_(entries), blobs_(blobs), keyPrefix_(std::move(keyPrefix)) {
    // entries are sorted, so the first path with a given filename is deterministic
    for (const auto& e : entries_)
        byBaseName_.emplace(baseName(e.first), e.first);
}

bool ResourceResolver::isExternal(const std::string& ref) {
    const std::string lower = toLower(ref.substr(0, 8));
    return lower.compare(0, 5, "data:") == 0 || lower.compare(0, 5, "blob:") == 0 ||
           lower.compare(0, 5, "http:") == 0 || lower.compare(0, 6, "https:") == 0;
}

bool ResourceResolver::locate(const std::string& ref, const std::string& docPath, std::string& archivePathOut) const {
    const std::string raw = stripQueryAndFragment(trim(ref));
    if (raw.empty() || isExternal(raw))
        return false;

    // 1. relative to the referencing document
    const std::string resolved = resolveRelative(docPath, raw);
    if (has(resolved)) { archivePathOut = resolved; return true; }

    // 2. as given
    if (has(raw)) { archivePathOut = raw; return true; }

    // 3. without a leading "./"
    if (raw.compare(0, 2, "./") == 0 && has(raw.substr(2))) {
        archivePathOut = raw.substr(2);
        return true;
    }

    // 4. percent-decoded
    const std::string decoded = decodePercent(resolved);
    if (decoded != resolved && has(decoded)) { archivePathOut = decoded; return true; }

    // 5. last resort: the bare filename
    const std::string base = baseName(raw);
    if (!base.empty()) {
        auto it = byBaseName_.find(base);
        if (it == byBaseName_.end()) it = byBaseName_.find(decodePercent(base));
        if (it != byBaseName_.end()) { archivePathOut = it->second; return true; }
    }
    return false;
}

bool ResourceResolver::resolve(const std::string& ref, const std::string& docPath, std::string& urlOut) {
    std::string path;
    if (!locate(ref, docPath, path))
        return false;

    auto cached = urls_.find(path);
    if (cached != urls_.end()) {
        urlOut = cached->second;
        return true;
    }

    const std::string key = keyPrefix_ + path;
    try {
        blobs_.put(key, entries_.at(path), mimeTypeForPath(path));
    } catch (const std::exception& ex) {
        syslog(SYSLOG_WARNING, "ResourceResolver: publishing [%s] failed: %s", path.c_str(), ex.what());
        return false;
    }

    urlOut = blobs_.urlFor(key);
    urls_.emplace(path, urlOut);
    return true;
}
