#include <syslog.h>

#include "CoverExtractor.h"
#include "utils.h"

void CoverExtractor::typeForHref(const std::string& href, std::string& contentType, std::string& ext) {
    contentType = "image/jpeg";
    ext = "jpg";
    if      (endsWithNoCase(href, ".png"))  { contentType = "image/png";     ext = "png"; }
    else if (endsWithNoCase(href, ".gif"))  { contentType = "image/gif";     ext = "gif"; }
    else if (endsWithNoCase(href, ".webp")) { contentType = "image/webp";    ext = "webp"; }
    else if (endsWithNoCase(href, ".svg"))  { contentType = "image/svg+xml"; ext = "svg"; }
}

bool CoverExtractor::extract(const ContainerReader::Entries& entries, const PackageInfo& pkg, CoverImage& out) {
    if (pkg.coverHref.empty())
        return false;

    const std::string decoded = decodePercent(pkg.coverHref);
    // opfDir ends with '/', so it serves as its own document path here
    const std::string resolved = resolveRelative(pkg.opfDir, decoded);

    // EPUBs are inconsistent about encoding hrefs, so try a few spellings
    const std::string* data = nullptr;
    for (const std::string& key : {resolved, pkg.coverHref, decoded}) {
        auto it = entries.find(key);
        if (it != entries.end()) {
            data = &it->second;
            break;
        }
    }
    if (!data || data->empty()) {
        syslog(SYSLOG_DEBUG, "CoverExtractor: cover [%s] not found in archive", pkg.coverHref.c_str());
        return false;
    }

    out.bytes = *data;
    typeForHref(decoded, out.contentType, out.ext);
    return true;
}
