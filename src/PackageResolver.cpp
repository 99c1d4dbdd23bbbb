#include <syslog.h>

#include "PackageResolver.h"
#include "markup.h"
#include "utils.h"

static const char* CONTAINER_XML = "META-INF/container.xml";

const std::vector<std::string>& PackageResolver::conventionalCoverNames() {
    static const std::vector<std::string> names = {
        "cover.jpg", "cover.jpeg", "cover.png", "cover.gif",
        "Cover.jpg", "Cover.jpeg", "Cover.png"
    };
    return names;
}

// full-path of the first <rootfile>, whatever the attribute order or quoting
bool PackageResolver::rootfilePath(const std::string& containerXml, std::string& out) {
    for (const auto& tag : findTags(containerXml, "rootfile")) {
        const std::string path = tag.attrValue("full-path");
        if (!path.empty()) {
            out = path;
            return true;
        }
    }
    return false;
}

bool PackageResolver::resolve(const ContainerReader::Entries& entries, PackageInfo& out) {
    out = PackageInfo();

    auto it = entries.find(CONTAINER_XML);
    if (it == entries.end()) {
        syslog(SYSLOG_DEBUG, "PackageResolver: no %s", CONTAINER_XML);
        return false;
    }

    std::string opfPath;
    if (!rootfilePath(it->second, opfPath)) {
        syslog(SYSLOG_DEBUG, "PackageResolver: container.xml has no rootfile");
        return false;
    }
    if (!opfPath.empty() && opfPath[0] == '/') opfPath.erase(0, 1);

    auto opfIt = entries.find(opfPath);
    if (opfIt == entries.end()) {
        syslog(SYSLOG_DEBUG, "PackageResolver: OPF [%s] not in archive", opfPath.c_str());
        return false;
    }
    const std::string& opf = opfIt->second;

    out.opfPath = opfPath;
    out.opfDir  = dirName(opfPath);

    // metadata: first match wins, absence is fine
    firstElementText(opf, "dc:title",   out.title);
    firstElementText(opf, "dc:creator", out.author);

    for (const auto& tag : findTags(opf, "item")) {
        ManifestItem item;
        item.id         = tag.attrValue("id");
        item.href       = tag.attrValue("href");
        item.mediaType  = tag.attrValue("media-type");
        item.properties = tag.attrValue("properties");
        if (item.id.empty() || item.href.empty()) continue;
        out.manifest.emplace(item.id, item);     // first declaration of an id wins
    }

    for (const auto& tag : findTags(opf, "itemref")) {
        const std::string idref = tag.attrValue("idref");
        auto m = out.manifest.find(idref);
        if (m == out.manifest.end()) {
            syslog(SYSLOG_WARNING, "PackageResolver: spine idref [%s] not in manifest", idref.c_str());
            continue;
        }
        SpineItem s;
        s.idref = idref;
        s.href  = m->second.href;
        s.path  = resolveRelative(opfPath, decodePercent(stripQueryAndFragment(m->second.href)));
        out.spine.push_back(std::move(s));
    }

    out.coverHref = findCoverHref(entries, opf, out);
    return true;
}

std::string PackageResolver::findCoverHref(const ContainerReader::Entries& entries, const std::string& opf,
                                           const PackageInfo& pkg) {
    // (a) <item properties="... cover-image ..."> in any attribute order
    for (const auto& tag : findTags(opf, "item")) {
        if (tag.attrValue("properties").find("cover-image") != std::string::npos) {
            const std::string href = tag.attrValue("href");
            if (!href.empty()) return href;
        }
    }

    // (b) <meta name="cover" content="ID"> -> <item id="ID">
    for (const auto& tag : findTags(opf, "meta")) {
        if (tag.attrValue("name") != "cover") continue;
        const std::string coverId = tag.attrValue("content");
        if (coverId.empty()) continue;
        auto m = pkg.manifest.find(coverId);
        if (m != pkg.manifest.end()) return m->second.href;
    }

    // (c) conventional names at the root, beside the OPF, or in an images folder
    for (const auto& name : conventionalCoverNames()) {
        if (!pkg.opfDir.empty() && entries.count(pkg.opfDir + name)) return name;
        for (const std::string& dir : {std::string(), std::string("images/"), std::string("Images/")}) {
            if (entries.count(dir + name)) {
                const std::string path = dir + name;
                // relative to the OPF where possible, otherwise archive-absolute
                if (!pkg.opfDir.empty() && path.compare(0, pkg.opfDir.size(), pkg.opfDir) == 0)
                    return path.substr(pkg.opfDir.size());
                return pkg.opfDir.empty() ? path : "/" + path;
            }
        }
    }
    return {};
}
