#ifndef BOOKPAGED_PACKAGERESOLVER_H
#define BOOKPAGED_PACKAGERESOLVER_H

#include <map>
#include <string>
#include <vector>

#include "ContainerReader.h"

struct ManifestItem {
    std::string id;
    std::string href;          // as declared, relative to the OPF
    std::string mediaType;
    std::string properties;
};

struct SpineItem {
    std::string idref;
    std::string href;          // as declared in the manifest (chapter identity)
    std::string path;          // archive path of the document
};

// What the OCF/OPF tells us about a book
struct PackageInfo {
    std::string opfPath;
    std::string opfDir;        // "" or ends with '/'
    std::string title;         // empty if absent
    std::string author;        // empty if absent
    std::string coverHref;     // relative to opfDir, or archive-absolute with a leading '/'
    std::map<std::string, ManifestItem> manifest;   // by id
    std::vector<SpineItem> spine;                   // reading order, exactly as listed
};

class PackageResolver {
public:
    // RETURNS: false if container.xml, its rootfile or the OPF document is missing
    static bool resolve(const ContainerReader::Entries& entries, PackageInfo& out);

    // Conventional cover file names probed when the OPF doesn't declare one
    static const std::vector<std::string>& conventionalCoverNames();

private:
    static bool rootfilePath(const std::string& containerXml, std::string& out);
    static std::string findCoverHref(const ContainerReader::Entries& entries, const std::string& opf,
                                     const PackageInfo& pkg);
};

#endif // BOOKPAGED_PACKAGERESOLVER_H
