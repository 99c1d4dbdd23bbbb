#ifndef BOOKPAGED_COVEREXTRACTOR_H
#define BOOKPAGED_COVEREXTRACTOR_H

#include <string>

#include "ContainerReader.h"
#include "PackageResolver.h"

struct CoverImage {
    std::string bytes;
    std::string contentType;   // image/jpeg, image/png, ...
    std::string ext;           // jpg, png, ...
};

class CoverExtractor {
public:
    // RETURNS: false if the package names no cover or the cover entry is missing/empty
    static bool extract(const ContainerReader::Entries& entries, const PackageInfo& pkg, CoverImage& out);

    // Content type by file extension only (no byte sniffing). Unknown -> jpeg.
    static void typeForHref(const std::string& href, std::string& contentType, std::string& ext);
};

#endif // BOOKPAGED_COVEREXTRACTOR_H
