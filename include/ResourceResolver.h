#ifndef BOOKPAGED_RESOURCERESOLVER_H
#define BOOKPAGED_RESOURCERESOLVER_H

#include <map>
#include <string>
#include <unordered_map>

#include "BlobStore.h"
#include "ContainerReader.h"

//
// ResourceResolver: maps an asset reference found inside a chapter
// (img src, stylesheet href, ...) to an archive entry, and re-hosts that
// entry in the blob store so the reader can fetch it by URL.
//
class ResourceResolver {
public:
    // blobs are published under "<keyPrefix><archive path>"
    ResourceResolver(const ContainerReader::Entries& entries, BlobStore& blobs, std::string keyPrefix);

    // Find the archive entry for ref as used in the document at docPath.
    //   tries: resolved path, raw ref, raw ref without "./", decoded resolved path, bare filename
    // RETURNS: false if none of those match (the reference is missing)
    bool locate(const std::string& ref, const std::string& docPath, std::string& archivePathOut) const;

    // locate() + publish to the blob store (once per entry).
    // RETURNS: false if the reference is missing or couldn't be published
    bool resolve(const std::string& ref, const std::string& docPath, std::string& urlOut);

    // references we never rewrite
    static bool isExternal(const std::string& ref);

    int published() const { return static_cast<int>(urls_.size()); }

private:
    const ContainerReader::Entries& entries_;
    BlobStore& blobs_;
    std::string keyPrefix_;
    std::map<std::string, std::string> byBaseName_;             // filename -> first archive path
    std::unordered_map<std::string, std::string> urls_;         // archive path -> published URL

    bool has(const std::string& path) const { return entries_.count(path) != 0; }
};

#endif // BOOKPAGED_RESOURCERESOLVER_H
