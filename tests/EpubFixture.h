#ifndef BOOKPAGED_TESTS_EPUBFIXTURE_H
#define BOOKPAGED_TESTS_EPUBFIXTURE_H

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "BlobStore.h"

//
// ZipBuilder: writes a PKZIP archive into memory.
//   add() stores or deflates (raw, -MAX_WBITS) for real; addRaw() writes the
//   payload verbatim under any method id, for broken or unsupported entries.
//
class ZipBuilder {
public:
    static constexpr uint16_t STORE   = 0;
    static constexpr uint16_t DEFLATE = 8;

    void add(const std::string& name, const std::string& data, uint16_t method = DEFLATE);
    void addRaw(const std::string& name, const std::string& payload, uint16_t method, uint32_t uncompressedSize);
    void addDirectory(const std::string& name);

    std::string build(const std::string& comment = "") const;

    static std::string deflateRaw(const std::string& data);

private:
    struct Entry {
        std::string name;
        std::string payload;
        uint16_t method = STORE;
        uint32_t crc = 0;
        uint32_t uncompressedSize = 0;
    };
    std::vector<Entry> entries_;
};

//
// EpubBuilder: a small but well-formed EPUB 3 package.
//
class EpubBuilder {
public:
    std::string opfPath = "OEBPS/content.opf";
    std::string title;
    std::string author;
    std::string extraMetadata;       // raw lines inside <metadata>

    // href is relative to the OPF; content goes to the archive at the resolved path
    void addItem(const std::string& id, const std::string& href, const std::string& mediaType,
                 const std::string& content, const std::string& properties = "");
    // manifest entry only (content not in the archive)
    void declareItem(const std::string& id, const std::string& href, const std::string& mediaType,
                     const std::string& properties = "");
    void addToSpine(const std::string& idref) { spine_.push_back(idref); }
    // archive entry that isn't in the manifest
    void addFile(const std::string& path, const std::string& content) { files_[path] = content; }

    // "chapter" + spine in one go
    void addChapter(const std::string& id, const std::string& href, const std::string& body);

    std::string opf() const;
    std::string build() const;

private:
    struct Item {
        std::string id, href, mediaType, properties;
    };
    std::vector<Item> manifest_;
    std::vector<std::string> spine_;
    std::map<std::string, std::string> files_;
};

// <html><head>{head}</head><body>{body}</body></html> with the XHTML namespace
std::string xhtmlDocument(const std::string& body, const std::string& head = "");

// 10 chapters of "Chapter N" text, a cover at OEBPS/cover.jpg (properties="cover-image")
std::string tenChapterEpub();

//
// MemoryBlobStore: BlobStore kept in a map.  urlFor() is "mem://<key>".
//
class MemoryBlobStore : public BlobStore {
public:
    struct Blob {
        std::string bytes;
        std::string contentType;
    };

    bool get(const std::string& key, std::string& bytesOut) override;
    void put(const std::string& key, const std::string& bytes, const std::string& contentType) override;
    std::string urlFor(const std::string& key) const override { return "mem://" + key; }

    std::map<std::string, Blob> blobs;
    int puts = 0;
    bool failPuts = false;      // put() throws while set
};

#endif // BOOKPAGED_TESTS_EPUBFIXTURE_H
