#ifndef BOOKPAGED_BOOKINGEST_H
#define BOOKPAGED_BOOKINGEST_H

#include <mutex>
#include <set>
#include <string>

#include "BlobStore.h"
#include "Book.h"
#include "CoverExtractor.h"
#include "Database.h"

enum class ParseStatus {
    Parsed,
    AlreadyParsed,      // parsedAt set and no re-parse asked for
    NotFound,
    NotEpub,
    NotParseable,       // original missing, not a ZIP, no OPF, or no chapter survived
    InProgress,         // another request is parsing this book right now
};

// wire error code for a failed status
const char* parseStatusCode(ParseStatus st);

// what an EPUB upload tells us about itself
struct UploadMetadata {
    std::string title;
    std::string author;
    bool hasCover = false;
    CoverImage cover;
};

struct ParseSummary {
    int totalChapters         = 0;
    long long totalCharacters = 0;
    int skipped               = 0;      // spine items that didn't make it
    int resources             = 0;      // assets published to the blob store
};

//
// BookIngest: everything between "bytes arrived" and "chapters are in the
// database".  Upload stores the original and pulls out metadata + cover;
// parse segments the stored original into chapters.
//
class BookIngest {
public:
    BookIngest(Database& db, BlobStore& blobs) : db_(db), blobs_(blobs) {}

    // Metadata and cover straight from the container.
    // RETURNS: false if the bytes aren't a readable EPUB (out left empty)
    static bool inspectEpub(const std::string& bytes, UploadMetadata& out);

    // Store the original, extract epub metadata/cover, insert the row.
    //   book: id, owner, format, filename, filesize, sha256 filled in by the caller;
    //         title/author as given by the client (may be empty)
    //   A broken EPUB never fails the upload; it just has no cover.
    //   throws std::runtime_error if the original can't be stored or the row can't be written
    void createBook(BookRecord& book, const std::string& bytes);

    // Segment a stored EPUB into chapters.  force re-parses a book that is already parsed.
    ParseStatus parseBook(const std::string& bookId, bool force, ParseSummary& out);

    // Extract covers (and blank metadata) for an owner's EPUBs that have none.
    // RETURNS: books updated; totalOut = books looked at
    int backfillCovers(const std::string& owner, int& totalOut);

    // blob keys
    static std::string originalKey(const std::string& bookId, const std::string& format);
    static std::string coverKey(const std::string& bookId, const std::string& ext);
    static std::string resourcePrefix(const std::string& bookId);

    // "my-book_v2.epub" -> "my book v2"
    static std::string titleFromFilename(const std::string& filename);

private:
    Database& db_;
    BlobStore& blobs_;

    // RETURNS: cover URL, or empty if it couldn't be stored
    std::string storeCover(const std::string& bookId, const CoverImage& cover);

    // books being parsed right now, across all handler threads
    static std::mutex parsingMu_;
    static std::set<std::string> parsing_;

    // holds a book's slot in parsing_ for the lifetime of a parse
    class ParseLock {
    public:
        explicit ParseLock(const std::string& bookId);
        ~ParseLock();
        ParseLock(const ParseLock&) = delete;
        ParseLock& operator=(const ParseLock&) = delete;

        bool acquired() const { return acquired_; }

    private:
        std::string bookId_;
        bool acquired_ = false;
    };
};

#endif // BOOKPAGED_BOOKINGEST_H
