#include <stdexcept>
#include <syslog.h>

#include "BookIngest.h"
#include "ChapterSegmenter.h"
#include "ContainerReader.h"
#include "PackageResolver.h"
#include "ResourceResolver.h"
#include "utils.h"

std::mutex BookIngest::parsingMu_;
std::set<std::string> BookIngest::parsing_;

const char* parseStatusCode(ParseStatus st) {
    switch (st) {
        case ParseStatus::Parsed:        return "ok";
        case ParseStatus::AlreadyParsed: return "ok";
        case ParseStatus::NotFound:      return "not_found";
        case ParseStatus::NotEpub:       return "not_epub";
        case ParseStatus::NotParseable:  return "not_parseable";
        case ParseStatus::InProgress:    return "parse_in_progress";
    }
    return "server_error";
}

BookIngest::ParseLock::ParseLock(const std::string& bookId) : bookId_(bookId) {
    std::lock_guard<std::mutex> lk(parsingMu_);
    acquired_ = parsing_.insert(bookId_).second;
}

BookIngest::ParseLock::~ParseLock() {
    if (!acquired_) return;
    std::lock_guard<std::mutex> lk(parsingMu_);
    parsing_.erase(bookId_);
}

std::string BookIngest::originalKey(const std::string& bookId, const std::string& format) {
    return "books/" + bookId + "/" + bookId + "." + format;
}

std::string BookIngest::coverKey(const std::string& bookId, const std::string& ext) {
    return "books/" + bookId + "/" + bookId + "-cover." + ext;
}

std::string BookIngest::resourcePrefix(const std::string& bookId) {
    return "books/" + bookId + "/res/";
}

std::string BookIngest::titleFromFilename(const std::string& filename) {
    std::string t = baseName(filename);
    const auto dot = t.rfind('.');
    if (dot != std::string::npos && dot > 0)
        t.erase(dot);
    for (char& c : t)
        if (c == '-' || c == '_') c = ' ';
    return t;
}

bool BookIngest::inspectEpub(const std::string& bytes, UploadMetadata& out) {
    out = UploadMetadata();

    ContainerReader::Entries entries;
    if (!ContainerReader::read(bytes, entries))
        return false;

    PackageInfo pkg;
    if (!PackageResolver::resolve(entries, pkg))
        return false;

    out.title  = pkg.title;
    out.author = pkg.author;
    out.hasCover = CoverExtractor::extract(entries, pkg, out.cover);
    return true;
}

std::string BookIngest::storeCover(const std::string& bookId, const CoverImage& cover) {
    const std::string key = coverKey(bookId, cover.ext);
    try {
        blobs_.put(key, cover.bytes, cover.contentType);
    } catch (const std::exception& ex) {
        syslog(SYSLOG_WARNING, "cover for [%s] not stored: %s", bookId.c_str(), ex.what());
        return {};
    }
    return blobs_.urlFor(key);
}

void BookIngest::createBook(BookRecord& book, const std::string& bytes) {
    book.location = originalKey(book.id, book.format);
    blobs_.put(book.location, bytes, mimeTypeForPath(book.location));

    UploadMetadata meta;
    if (book.format == "epub") {
        if (inspectEpub(bytes, meta)) {
            if (meta.hasCover)
                book.cover = storeCover(book.id, meta.cover);
        } else {
            syslog(SYSLOG_WARNING, "upload [%s]: no readable EPUB package, keeping it without metadata",
                   book.id.c_str());
        }
    }

    // client's choice, then the package's, then the file name
    if (book.title.empty())  book.title  = meta.title;
    if (book.title.empty())  book.title  = titleFromFilename(book.filename);
    if (book.author.empty()) book.author = meta.author;

    if (book.createdAt == 0)
        book.createdAt = nowMs();
    db_.insertBook(book);

    syslog(SYSLOG_INFO, "book [%s] \"%s\" uploaded by %s (%s, %lld bytes, cover=%s)", book.id.c_str(),
           book.title.c_str(), book.owner.c_str(), book.format.c_str(), book.filesize,
           book.cover.empty() ? "no" : "yes");
}

ParseStatus BookIngest::parseBook(const std::string& bookId, bool force, ParseSummary& out) {
    out = ParseSummary();

    BookRecord book;
    if (!db_.getBook(bookId, book))
        return ParseStatus::NotFound;
    if (book.format != "epub")
        return ParseStatus::NotEpub;
    if (book.parsed() && !force) {
        out.totalChapters   = book.totalChapters;
        out.totalCharacters = book.totalCharacters;
        return ParseStatus::AlreadyParsed;
    }

    ParseLock lock(bookId);
    if (!lock.acquired())
        return ParseStatus::InProgress;

    // someone may have finished a parse while we were getting here
    if (!force && db_.getBook(bookId, book) && book.parsed()) {
        out.totalChapters   = book.totalChapters;
        out.totalCharacters = book.totalCharacters;
        return ParseStatus::AlreadyParsed;
    }

    std::string bytes;
    if (!blobs_.get(book.location, bytes)) {
        syslog(SYSLOG_ERR, "parse [%s]: original [%s] missing from blob store", bookId.c_str(), book.location.c_str());
        return ParseStatus::NotParseable;
    }

    ContainerReader::Entries entries;
    ContainerReader::Stats stats;
    if (!ContainerReader::read(bytes, entries, &stats)) {
        syslog(SYSLOG_WARNING, "parse [%s]: not a ZIP container", bookId.c_str());
        return ParseStatus::NotParseable;
    }
    bytes.clear();
    bytes.shrink_to_fit();

    PackageInfo pkg;
    if (!PackageResolver::resolve(entries, pkg) || pkg.spine.empty()) {
        syslog(SYSLOG_WARNING, "parse [%s]: no usable OPF package", bookId.c_str());
        return ParseStatus::NotParseable;
    }

    ResourceResolver resources(entries, blobs_, resourcePrefix(bookId));
    ChapterSegmenter segmenter(entries, resources);
    const SegmentResult result = segmenter.segment(pkg.spine);

    if (result.chapters.empty()) {
        syslog(SYSLOG_WARNING, "parse [%s]: none of %zu spine items could be segmented", bookId.c_str(),
               pkg.spine.size());
        return ParseStatus::NotParseable;
    }

    out.totalCharacters = db_.replaceBookChapters(bookId, result.chapters, result.styles, nowMs());
    out.totalChapters   = static_cast<int>(result.chapters.size());
    out.skipped         = result.skipped;
    out.resources       = resources.published();

    syslog(SYSLOG_INFO, "parse [%s]: %d chapters, %lld characters (%d skipped, %d resources, %d zip entries dropped)",
           bookId.c_str(), out.totalChapters, out.totalCharacters, out.skipped, out.resources,
           stats.unsupported + stats.corrupt);
    return ParseStatus::Parsed;
}

int BookIngest::backfillCovers(const std::string& owner, int& totalOut) {
    const std::vector<BookRecord> books = db_.listEpubBooksWithoutCover(owner);
    totalOut = static_cast<int>(books.size());

    int updated = 0;
    for (const auto& book : books) {
        std::string bytes;
        if (!blobs_.get(book.location, bytes)) {
            syslog(SYSLOG_WARNING, "extractCovers: original of [%s] missing", book.id.c_str());
            continue;
        }

        UploadMetadata meta;
        if (!inspectEpub(bytes, meta)) {
            syslog(SYSLOG_WARNING, "extractCovers: [%s] is not a readable EPUB", book.id.c_str());
            continue;
        }

        const std::string cover = meta.hasCover ? storeCover(book.id, meta.cover) : std::string();

        // only replace a title we made up from the file name
        std::string title;
        if (!meta.title.empty() && book.title == titleFromFilename(book.filename))
            title = meta.title;
        std::string author;
        if (!meta.author.empty() && book.author.empty())
            author = meta.author;

        if (cover.empty() && title.empty() && author.empty())
            continue;

        db_.updateBookCoverAndMeta(book.id, cover, title, author);
        ++updated;
        syslog(SYSLOG_INFO, "extractCovers: [%s] cover=%s title=%s author=%s", book.id.c_str(),
               cover.empty() ? "no" : "yes", title.empty() ? "-" : title.c_str(), author.empty() ? "-" : author.c_str());
    }
    return updated;
}
