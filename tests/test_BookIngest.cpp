#include "DatabaseFixture.h"
#include "EpubFixture.h"
#include "BookIngest.h"

namespace {

class BookIngestTest : public DatabaseTest {
protected:
    BookRecord upload(const std::string& id, const std::string& bytes, const std::string& format = "epub",
                      const std::string& filename = "") {
        BookRecord book;
        book.id       = id;
        book.owner    = "alice";
        book.format   = format;
        book.filename = filename.empty() ? id + "." + format : filename;
        book.filesize = static_cast<long long>(bytes.size());
        book.sha256   = std::string(64, 'c');
        BookIngest(db(), blobs).createBook(book, bytes);
        return book;
    }

    MemoryBlobStore blobs;
};

std::string epubWithImage() {
    EpubBuilder epub;
    epub.title = "Pictures";
    epub.addItem("css", "styles/book.css", "text/css", "p{margin:0}");
    epub.addItem("pic", "images/pic.png", "image/png", "PNG");
    epub.addChapter("c1", "text/c1.xhtml", "<p>one</p><img src=\"../images/pic.png\"/>");
    epub.addChapter("c2", "text/c2.xhtml", "<p>two</p>");
    return epub.build();
}

// parses the same book again from inside the first parse's read of the original
class ReentrantBlobStore : public MemoryBlobStore {
public:
    bool get(const std::string& key, std::string& bytesOut) override {
        if (ingest && key == watchKey) {
            BookIngest* inner = ingest;
            ingest = nullptr;       // once
            ParseSummary summary;
            innerStatus = inner->parseBook(watchId, true, summary);
            ++innerCalls;
        }
        return MemoryBlobStore::get(key, bytesOut);
    }

    BookIngest* ingest = nullptr;
    std::string watchId;
    std::string watchKey;
    ParseStatus innerStatus = ParseStatus::Parsed;
    int innerCalls = 0;
};

}  // namespace

TEST(BookIngestKeys, BlobKeysAndFilenameTitles) {
    EXPECT_EQ(BookIngest::originalKey("id1", "epub"), "books/id1/id1.epub");
    EXPECT_EQ(BookIngest::coverKey("id1", "png"), "books/id1/id1-cover.png");
    EXPECT_EQ(BookIngest::resourcePrefix("id1"), "books/id1/res/");
    EXPECT_EQ(BookIngest::titleFromFilename("my-book_v2.epub"), "my book v2");
    EXPECT_EQ(BookIngest::titleFromFilename("dir/plain"), "plain");
    EXPECT_EQ(BookIngest::titleFromFilename(".hidden"), ".hidden");
}

TEST(BookIngestKeys, InspectEpub) {
    UploadMetadata meta;
    ASSERT_TRUE(BookIngest::inspectEpub(tenChapterEpub(), meta));
    EXPECT_EQ(meta.title, "Ten Chapters");
    EXPECT_EQ(meta.author, "A. Writer");
    EXPECT_TRUE(meta.hasCover);
    EXPECT_EQ(meta.cover.ext, "jpg");

    EXPECT_FALSE(BookIngest::inspectEpub("garbage", meta));
    EXPECT_FALSE(meta.hasCover);
}

TEST_F(BookIngestTest, UploadStoresOriginalAndPrefersClientMetadata) {
    const std::string bytes = tenChapterEpub();
    BookRecord book;
    book.id       = "b1";
    book.owner    = "alice";
    book.format   = "epub";
    book.filename = "ten.epub";
    book.filesize = static_cast<long long>(bytes.size());
    book.sha256   = std::string(64, 'c');
    book.title    = "My Title";
    BookIngest(db(), blobs).createBook(book, bytes);

    EXPECT_EQ(blobs.blobs["books/b1/b1.epub"].bytes, bytes);
    EXPECT_EQ(blobs.blobs["books/b1/b1.epub"].contentType, "application/epub+zip");

    BookRecord stored;
    ASSERT_TRUE(db().getBook("b1", stored));
    EXPECT_EQ(stored.title, "My Title");
    EXPECT_EQ(stored.author, "A. Writer");
    EXPECT_EQ(stored.cover, "mem://books/b1/b1-cover.jpg");
    EXPECT_EQ(stored.location, "books/b1/b1.epub");
    EXPECT_GT(stored.createdAt, 0);
}

TEST_F(BookIngestTest, BrokenEpubStillUploads) {
    const BookRecord book = upload("b1", "not a zip", "epub", "broken_book.epub");
    EXPECT_EQ(book.title, "broken book");
    EXPECT_TRUE(book.cover.empty());

    BookRecord stored;
    ASSERT_TRUE(db().getBook("b1", stored));
    EXPECT_EQ(blobs.blobs.count("books/b1/b1.epub"), 1u);
}

TEST_F(BookIngestTest, OriginalStoreFailureFailsTheUpload) {
    blobs.failPuts = true;
    BookRecord book;
    book.id = "b1"; book.owner = "alice"; book.format = "pdf"; book.filename = "x.pdf";
    book.sha256 = std::string(64, 'c');
    EXPECT_THROW(BookIngest(db(), blobs).createBook(book, "%PDF"), std::runtime_error);

    BookRecord stored;
    EXPECT_FALSE(db().getBook("b1", stored));
}

TEST_F(BookIngestTest, ParseStatuses) {
    BookIngest ingest(db(), blobs);
    ParseSummary sum;

    EXPECT_EQ(ingest.parseBook("ghost", false, sum), ParseStatus::NotFound);

    upload("pdf1", "%PDF-1.4", "pdf");
    EXPECT_EQ(ingest.parseBook("pdf1", false, sum), ParseStatus::NotEpub);

    upload("junk", "not a zip", "epub");
    EXPECT_EQ(ingest.parseBook("junk", false, sum), ParseStatus::NotParseable);

    EpubBuilder empty;
    empty.addChapter("c1", "c1.xhtml", "   ");
    upload("blank", empty.build());
    EXPECT_EQ(ingest.parseBook("blank", false, sum), ParseStatus::NotParseable);

    BookRecord stored;
    ASSERT_TRUE(db().getBook("blank", stored));
    EXPECT_FALSE(stored.parsed());

    EXPECT_STREQ(parseStatusCode(ParseStatus::InProgress), "parse_in_progress");
    EXPECT_STREQ(parseStatusCode(ParseStatus::NotEpub), "not_epub");
}

TEST_F(BookIngestTest, ParsePublishesResourcesAndIsIdempotent) {
    upload("b1", epubWithImage());
    BookIngest ingest(db(), blobs);

    ParseSummary sum;
    ASSERT_EQ(ingest.parseBook("b1", false, sum), ParseStatus::Parsed);
    EXPECT_EQ(sum.totalChapters, 2);
    EXPECT_EQ(sum.totalCharacters, 6);
    EXPECT_EQ(sum.resources, 1);
    EXPECT_EQ(blobs.blobs.count("books/b1/res/OEBPS/images/pic.png"), 1u);

    Json::Value rows(Json::arrayValue);
    db().listChapterRange("b1", 0, 0, rows);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_NE(rows[0]["html"].asString().find("mem://books/b1/res/OEBPS/images/pic.png"), std::string::npos);

    // second call doesn't touch the chapters
    const int putsBefore = blobs.puts;
    ParseSummary again;
    EXPECT_EQ(ingest.parseBook("b1", false, again), ParseStatus::AlreadyParsed);
    EXPECT_EQ(again.totalChapters, 2);
    EXPECT_EQ(again.totalCharacters, 6);
    EXPECT_EQ(blobs.puts, putsBefore);

    // forced re-parse rebuilds them
    EXPECT_EQ(ingest.parseBook("b1", true, again), ParseStatus::Parsed);
    EXPECT_EQ(again.totalChapters, 2);
}

TEST_F(BookIngestTest, BackfillOnlyFillsWhatIsMissing) {
    // uploaded while the blob store refused covers: no cover, filename title
    EpubBuilder epub;
    epub.title  = "Real Title";
    epub.author = "Real Author";
    epub.addItem("cover", "cover.png", "image/png", "PNGCOVER", "cover-image");
    epub.addChapter("c1", "c1.xhtml", "<p>x</p>");
    const std::string bytes = epub.build();

    blobs.blobs["books/b1/b1.epub"] = MemoryBlobStore::Blob{bytes, "application/epub+zip"};
    BookRecord b1 = makeBook("b1");
    b1.filename = "real-title.epub";
    b1.title    = "real title";
    db().insertBook(b1);

    blobs.blobs["books/b2/b2.epub"] = MemoryBlobStore::Blob{bytes, "application/epub+zip"};
    BookRecord b2 = makeBook("b2");
    b2.title  = "Chosen By Reader";
    b2.author = "Chosen Author";
    db().insertBook(b2);

    db().insertBook(makeBook("b3"));     // original missing from the store

    int total = 0;
    const int updated = BookIngest(db(), blobs).backfillCovers("alice", total);
    EXPECT_EQ(total, 3);
    EXPECT_EQ(updated, 2);

    BookRecord stored;
    ASSERT_TRUE(db().getBook("b1", stored));
    EXPECT_EQ(stored.title, "Real Title");
    EXPECT_EQ(stored.author, "Real Author");
    EXPECT_EQ(stored.cover, "mem://books/b1/b1-cover.png");

    ASSERT_TRUE(db().getBook("b2", stored));
    EXPECT_EQ(stored.title, "Chosen By Reader");
    EXPECT_EQ(stored.author, "Chosen Author");
    EXPECT_EQ(stored.cover, "mem://books/b2/b2-cover.png");

    // nothing left to do
    EXPECT_EQ(BookIngest(db(), blobs).backfillCovers("alice", total), 0);
    EXPECT_EQ(total, 1);      // b3 still has no cover
}

TEST_F(BookIngestTest, ParseOfABookAlreadyBeingParsedIsRejected) {
    ReentrantBlobStore store;
    BookIngest ingest(db(), store);

    BookRecord book;
    book.id       = "busy";
    book.owner    = "alice";
    book.format   = "epub";
    book.filename = "busy.epub";
    const std::string bytes = tenChapterEpub();
    book.filesize = static_cast<long long>(bytes.size());
    book.sha256   = std::string(64, 'c');
    ingest.createBook(book, bytes);

    store.ingest   = &ingest;
    store.watchId  = "busy";
    store.watchKey = book.location;

    ParseSummary summary;
    EXPECT_EQ(ingest.parseBook("busy", false, summary), ParseStatus::Parsed);
    EXPECT_EQ(store.innerCalls, 1);
    EXPECT_EQ(store.innerStatus, ParseStatus::InProgress);
    EXPECT_EQ(summary.totalChapters, 10);

    // the slot is given back once the outer parse returns
    EXPECT_EQ(ingest.parseBook("busy", true, summary), ParseStatus::Parsed);
    EXPECT_EQ(summary.totalChapters, 10);
}

TEST_F(BookIngestTest, FailedParseReleasesTheBook) {
    upload("junk", "definitely not a zip");

    ParseSummary summary;
    EXPECT_EQ(BookIngest(db(), blobs).parseBook("junk", false, summary), ParseStatus::NotParseable);
    EXPECT_EQ(BookIngest(db(), blobs).parseBook("junk", false, summary), ParseStatus::NotParseable);
}
