#include <stdexcept>

#include "DatabaseFixture.h"

TEST_F(DatabaseTest, InsertAndGetBook) {
    BookRecord in = makeBook("b1");
    in.author = "Someone";
    db().insertBook(in);

    BookRecord out;
    ASSERT_TRUE(db().getBook("b1", out));
    EXPECT_EQ(out.owner, "alice");
    EXPECT_EQ(out.title, "Title b1");
    EXPECT_EQ(out.author, "Someone");
    EXPECT_EQ(out.location, "books/b1/b1.epub");
    EXPECT_EQ(out.filesize, 1234);
    EXPECT_TRUE(out.cover.empty());
    EXPECT_FALSE(out.parsed());
    EXPECT_EQ(out.totalChapters, 0);

    EXPECT_FALSE(db().getBook("nope", out));
}

TEST_F(DatabaseTest, DuplicateBookIdThrows) {
    db().insertBook(makeBook("b1"));
    EXPECT_THROW(db().insertBook(makeBook("b1")), std::runtime_error);
}

TEST_F(DatabaseTest, ChapterOffsetsAreRunningSums) {
    db().insertBook(makeBook("b1"));
    const long long total = db().replaceBookChapters("b1", makeChapters(4), "p{}", 5000);
    EXPECT_EQ(total, 100);       // 10 + 20 + 30 + 40

    Json::Value rows(Json::arrayValue);
    db().listChapterMeta("b1", rows);
    ASSERT_EQ(rows.size(), 4u);

    long long sum = 0;
    for (Json::ArrayIndex i = 0; i < rows.size(); ++i) {
        EXPECT_EQ(rows[i]["chapterIndex"].asInt(), static_cast<int>(i));
        EXPECT_EQ(rows[i]["charOffset"].asInt64(), sum);
        EXPECT_FALSE(rows[i].isMember("html"));
        sum += rows[i]["charLength"].asInt64();
    }

    BookRecord book;
    ASSERT_TRUE(db().getBook("b1", book));
    EXPECT_EQ(book.totalCharacters, sum);
    EXPECT_EQ(book.totalChapters, 4);
    EXPECT_EQ(book.styles, "p{}");
    EXPECT_EQ(book.parsedAt, 5000);
}

TEST_F(DatabaseTest, ReparseReplacesEveryRow) {
    db().insertBook(makeBook("b1"));
    db().replaceBookChapters("b1", makeChapters(5, "old"), "", 1);
    db().replaceBookChapters("b1", makeChapters(2, "new"), "", 2);

    Json::Value rows(Json::arrayValue);
    db().listChapterRange("b1", 0, 10, rows);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0]["html"].asString(), "<p>new 0</p>");
    EXPECT_EQ(rows[1]["html"].asString(), "<p>new 1</p>");
}

TEST_F(DatabaseTest, FailedReparseLeavesPreviousChapters) {
    db().insertBook(makeBook("b1"));
    db().replaceBookChapters("b1", makeChapters(3, "old"), "css", 1);

    auto broken = makeChapters(3, "new");
    broken[2].charLength = -1;       // violates the CHECK constraint on the last insert
    EXPECT_THROW(db().replaceBookChapters("b1", broken, "", 2), std::runtime_error);

    Json::Value rows(Json::arrayValue);
    db().listChapterRange("b1", 0, 10, rows);
    ASSERT_EQ(rows.size(), 3u);
    for (const auto& row : rows)
        EXPECT_EQ(row["html"].asString().compare(0, 6, "<p>old"), 0);

    BookRecord book;
    ASSERT_TRUE(db().getBook("b1", book));
    EXPECT_EQ(book.totalChapters, 3);
    EXPECT_EQ(book.styles, "css");
    EXPECT_EQ(book.parsedAt, 1);

    // the connection is still usable
    EXPECT_EQ(db().replaceBookChapters("b1", makeChapters(1), "", 3), 10);
}

TEST_F(DatabaseTest, ChapterRangeIsInclusive) {
    db().insertBook(makeBook("b1"));
    db().replaceBookChapters("b1", makeChapters(6), "", 1);

    Json::Value rows(Json::arrayValue);
    db().listChapterRange("b1", 2, 4, rows);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_EQ(rows[0]["chapterIndex"].asInt(), 2);
    EXPECT_EQ(rows[2]["chapterIndex"].asInt(), 4);
    EXPECT_EQ(rows[0]["charOffset"].asInt64(), 30);
    EXPECT_EQ(rows[0]["href"].asString(), "ch2.xhtml");
}

TEST_F(DatabaseTest, CoverAndMetadataUpdateOnlyTouchesGivenFields) {
    db().insertBook(makeBook("b1"));
    db().insertBook(makeBook("b2", "pdf"));
    BookRecord withCover = makeBook("b3");
    withCover.cover = "mem://c";
    db().insertBook(withCover);
    db().insertBook(makeBook("b4", "epub", "bob"));

    const auto pending = db().listEpubBooksWithoutCover("alice");
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].id, "b1");

    db().updateBookCoverAndMeta("b1", "mem://cover", "", "Author");
    BookRecord book;
    ASSERT_TRUE(db().getBook("b1", book));
    EXPECT_EQ(book.cover, "mem://cover");
    EXPECT_EQ(book.title, "Title b1");
    EXPECT_EQ(book.author, "Author");
    EXPECT_TRUE(db().listEpubBooksWithoutCover("alice").empty());
}

TEST_F(DatabaseTest, ProgressMergesAndAccumulates) {
    db().insertBook(makeBook("b1"));

    const std::string loc = "epubcfi(/6/4)";
    double pct = 150;
    db().upsertProgress("alice", "b1", &loc, &pct, 10, 100);

    Json::Value p;
    ASSERT_TRUE(db().getProgress("alice", "b1", p));
    EXPECT_EQ(p["currentLocation"].asString(), loc);
    EXPECT_DOUBLE_EQ(p["percentage"].asDouble(), 100.0);    // clamped
    EXPECT_EQ(p["totalReadTime"].asInt64(), 10);

    pct = 42.5;
    db().upsertProgress("alice", "b1", nullptr, &pct, 30, 200);
    db().upsertProgress("alice", "b1", nullptr, nullptr, -5, 300);   // negative time ignored
    ASSERT_TRUE(db().getProgress("alice", "b1", p));
    EXPECT_EQ(p["currentLocation"].asString(), loc);
    EXPECT_DOUBLE_EQ(p["percentage"].asDouble(), 42.5);
    EXPECT_EQ(p["totalReadTime"].asInt64(), 40);
    EXPECT_EQ(p["lastReadAt"].asInt64(), 300);

    EXPECT_FALSE(db().getProgress("bob", "b1", p));
}

TEST_F(DatabaseTest, ProgressNeedsAnExistingBook) {
    double pct = 1;
    EXPECT_THROW(db().upsertProgress("alice", "ghost", nullptr, &pct, 0, 1), std::runtime_error);
}

TEST_F(DatabaseTest, AnnotationsUpsertListDelete) {
    db().insertBook(makeBook("b1"));
    db().upsertAnnotation("bookmark", "alice", "b1", 1, "loc-1", "first", "", 10);
    db().upsertAnnotation("bookmark", "alice", "b1", 2, "loc-2", "", "", 11);
    db().upsertAnnotation("bookmark", "alice", "b1", 1, "loc-1b", "edited", "", 12);
    db().upsertAnnotation("highlight", "alice", "b1", 1, "range", "", "yellow", 13);

    Json::Value rows(Json::arrayValue);
    db().listAnnotations("bookmark", "alice", "b1", -1, rows);
    ASSERT_EQ(rows.size(), 2u);

    Json::Value one(Json::arrayValue);
    db().listAnnotations("bookmark", "alice", "b1", 1, one);
    ASSERT_EQ(one.size(), 1u);
    EXPECT_EQ(one[0]["location"].asString(), "loc-1b");
    EXPECT_EQ(one[0]["note"].asString(), "edited");
    EXPECT_EQ(one[0]["updatedAt"].asInt64(), 12);

    Json::Value hl(Json::arrayValue);
    db().listAnnotations("highlight", "alice", "b1", -1, hl);
    ASSERT_EQ(hl.size(), 1u);
    EXPECT_EQ(hl[0]["color"].asString(), "yellow");

    EXPECT_TRUE(db().deleteAnnotation("bookmark", "alice", "b1", 2));
    EXPECT_FALSE(db().deleteAnnotation("bookmark", "alice", "b1", 2));
    EXPECT_FALSE(db().deleteAnnotation("highlight", "bob", "b1", 1));

    EXPECT_THROW(db().upsertAnnotation("note", "alice", "b1", 1, "x", "", "", 1), std::invalid_argument);
}

TEST_F(DatabaseTest, TokenLookupHonoursExpiry) {
    const std::string hash(64, 'f');
    db().insertApiToken(hash, "alice", 2000);

    EXPECT_EQ(db().usernameForTokenHash(hash, 1999), "alice");
    EXPECT_EQ(db().usernameForTokenHash(hash, 2000), "");
    EXPECT_EQ(db().usernameForTokenHash(std::string(64, '0'), 0), "");
}

TEST_F(DatabaseTest, LibraryListSortsAndCarriesTheReadersProgress) {
    BookRecord a = makeBook("b1");
    a.title = "Alpha";  a.author = "Ann";  a.createdAt = 1000;
    BookRecord b = makeBook("b2", "pdf", "bob");
    b.title = "beta 100%";  b.author = "Bob";  b.createdAt = 2000;
    BookRecord c = makeBook("b3");
    c.title = "Gamma";  c.author = "Cy_d";  c.createdAt = 3000;
    db().insertBook(a);
    db().insertBook(b);
    db().insertBook(c);

    const double pct = 40;
    db().upsertProgress("alice", "b1", nullptr, &pct, 30, 5000);
    db().upsertProgress("bob", "b2", nullptr, &pct, 0, 6000);

    auto ids = [](const Json::Value& rows) {
        std::vector<std::string> out;
        for (const auto& r : rows) out.push_back(r["id"].asString());
        return out;
    };

    BookListQuery q;
    Json::Value rows(Json::arrayValue);
    EXPECT_EQ(db().listBooks(q, "alice", rows), 3);
    EXPECT_EQ(ids(rows), (std::vector<std::string>{"b1", "b3", "b2"}));
    EXPECT_DOUBLE_EQ(rows[0]["progress"]["percentage"].asDouble(), 40);
    EXPECT_EQ(rows[0]["progress"]["lastReadAt"].asInt64(), 5000);
    EXPECT_EQ(rows[0]["progress"]["totalReadTime"].asInt64(), 30);
    EXPECT_TRUE(rows[1]["progress"].isNull());
    EXPECT_TRUE(rows[2]["progress"].isNull());      // bob's progress isn't alice's
    EXPECT_FALSE(rows[0].isMember("location"));

    q.sort = "added";
    rows = Json::Value(Json::arrayValue);
    db().listBooks(q, "alice", rows);
    EXPECT_EQ(ids(rows), (std::vector<std::string>{"b3", "b2", "b1"}));

    q.sort = "title";
    rows = Json::Value(Json::arrayValue);
    db().listBooks(q, "", rows);
    EXPECT_EQ(ids(rows), (std::vector<std::string>{"b1", "b2", "b3"}));
    for (const auto& r : rows) EXPECT_TRUE(r["progress"].isNull());
}

TEST_F(DatabaseTest, LibraryListSearchAndPages) {
    BookRecord a = makeBook("b1");
    a.title = "Alpha";  a.author = "Ann";  a.createdAt = 1000;
    BookRecord b = makeBook("b2");
    b.title = "beta 100%";  b.author = "Bob";  b.createdAt = 2000;
    BookRecord c = makeBook("b3");
    c.title = "Gamma";  c.author = "Cy_d";  c.createdAt = 3000;
    db().insertBook(a);
    db().insertBook(b);
    db().insertBook(c);

    BookListQuery q;
    Json::Value rows(Json::arrayValue);

    q.search = "AN";        // author, any case
    EXPECT_EQ(db().listBooks(q, "alice", rows), 1);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0]["id"].asString(), "b1");

    q.search = "%";         // wildcards are literal
    rows = Json::Value(Json::arrayValue);
    EXPECT_EQ(db().listBooks(q, "alice", rows), 1);
    EXPECT_EQ(rows[0]["id"].asString(), "b2");

    q.search = "_";
    rows = Json::Value(Json::arrayValue);
    EXPECT_EQ(db().listBooks(q, "alice", rows), 1);
    EXPECT_EQ(rows[0]["id"].asString(), "b3");

    q.search.clear();
    q.sort  = "added";
    q.limit = 2;
    q.page  = 2;
    rows = Json::Value(Json::arrayValue);
    EXPECT_EQ(db().listBooks(q, "alice", rows), 3);
    ASSERT_EQ(rows.size(), 1u);
    EXPECT_EQ(rows[0]["id"].asString(), "b1");

    q.limit = 500;
    q.page  = 0;
    rows = Json::Value(Json::arrayValue);
    db().listBooks(q, "alice", rows);
    EXPECT_EQ(q.limit, MAX_LIST_LIMIT);
    EXPECT_EQ(q.page, 1);
    EXPECT_EQ(rows.size(), 3u);
}
