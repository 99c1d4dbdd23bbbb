#ifndef BOOKPAGED_DATABASE_H
#define BOOKPAGED_DATABASE_H

#include <mutex>
#include <string>
#include <vector>

#include <sqlite3.h>
#include <json/value.h>

#include "Book.h"
#include "ChapterSegmenter.h"

//
// Database: the sqlite store behind the daemon (books, their chapters,
// reading progress, bookmarks/highlights, api tokens).
//   Every call takes the connection mutex; drogon runs handlers on several
//   threads against this one handle.
//   SQLite failures are thrown as std::runtime_error.
//
class Database {
    public:
        static Database& get();     // singleton instance
        sqlite3* handle() { return db_; }

        void open(const std::string& path);
        void close(void);

        // books
        void insertBook(const BookRecord& book);
        bool getBook(const std::string& bookId, BookRecord& out);     // false if no such book
        std::vector<BookRecord> listEpubBooksWithoutCover(const std::string& owner);
        // append one page of books (BookRecord::toJson + "progress": username's
        //   {percentage, lastReadAt, totalReadTime} or null); page/limit are clamped in place
        //   RETURNS: number of books matching the search, over all pages
        long long listBooks(BookListQuery& query, const std::string& username, Json::Value& rowsOut);
        // empty arguments leave the column as it is
        void updateBookCoverAndMeta(const std::string& bookId, const std::string& cover,
                                    const std::string& title, const std::string& author);

        // chapters: drop the old set and write the new one in a single transaction.
        //   chapter_index is dense from 0, char_offset is the running sum of char_length.
        //   RETURNS: total characters written
        long long replaceBookChapters(const std::string& bookId, const std::vector<SegmentedChapter>& chapters,
                                      const std::string& styles, long long parsedAt);

        // append rows: {chapterIndex, href, charOffset, charLength}
        void listChapterMeta(const std::string& bookId, Json::Value& rowsOut);

        // append rows: {chapterIndex, href, html, charOffset, charLength}, from..to inclusive
        void listChapterRange(const std::string& bookId, int from, int to, Json::Value& rowsOut);

        // reading progress
        //   location/percentage left as they were when not supplied (nullptr)
        //   readTimeDelta is added to total_read_time, never replaces it
        void upsertProgress(const std::string& username, const std::string& bookId,
                            const std::string* location, const double* percentage,
                            long long readTimeDelta, long long nowMs);
        bool getProgress(const std::string& username, const std::string& bookId, Json::Value& out);

        // bookmarks / highlights ("bookmark" or "highlight"; anything else throws)
        void upsertAnnotation(const std::string& kind, const std::string& username, const std::string& bookId,
                              long long id, const std::string& location, const std::string& note,
                              const std::string& color, long long nowMs);
        // id < 0 lists all for the book
        void listAnnotations(const std::string& kind, const std::string& username, const std::string& bookId,
                             long long id, Json::Value& rowsOut);
        bool deleteAnnotation(const std::string& kind, const std::string& username, const std::string& bookId,
                              long long id);       // false if nothing was deleted

        // api tokens (issued elsewhere, stored hashed)
        // RETURNS: username, or empty if the hash is unknown or expired
        std::string usernameForTokenHash(const std::string& tokenHash, long long nowMs);
        void insertApiToken(const std::string& tokenHash, const std::string& username, long long expiresAt);

    private:
        sqlite3* db_ = nullptr;
        std::mutex mu_;

        // restrict construction/destruction/copy/equality
        Database() = default;
        ~Database() = default;
        Database(const Database&) = delete;
        Database& operator=(const Database&) = delete;

        void initSchema(void);  // build the db schema, if it doesn't exist
};

#endif // BOOKPAGED_DATABASE_H
