#include <algorithm>
#include <syslog.h>
#include <stdexcept>

#include "Database.h"
#include "utils.h"

Database& Database::get() {
    static Database instance;   // created once, destroyed at program exit
    return instance;
}

void Database::open(const std::string& path) {
    std::lock_guard<std::mutex> lk(mu_);

    if (db_) {
        return; // db already open
    }

    // open the database
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        const std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("sqlite open failed: " + msg);
    }
    sqlite3_busy_timeout(db_, 5000);

    //
    // setup schema (if it doesn't already exist)
    //
    initSchema();
}

void Database::close(void) {
    std::lock_guard<std::mutex> lk(mu_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

//****************************************************************
// database design for bookpaged
//
// books: every uploaded book, with its parse summary
// book_chapters: the segmented chapters of a parsed book
// reading_progress: a user's position in a book
// bookmarks / highlights: a user's annotations for a book
// api_tokens: bearer tokens issued by the account service (hashed)
//
//****************************************************************
static void execOrThrow(sqlite3* db, const char* sql) {
    char* errmsg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        std::string msg = errmsg ? errmsg : sqlite3_errmsg(db);
        if (errmsg) sqlite3_free(errmsg);  // free exactly once
        throw std::runtime_error(msg);
    }
}

static void prepOrThrow(sqlite3* db, const char* sql, sqlite3_stmt** out, const char* where) {
    if (sqlite3_prepare_v2(db, sql, -1, out, nullptr) != SQLITE_OK)
        throw std::runtime_error(std::string("sqlite prepare failed (") + where + "): " + sqlite3_errmsg(db));
}

// finalize stmt, log and throw: for a step that didn't return ROW/DONE
[[noreturn]] static void stepFailed(sqlite3* db, sqlite3_stmt* stmt, int rc, const char* where) {
    const std::string msg = sqlite3_errmsg(db);
    syslog(SYSLOG_ERR, "%s rc=%d %s", where, rc, msg.c_str());
    sqlite3_finalize(stmt);
    throw std::runtime_error(std::string("sqlite step failed (") + where + "): " + msg);
}

static void stepDoneOrThrow(sqlite3* db, sqlite3_stmt* stmt, const char* where) {
    const int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE)
        stepFailed(db, stmt, rc, where);
    sqlite3_finalize(stmt);
}

static std::string columnText(sqlite3_stmt* stmt, int col) {
    const unsigned char* txt = sqlite3_column_text(stmt, col);
    return txt ? reinterpret_cast<const char*>(txt) : "";
}

static void bindText(sqlite3_stmt* stmt, int idx, const std::string& s) {
    sqlite3_bind_text(stmt, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// empty strings are stored as NULL
static void bindTextOrNull(sqlite3_stmt* stmt, int idx, const std::string& s) {
    if (s.empty())
        sqlite3_bind_null(stmt, idx);
    else
        sqlite3_bind_text(stmt, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void Database::initSchema(void) {
    execOrThrow(db_, "PRAGMA foreign_keys = ON;");

    try {
        execOrThrow(db_, "BEGIN IMMEDIATE;");

        //
        //****************************************************************
        //  books:  every uploaded book.  parsed_at stays NULL until the chapters
        //          have been segmented; total_* and styles are written with them.
        //
        //  location is the blob key of the original upload (books/<id>/<id>.<format>)
        //  cover is the public blob URL of the extracted cover, if any
        //
        //****************************************************************
        execOrThrow(db_, R"SQL(
            CREATE TABLE IF NOT EXISTS books (
              id               TEXT PRIMARY KEY,
              owner            TEXT NOT NULL,
              title            TEXT NOT NULL DEFAULT '',
              author           TEXT NOT NULL DEFAULT '',
              format           TEXT NOT NULL,
              cover            TEXT,
              location         TEXT NOT NULL,
              filename         TEXT NOT NULL,
              filesize         INTEGER NOT NULL CHECK (filesize >= 0),
              sha256           TEXT NOT NULL CHECK (length(sha256) = 64),
              total_chapters   INTEGER NOT NULL DEFAULT 0,
              total_characters INTEGER NOT NULL DEFAULT 0,
              styles           TEXT NOT NULL DEFAULT '',
              parsed_at        INTEGER,
              created_at       INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_books_owner ON books (owner);
        )SQL");

        //
        //****************************************************************
        //  book_chapters: one row per segmented spine document.
        //      chapter_index: dense from 0, spine order
        //      char_offset:   sum of char_length of all earlier chapters
        //
        //****************************************************************
        execOrThrow(db_, R"SQL(
            CREATE TABLE IF NOT EXISTS book_chapters (
              book_id        TEXT NOT NULL,
              chapter_index  INTEGER NOT NULL CHECK (chapter_index >= 0),
              href           TEXT NOT NULL,
              html           TEXT NOT NULL,
              char_offset    INTEGER NOT NULL CHECK (char_offset >= 0),
              char_length    INTEGER NOT NULL CHECK (char_length >= 0),
              UNIQUE (book_id, chapter_index),
              FOREIGN KEY (book_id) REFERENCES books(id) ON DELETE CASCADE ON UPDATE NO ACTION
            );
        )SQL");

        //
        //****************************************************************
        //  reading_progress: where a user is in a book
        //      percentage clamped 0..100, total_read_time in seconds (only ever grows)
        //
        //****************************************************************
        execOrThrow(db_, R"SQL(
            CREATE TABLE IF NOT EXISTS reading_progress (
              username          TEXT NOT NULL,
              book_id           TEXT NOT NULL,
              current_location  TEXT,
              percentage        REAL NOT NULL DEFAULT 0,
              total_read_time   INTEGER NOT NULL DEFAULT 0,
              last_read_at      INTEGER NOT NULL,
              PRIMARY KEY (username, book_id),
              FOREIGN KEY (book_id) REFERENCES books(id) ON DELETE CASCADE ON UPDATE NO ACTION
            );
        )SQL");

        //
        //****************************************************************
        //  bookmarks / highlights: client-numbered annotations
        //
        //****************************************************************
        execOrThrow(db_, R"SQL(
            CREATE TABLE IF NOT EXISTS bookmarks (
                username    TEXT NOT NULL,
                book_id     TEXT NOT NULL,
                id          INTEGER NOT NULL,
                location    TEXT NOT NULL,
                note        TEXT,
                updated_at  INTEGER NOT NULL,
                PRIMARY KEY (username, book_id, id),
                FOREIGN KEY (book_id) REFERENCES books(id) ON DELETE CASCADE ON UPDATE NO ACTION
            );
            CREATE TABLE IF NOT EXISTS highlights (
                username    TEXT NOT NULL,
                book_id     TEXT NOT NULL,
                id          INTEGER NOT NULL,
                location    TEXT NOT NULL,
                note        TEXT,
                color       TEXT,
                updated_at  INTEGER NOT NULL,
                PRIMARY KEY (username, book_id, id),
                FOREIGN KEY (book_id) REFERENCES books(id) ON DELETE CASCADE ON UPDATE NO ACTION
            );
        )SQL");

        //
        //****************************************************************
        //  api_tokens: sha256(token) -> username.  Rows are written by the
        //              account service; we only read them.
        //
        //****************************************************************
        execOrThrow(db_, R"SQL(
            CREATE TABLE IF NOT EXISTS api_tokens (
                token_hash  TEXT PRIMARY KEY CHECK (length(token_hash) = 64),
                username    TEXT NOT NULL,
                expires_at  INTEGER NOT NULL
            );
        )SQL");

        execOrThrow(db_, "COMMIT;");
    } catch (...) {
        // undo the half-built schema, then let the caller see the error
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

/////////////////////////////////////////////////////////////
// books
//
static const char* BOOK_COLUMNS =
    "id, owner, title, author, format, cover, location, filename, filesize, sha256, "
    "total_chapters, total_characters, styles, parsed_at, created_at";

static BookRecord readBook(sqlite3_stmt* stmt) {
    BookRecord b;
    b.id              = columnText(stmt, 0);
    b.owner           = columnText(stmt, 1);
    b.title           = columnText(stmt, 2);
    b.author          = columnText(stmt, 3);
    b.format          = columnText(stmt, 4);
    b.cover           = columnText(stmt, 5);
    b.location        = columnText(stmt, 6);
    b.filename        = columnText(stmt, 7);
    b.filesize        = sqlite3_column_int64(stmt, 8);
    b.sha256          = columnText(stmt, 9);
    b.totalChapters   = sqlite3_column_int(stmt, 10);
    b.totalCharacters = sqlite3_column_int64(stmt, 11);
    b.styles          = columnText(stmt, 12);
    b.parsedAt        = (sqlite3_column_type(stmt, 13) == SQLITE_NULL) ? 0 : sqlite3_column_int64(stmt, 13);
    b.createdAt       = sqlite3_column_int64(stmt, 14);
    return b;
}

void Database::insertBook(const BookRecord& book) {
    static const char* SQL = R"SQL(
        INSERT INTO books (id, owner, title, author, format, cover, location, filename,
                           filesize, sha256, created_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11)
    )SQL";

    std::lock_guard<std::mutex> lk(mu_);
    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, SQL, &stmt, "insertBook");
    bindText      (stmt, 1, book.id);
    bindText      (stmt, 2, book.owner);
    bindText      (stmt, 3, book.title);
    bindText      (stmt, 4, book.author);
    bindText      (stmt, 5, book.format);
    bindTextOrNull(stmt, 6, book.cover);
    bindText      (stmt, 7, book.location);
    bindText      (stmt, 8, book.filename);
    sqlite3_bind_int64(stmt, 9, static_cast<sqlite3_int64>(book.filesize));
    bindText      (stmt, 10, book.sha256);
    sqlite3_bind_int64(stmt, 11, static_cast<sqlite3_int64>(book.createdAt));
    stepDoneOrThrow(db_, stmt, "insertBook");
}

bool Database::getBook(const std::string& bookId, BookRecord& out) {
    const std::string sql = std::string("SELECT ") + BOOK_COLUMNS + " FROM books WHERE id = ?1 LIMIT 1";

    std::lock_guard<std::mutex> lk(mu_);
    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, sql.c_str(), &stmt, "getBook");
    bindText(stmt, 1, bookId);

    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        out = readBook(stmt);
        sqlite3_finalize(stmt);
        return true;
    }
    if (rc != SQLITE_DONE)
        stepFailed(db_, stmt, rc, "getBook");
    sqlite3_finalize(stmt);
    return false;
}

std::vector<BookRecord> Database::listEpubBooksWithoutCover(const std::string& owner) {
    const std::string sql = std::string("SELECT ") + BOOK_COLUMNS +
        " FROM books WHERE owner = ?1 AND format = 'epub' AND (cover IS NULL OR cover = '')"
        " ORDER BY created_at ASC";

    std::lock_guard<std::mutex> lk(mu_);
    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, sql.c_str(), &stmt, "listEpubBooksWithoutCover");
    bindText(stmt, 1, owner);

    std::vector<BookRecord> books;
    for (;;) {
        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW)
            stepFailed(db_, stmt, rc, "listEpubBooksWithoutCover");
        books.push_back(readBook(stmt));
    }
    sqlite3_finalize(stmt);
    return books;
}

// "%" and "_" in a search are literal
static std::string likePattern(const std::string& search) {
    std::string p = "%";
    for (char c : search) {
        if (c == '%' || c == '_' || c == '\\') p += '\\';
        p += c;
    }
    return p + "%";
}

long long Database::listBooks(BookListQuery& query, const std::string& username, Json::Value& rowsOut) {
    query.page  = std::max(1, query.page);
    query.limit = std::min(MAX_LIST_LIMIT, std::max(1, query.limit));

    static const char* WHERE =
        " WHERE (?1 = '' OR b.title LIKE ?2 ESCAPE '\\' OR b.author LIKE ?2 ESCAPE '\\')";

    const char* order = " ORDER BY COALESCE(p.last_read_at, b.created_at) DESC, b.id";
    if (query.sort == "added")
        order = " ORDER BY b.created_at DESC, b.id";
    else if (query.sort == "title")
        order = " ORDER BY b.title COLLATE NOCASE ASC, b.id";

    const std::string countSql = std::string("SELECT COUNT(*) FROM books b") + WHERE;
    const std::string pageSql = std::string(
        "SELECT b.id, b.owner, b.title, b.author, b.format, b.cover, b.location, b.filename, b.filesize, "
        "b.sha256, b.total_chapters, b.total_characters, b.styles, b.parsed_at, b.created_at, "
        "p.percentage, p.last_read_at, p.total_read_time "
        "FROM books b LEFT JOIN reading_progress p ON p.book_id = b.id AND p.username = ?3") +
        WHERE + order + " LIMIT ?4 OFFSET ?5";

    const std::string pattern = likePattern(query.search);

    std::lock_guard<std::mutex> lk(mu_);
    sqlite3_stmt* stmt = nullptr;

    long long total = 0;
    prepOrThrow(db_, countSql.c_str(), &stmt, "listBooks count");
    bindText(stmt, 1, query.search);
    bindText(stmt, 2, pattern);
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_ROW)
        stepFailed(db_, stmt, rc, "listBooks count");
    total = sqlite3_column_int64(stmt, 0);
    sqlite3_finalize(stmt);

    prepOrThrow(db_, pageSql.c_str(), &stmt, "listBooks");
    bindText(stmt, 1, query.search);
    bindText(stmt, 2, pattern);
    bindText(stmt, 3, username);
    sqlite3_bind_int64(stmt, 4, query.limit);
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(query.page - 1) * query.limit);

    for (;;) {
        rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW)
            stepFailed(db_, stmt, rc, "listBooks");

        Json::Value row = readBook(stmt).toJson();
        if (sqlite3_column_type(stmt, 16) == SQLITE_NULL) {
            row["progress"] = Json::Value(Json::nullValue);
        } else {
            Json::Value p(Json::objectValue);
            p["percentage"]    = sqlite3_column_double(stmt, 15);
            p["lastReadAt"]    = static_cast<Json::Int64>(sqlite3_column_int64(stmt, 16));
            p["totalReadTime"] = static_cast<Json::Int64>(sqlite3_column_int64(stmt, 17));
            row["progress"] = p;
        }
        rowsOut.append(row);
    }
    sqlite3_finalize(stmt);
    return total;
}

void Database::updateBookCoverAndMeta(const std::string& bookId, const std::string& cover,
                                      const std::string& title, const std::string& author) {
    static const char* SQL = R"SQL(
        UPDATE books SET
            cover  = COALESCE(?2, cover),
            title  = COALESCE(?3, title),
            author = COALESCE(?4, author)
        WHERE id = ?1
    )SQL";

    std::lock_guard<std::mutex> lk(mu_);
    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, SQL, &stmt, "updateBookCoverAndMeta");
    bindText      (stmt, 1, bookId);
    bindTextOrNull(stmt, 2, cover);
    bindTextOrNull(stmt, 3, title);
    bindTextOrNull(stmt, 4, author);
    stepDoneOrThrow(db_, stmt, "updateBookCoverAndMeta");
}

/////////////////////////////////////////////////////////////
// chapters
//
long long Database::replaceBookChapters(const std::string& bookId, const std::vector<SegmentedChapter>& chapters,
                                        const std::string& styles, long long parsedAt) {
    static const char* SQL_DEL = "DELETE FROM book_chapters WHERE book_id = ?1";
    static const char* SQL_INS =
        "INSERT INTO book_chapters (book_id, chapter_index, href, html, char_offset, char_length) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6)";
    static const char* SQL_BOOK =
        "UPDATE books SET total_chapters = ?2, total_characters = ?3, styles = ?4, parsed_at = ?5 "
        "WHERE id = ?1";

    std::lock_guard<std::mutex> lk(mu_);
    long long offset = 0;

    try {
        execOrThrow(db_, "BEGIN IMMEDIATE;");

        sqlite3_stmt* stmt = nullptr;
        prepOrThrow(db_, SQL_DEL, &stmt, "replaceBookChapters/delete");
        bindText(stmt, 1, bookId);
        stepDoneOrThrow(db_, stmt, "replaceBookChapters/delete");

        prepOrThrow(db_, SQL_INS, &stmt, "replaceBookChapters/insert");
        for (size_t i = 0; i < chapters.size(); ++i) {
            const auto& ch = chapters[i];
            sqlite3_reset(stmt);
            sqlite3_clear_bindings(stmt);
            bindText(stmt, 1, bookId);
            sqlite3_bind_int  (stmt, 2, static_cast<int>(i));
            bindText(stmt, 3, ch.href);
            sqlite3_bind_text (stmt, 4, ch.html.data(), static_cast<int>(ch.html.size()), SQLITE_TRANSIENT);
            sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(offset));
            sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(ch.charLength));
            const int rc = sqlite3_step(stmt);
            if (rc != SQLITE_DONE)
                stepFailed(db_, stmt, rc, "replaceBookChapters/insert");
            offset += ch.charLength;
        }
        sqlite3_finalize(stmt);

        prepOrThrow(db_, SQL_BOOK, &stmt, "replaceBookChapters/book");
        bindText(stmt, 1, bookId);
        sqlite3_bind_int  (stmt, 2, static_cast<int>(chapters.size()));
        sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(offset));
        bindText(stmt, 4, styles);
        sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(parsedAt));
        stepDoneOrThrow(db_, stmt, "replaceBookChapters/book");

        execOrThrow(db_, "COMMIT;");
    } catch (...) {
        // readers keep seeing the previous chapter set
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
    return offset;
}

void Database::listChapterMeta(const std::string& bookId, Json::Value& rowsOut) {
    static const char* SQL =
        "SELECT chapter_index, href, char_offset, char_length FROM book_chapters "
        "WHERE book_id = ?1 ORDER BY chapter_index ASC";

    std::lock_guard<std::mutex> lk(mu_);
    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, SQL, &stmt, "listChapterMeta");
    bindText(stmt, 1, bookId);

    for (;;) {
        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW)
            stepFailed(db_, stmt, rc, "listChapterMeta");

        Json::Value row(Json::objectValue);
        row["chapterIndex"] = sqlite3_column_int(stmt, 0);
        row["href"]         = columnText(stmt, 1);
        row["charOffset"]   = static_cast<Json::Int64>(sqlite3_column_int64(stmt, 2));
        row["charLength"]   = static_cast<Json::Int64>(sqlite3_column_int64(stmt, 3));
        rowsOut.append(row);
    }
    sqlite3_finalize(stmt);
}

void Database::listChapterRange(const std::string& bookId, int from, int to, Json::Value& rowsOut) {
    static const char* SQL =
        "SELECT chapter_index, href, html, char_offset, char_length FROM book_chapters "
        "WHERE book_id = ?1 AND chapter_index BETWEEN ?2 AND ?3 ORDER BY chapter_index ASC";

    std::lock_guard<std::mutex> lk(mu_);
    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, SQL, &stmt, "listChapterRange");
    bindText(stmt, 1, bookId);
    sqlite3_bind_int(stmt, 2, from);
    sqlite3_bind_int(stmt, 3, to);

    for (;;) {
        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW)
            stepFailed(db_, stmt, rc, "listChapterRange");

        Json::Value row(Json::objectValue);
        row["chapterIndex"] = sqlite3_column_int(stmt, 0);
        row["href"]         = columnText(stmt, 1);
        row["html"]         = columnText(stmt, 2);
        row["charOffset"]   = static_cast<Json::Int64>(sqlite3_column_int64(stmt, 3));
        row["charLength"]   = static_cast<Json::Int64>(sqlite3_column_int64(stmt, 4));
        rowsOut.append(row);
    }
    sqlite3_finalize(stmt);
}

/////////////////////////////////////////////////////////////
// reading progress
//
void Database::upsertProgress(const std::string& username, const std::string& bookId,
                              const std::string* location, const double* percentage,
                              long long readTimeDelta, long long tnow) {
    static const char* SQL = R"SQL(
        INSERT INTO reading_progress (username, book_id, current_location, percentage, total_read_time, last_read_at)
        VALUES (?1, ?2, ?3, COALESCE(?4, 0), ?5, ?6)
        ON CONFLICT(username, book_id) DO UPDATE SET
            current_location = COALESCE(?3, reading_progress.current_location),
            percentage       = COALESCE(?4, reading_progress.percentage),
            total_read_time  = reading_progress.total_read_time + ?5,
            last_read_at     = ?6
    )SQL";

    std::lock_guard<std::mutex> lk(mu_);
    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, SQL, &stmt, "upsertProgress");
    bindText(stmt, 1, username);
    bindText(stmt, 2, bookId);
    if (location)
        bindText(stmt, 3, *location);
    else
        sqlite3_bind_null(stmt, 3);
    if (percentage)
        sqlite3_bind_double(stmt, 4, std::min(100.0, std::max(0.0, *percentage)));
    else
        sqlite3_bind_null(stmt, 4);
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(std::max(0LL, readTimeDelta)));
    sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(tnow));
    stepDoneOrThrow(db_, stmt, "upsertProgress");
}

bool Database::getProgress(const std::string& username, const std::string& bookId, Json::Value& out) {
    static const char* SQL =
        "SELECT current_location, percentage, total_read_time, last_read_at "
        "FROM reading_progress WHERE username = ?1 AND book_id = ?2 LIMIT 1";

    std::lock_guard<std::mutex> lk(mu_);
    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, SQL, &stmt, "getProgress");
    bindText(stmt, 1, username);
    bindText(stmt, 2, bookId);

    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) {
        out = Json::Value(Json::objectValue);
        out["bookId"]          = bookId;
        out["currentLocation"] = (sqlite3_column_type(stmt, 0) == SQLITE_NULL)
                                     ? Json::Value(Json::nullValue) : Json::Value(columnText(stmt, 0));
        out["percentage"]      = sqlite3_column_double(stmt, 1);
        out["totalReadTime"]   = static_cast<Json::Int64>(sqlite3_column_int64(stmt, 2));
        out["lastReadAt"]      = static_cast<Json::Int64>(sqlite3_column_int64(stmt, 3));
        sqlite3_finalize(stmt);
        return true;
    }
    if (rc != SQLITE_DONE)
        stepFailed(db_, stmt, rc, "getProgress");
    sqlite3_finalize(stmt);
    return false;
}

/////////////////////////////////////////////////////////////
// bookmarks / highlights
//
static bool isHighlight(const std::string& kind) {
    if (kind == "highlight") return true;
    if (kind == "bookmark")  return false;
    throw std::invalid_argument("unknown annotation kind: " + kind);
}

void Database::upsertAnnotation(const std::string& kind, const std::string& username, const std::string& bookId,
                                long long id, const std::string& location, const std::string& note,
                                const std::string& color, long long tnow) {
    static const char* SQL_BOOKMARK = R"SQL(
        INSERT INTO bookmarks (username, book_id, id, location, note, updated_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?7)
        ON CONFLICT(username, book_id, id) DO UPDATE SET
            location   = excluded.location,
            note       = excluded.note,
            updated_at = excluded.updated_at
    )SQL";
    static const char* SQL_HIGHLIGHT = R"SQL(
        INSERT INTO highlights (username, book_id, id, location, note, color, updated_at)
        VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)
        ON CONFLICT(username, book_id, id) DO UPDATE SET
            location   = excluded.location,
            note       = excluded.note,
            color      = excluded.color,
            updated_at = excluded.updated_at
    )SQL";

    const bool hl = isHighlight(kind);

    std::lock_guard<std::mutex> lk(mu_);
    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, hl ? SQL_HIGHLIGHT : SQL_BOOKMARK, &stmt, "upsertAnnotation");
    bindText(stmt, 1, username);
    bindText(stmt, 2, bookId);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(id));
    bindText(stmt, 4, location);
    bindTextOrNull(stmt, 5, note);
    if (hl)
        bindTextOrNull(stmt, 6, color);
    sqlite3_bind_int64(stmt, 7, static_cast<sqlite3_int64>(tnow));
    stepDoneOrThrow(db_, stmt, "upsertAnnotation");
}

void Database::listAnnotations(const std::string& kind, const std::string& username, const std::string& bookId,
                               long long id, Json::Value& rowsOut) {
    static const char* SQL_BOOKMARK_ALL =
        "SELECT id, location, note, NULL, updated_at FROM bookmarks "
        "WHERE username = ?1 AND book_id = ?2 ORDER BY id ASC";
    static const char* SQL_BOOKMARK_ONE =
        "SELECT id, location, note, NULL, updated_at FROM bookmarks "
        "WHERE username = ?1 AND book_id = ?2 AND id = ?3";
    static const char* SQL_HIGHLIGHT_ALL =
        "SELECT id, location, note, color, updated_at FROM highlights "
        "WHERE username = ?1 AND book_id = ?2 ORDER BY id ASC";
    static const char* SQL_HIGHLIGHT_ONE =
        "SELECT id, location, note, color, updated_at FROM highlights "
        "WHERE username = ?1 AND book_id = ?2 AND id = ?3";

    const bool hl = isHighlight(kind);
    const char* SQL = hl ? (id < 0 ? SQL_HIGHLIGHT_ALL : SQL_HIGHLIGHT_ONE)
                         : (id < 0 ? SQL_BOOKMARK_ALL  : SQL_BOOKMARK_ONE);

    std::lock_guard<std::mutex> lk(mu_);
    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, SQL, &stmt, "listAnnotations");
    bindText(stmt, 1, username);
    bindText(stmt, 2, bookId);
    if (id >= 0)
        sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(id));

    for (;;) {
        const int rc = sqlite3_step(stmt);
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW)
            stepFailed(db_, stmt, rc, "listAnnotations");

        Json::Value row(Json::objectValue);
        row["bookId"]    = bookId;
        row["id"]        = static_cast<Json::Int64>(sqlite3_column_int64(stmt, 0));
        row["location"]  = columnText(stmt, 1);
        if (sqlite3_column_type(stmt, 2) != SQLITE_NULL) row["note"]  = columnText(stmt, 2);
        if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) row["color"] = columnText(stmt, 3);
        row["updatedAt"] = static_cast<Json::Int64>(sqlite3_column_int64(stmt, 4));
        rowsOut.append(row);
    }
    sqlite3_finalize(stmt);
}

bool Database::deleteAnnotation(const std::string& kind, const std::string& username, const std::string& bookId,
                                long long id) {
    const char* SQL = isHighlight(kind)
        ? "DELETE FROM highlights WHERE username = ?1 AND book_id = ?2 AND id = ?3"
        : "DELETE FROM bookmarks  WHERE username = ?1 AND book_id = ?2 AND id = ?3";

    std::lock_guard<std::mutex> lk(mu_);
    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, SQL, &stmt, "deleteAnnotation");
    bindText(stmt, 1, username);
    bindText(stmt, 2, bookId);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(id));
    stepDoneOrThrow(db_, stmt, "deleteAnnotation");
    return sqlite3_changes(db_) > 0;
}

/////////////////////////////////////////////////////////////
// api tokens
//
std::string Database::usernameForTokenHash(const std::string& tokenHash, long long tnow) {
    static const char* SQL =
        "SELECT username FROM api_tokens WHERE token_hash = ?1 AND expires_at > ?2 LIMIT 1";

    std::lock_guard<std::mutex> lk(mu_);
    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, SQL, &stmt, "usernameForTokenHash");
    bindText(stmt, 1, tokenHash);
    sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(tnow));

    std::string username;
    const int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW)
        username = columnText(stmt, 0);
    else if (rc != SQLITE_DONE)
        stepFailed(db_, stmt, rc, "usernameForTokenHash");
    sqlite3_finalize(stmt);
    return username;
}

void Database::insertApiToken(const std::string& tokenHash, const std::string& username, long long expiresAt) {
    static const char* SQL =
        "INSERT OR REPLACE INTO api_tokens (token_hash, username, expires_at) VALUES (?1, ?2, ?3)";

    std::lock_guard<std::mutex> lk(mu_);
    sqlite3_stmt* stmt = nullptr;
    prepOrThrow(db_, SQL, &stmt, "insertApiToken");
    bindText(stmt, 1, tokenHash);
    bindText(stmt, 2, username);
    sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(expiresAt));
    stepDoneOrThrow(db_, stmt, "insertApiToken");
}
