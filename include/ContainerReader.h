#ifndef BOOKPAGED_CONTAINERREADER_H
#define BOOKPAGED_CONTAINERREADER_H

#include <cstdint>
#include <map>
#include <string>

//
// ContainerReader: unpacks a ZIP (EPUB OCF) buffer held in memory.
//   Only Store (0) and DEFLATE (8) entries are extracted; anything else is
//   dropped per entry.  Directory entries are skipped.
//
class ContainerReader {
public:
    // archive path -> decompressed bytes (sorted, so iteration is deterministic)
    using Entries = std::map<std::string, std::string>;

    struct Stats {
        int listed      = 0;    // records walked in the central directory
        int extracted   = 0;
        int unsupported = 0;    // compression method not 0/8
        int corrupt     = 0;    // bad local header, data past end of buffer, inflate error
    };

    // per-entry inflated size ceiling
    static constexpr uint64_t MAX_ENTRY_SIZE = 256ull * 1024 * 1024;

    // RETURNS: false if the buffer has no End-Of-Central-Directory record
    //          (entriesOut is left empty). Per-entry failures never fail the call.
    static bool read(const std::string& zip, Entries& entriesOut, Stats* statsOut = nullptr);

private:
    static bool inflateRaw(const char* data, size_t len, uint64_t sizeHint, std::string& out);
};

#endif // BOOKPAGED_CONTAINERREADER_H
