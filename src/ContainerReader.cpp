#include <syslog.h>
#include <zlib.h>

#include "ContainerReader.h"
#include "utils.h"

// Signatures
static const uint32_t EOCD_SIGNATURE = 0x06054b50;
static const uint32_t CD_SIGNATURE   = 0x02014b50;
static const uint32_t LFH_SIGNATURE  = 0x04034b50;

static const size_t EOCD_SIZE = 22;
static const size_t CD_SIZE   = 46;
static const size_t LFH_SIZE  = 30;

// bounds-checked little-endian reads: return false instead of reading past the buffer
static bool readLE16(const std::string& buf, size_t off, uint16_t& out) {
    if (off > buf.size() || buf.size() - off < 2) return false;
    const auto* p = reinterpret_cast<const unsigned char*>(buf.data() + off);
    out = static_cast<uint16_t>(p[0] | (p[1] << 8));
    return true;
}

static bool readLE32(const std::string& buf, size_t off, uint32_t& out) {
    if (off > buf.size() || buf.size() - off < 4) return false;
    const auto* p = reinterpret_cast<const unsigned char*>(buf.data() + off);
    out = uint32_t(p[0]) | (uint32_t(p[1]) << 8) | (uint32_t(p[2]) << 16) | (uint32_t(p[3]) << 24);
    return true;
}

static bool fits(const std::string& buf, uint64_t off, uint64_t len) {
    return off <= buf.size() && len <= buf.size() - off;
}

bool ContainerReader::read(const std::string& zip, Entries& entriesOut, Stats* statsOut) {
    entriesOut.clear();
    Stats stats;

    if (zip.size() < EOCD_SIZE) {
        if (statsOut) *statsOut = stats;
        return false;
    }

    // The EOCD may be followed by a comment of any length, so probe every
    // candidate offset from the last possible position down to the start.
    bool found = false;
    size_t eocd = 0;
    for (size_t i = zip.size() - EOCD_SIZE + 1; i-- > 0; ) {
        uint32_t sig = 0;
        if (readLE32(zip, i, sig) && sig == EOCD_SIGNATURE) {
            eocd = i;
            found = true;
            break;
        }
    }
    if (!found) {
        syslog(SYSLOG_DEBUG, "ContainerReader: no end-of-central-directory record");
        if (statsOut) *statsOut = stats;
        return false;
    }

    uint16_t cdEntries = 0;
    uint32_t cdOffset = 0;
    readLE16(zip, eocd + 10, cdEntries);
    readLE32(zip, eocd + 16, cdOffset);

    uint64_t offset = cdOffset;
    for (uint16_t i = 0; i < cdEntries; ++i) {
        uint32_t sig = 0;
        if (!fits(zip, offset, CD_SIZE) || !readLE32(zip, offset, sig) || sig != CD_SIGNATURE) {
            syslog(SYSLOG_WARNING, "ContainerReader: central directory ends early at record %u of %u",
                   static_cast<unsigned>(i), static_cast<unsigned>(cdEntries));
            break;
        }
        ++stats.listed;

        uint16_t method = 0, nameLen = 0, extraLen = 0, commentLen = 0;
        uint32_t compressedSize = 0, uncompressedSize = 0, localOffset = 0;
        readLE16(zip, offset + 10, method);
        readLE32(zip, offset + 20, compressedSize);
        readLE32(zip, offset + 24, uncompressedSize);
        readLE16(zip, offset + 28, nameLen);
        readLE16(zip, offset + 30, extraLen);
        readLE16(zip, offset + 32, commentLen);
        readLE32(zip, offset + 42, localOffset);

        if (!fits(zip, offset + CD_SIZE, nameLen)) {
            syslog(SYSLOG_WARNING, "ContainerReader: central directory name runs off the buffer");
            break;
        }
        const std::string name = zip.substr(offset + CD_SIZE, nameLen);
        offset += CD_SIZE + uint64_t(nameLen) + extraLen + commentLen;

        if (name.empty() || name.back() == '/')
            continue;   // directory

        // the local header is authoritative for where the data starts
        uint32_t localSig = 0;
        uint16_t localNameLen = 0, localExtraLen = 0;
        if (!fits(zip, localOffset, LFH_SIZE) || !readLE32(zip, localOffset, localSig) || localSig != LFH_SIGNATURE) {
            syslog(SYSLOG_WARNING, "ContainerReader: bad local header for [%s]", name.c_str());
            ++stats.corrupt;
            continue;
        }
        readLE16(zip, localOffset + 26, localNameLen);
        readLE16(zip, localOffset + 28, localExtraLen);

        const uint64_t dataOffset = uint64_t(localOffset) + LFH_SIZE + localNameLen + localExtraLen;
        if (!fits(zip, dataOffset, compressedSize)) {
            syslog(SYSLOG_WARNING, "ContainerReader: data for [%s] runs past end of buffer", name.c_str());
            ++stats.corrupt;
            continue;
        }

        const char* data = zip.data() + dataOffset;
        if (method == 0) {
            entriesOut[name].assign(data, compressedSize);
            ++stats.extracted;
        } else if (method == 8) {
            std::string inflated;
            if (!inflateRaw(data, compressedSize, uncompressedSize, inflated)) {
                syslog(SYSLOG_WARNING, "ContainerReader: inflate failed for [%s]", name.c_str());
                ++stats.corrupt;
                continue;
            }
            entriesOut[name] = std::move(inflated);
            ++stats.extracted;
        } else {
            syslog(SYSLOG_WARNING, "ContainerReader: unsupported compression method %u for [%s]",
                   static_cast<unsigned>(method), name.c_str());
            ++stats.unsupported;
        }
    }

    if (statsOut) *statsOut = stats;
    return true;
}

// headerless (raw) DEFLATE, as stored in ZIP method 8
bool ContainerReader::inflateRaw(const char* data, size_t len, uint64_t sizeHint, std::string& out) {
    z_stream strm{};
    if (inflateInit2(&strm, -MAX_WBITS) != Z_OK)
        return false;

    out.clear();
    if (sizeHint > 0 && sizeHint <= MAX_ENTRY_SIZE)
        out.reserve(static_cast<size_t>(sizeHint));

    strm.next_in  = reinterpret_cast<Bytef*>(const_cast<char*>(data));
    strm.avail_in = static_cast<uInt>(len);

    char chunk[64 * 1024];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        strm.next_out  = reinterpret_cast<Bytef*>(chunk);
        strm.avail_out = sizeof chunk;

        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            break;  // Z_BUF_ERROR here means truncated input
        }

        const size_t produced = sizeof chunk - strm.avail_out;
        if (out.size() + produced > MAX_ENTRY_SIZE) {
            ret = Z_MEM_ERROR;
            break;
        }
        out.append(chunk, produced);

        if (ret == Z_OK && strm.avail_in == 0 && produced == 0) {
            ret = Z_DATA_ERROR;     // input exhausted before end of stream
            break;
        }
    }

    inflateEnd(&strm);
    if (ret != Z_STREAM_END) {
        out.clear();
        return false;
    }
    return true;
}
