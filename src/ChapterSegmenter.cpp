#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstring>
#include <memory>
#include <strings.h>
#include <syslog.h>

#include <expat.h>

#include "ChapterSegmenter.h"
#include "markup.h"
#include "utils.h"

long long SegmentResult::totalCharacters() const {
    long long total = 0;
    for (const auto& ch : chapters) total += ch.charLength;
    return total;
}

void ChapterSegmenter::StyleSet::add(const std::string& css) {
    if (trim(css).empty()) return;
    if (seen.insert(css).second) ordered.push_back(css);
}

ChapterSegmenter::ChapterSegmenter(const ContainerReader::Entries& entries, ResourceResolver& resources)
    : entries_(entries), resources_(resources) {}

namespace {

// element that may carry an image reference, as a raw source range
struct ImageRef {
    size_t tagStart = 0;
    size_t tagLen   = 0;
    bool svg        = false;
};

struct Splice {
    size_t start = 0;
    size_t end   = 0;
    std::string text;
};

// state shared with the expat callbacks for one document
struct DocScan {
    XML_Parser parser = nullptr;

    int depth       = 0;
    int bodyDepth   = 0;      // depth of <body>, 0 while not inside it
    bool bodyFound  = false;
    bool bodyClosed = false;
    size_t innerStart = 0;
    size_t innerEnd   = 0;

    int styleDepth  = 0;
    int scriptDepth = 0;
    std::string styleBuf;

    std::vector<std::string> inlineStyles;
    std::vector<std::string> stylesheetHrefs;
    std::vector<ImageRef> images;
    long long textLength = 0;

    bool inBody() const { return bodyDepth > 0 && !bodyClosed; }
};

std::string localName(const XML_Char* name) {
    const char* colon = std::strrchr(name, ':');
    return toLower(colon ? colon + 1 : name);
}

const char* attrOf(const XML_Char** atts, const char* want) {
    for (int i = 0; atts[i]; i += 2) {
        if (strcasecmp(atts[i], want) == 0) return atts[i + 1];
    }
    return nullptr;
}

void XMLCALL startElement(void* userData, const XML_Char* name, const XML_Char** atts) {
    auto* scan = static_cast<DocScan*>(userData);
    const auto idx = static_cast<size_t>(XML_GetCurrentByteIndex(scan->parser));
    const auto cnt = static_cast<size_t>(XML_GetCurrentByteCount(scan->parser));
    const std::string local = localName(name);
    ++scan->depth;

    if (local == "body" && !scan->bodyFound) {
        scan->bodyFound  = true;
        scan->bodyDepth  = scan->depth;
        scan->innerStart = idx + cnt;
        scan->innerEnd   = idx + cnt;
    } else if (local == "style") {
        if (scan->styleDepth++ == 0) scan->styleBuf.clear();
    } else if (local == "script") {
        ++scan->scriptDepth;
    } else if (local == "link") {
        const char* rel  = attrOf(atts, "rel");
        const char* href = attrOf(atts, "href");
        if (rel && href && toLower(rel).find("stylesheet") != std::string::npos)
            scan->stylesheetHrefs.emplace_back(href);
    } else if ((local == "img" || local == "image") && scan->inBody()) {
        scan->images.push_back(ImageRef{idx, cnt, local == "image"});
    }
}

void XMLCALL endElement(void* userData, const XML_Char* name) {
    auto* scan = static_cast<DocScan*>(userData);
    const std::string local = localName(name);

    if (local == "body" && scan->inBody() && scan->depth == scan->bodyDepth) {
        const auto idx = static_cast<size_t>(XML_GetCurrentByteIndex(scan->parser));
        scan->innerEnd = std::max(idx, scan->innerStart);    // <body/> has no inner text
        scan->bodyClosed = true;
    } else if (local == "style" && scan->styleDepth > 0) {
        if (--scan->styleDepth == 0) scan->inlineStyles.push_back(scan->styleBuf);
    } else if (local == "script" && scan->scriptDepth > 0) {
        --scan->scriptDepth;
    }
    --scan->depth;
}

void XMLCALL characterData(void* userData, const XML_Char* s, int len) {
    auto* scan = static_cast<DocScan*>(userData);
    if (scan->styleDepth > 0) {
        scan->styleBuf.append(s, static_cast<size_t>(len));
    } else if (scan->inBody() && scan->scriptDepth == 0) {
        scan->textLength += utf8Length(s, static_cast<size_t>(len));
    }
}

// Undeclared entities (&nbsp;, &mdash;, ...) arrive here as raw text; each
// renders as one character.  Comments, PIs and the doctype are ignored.
void XMLCALL defaultHandler(void* userData, const XML_Char* s, int len) {
    auto* scan = static_cast<DocScan*>(userData);
    if (len >= 3 && s[0] == '&' && s[len - 1] == ';' && scan->inBody() &&
        scan->scriptDepth == 0 && scan->styleDepth == 0)
        scan->textLength += 1;
}

std::string escapeAttr(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
        if (c == '&') out += "&amp;";
        else if (c == '"') out += "&quot;";
        else out += c;
    }
    return out;
}


void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string utf16ToUtf8(const std::string& src, size_t from, bool bigEndian) {
    std::string out;
    out.reserve(src.size() / 2);
    auto unitAt = [&](size_t i) -> uint32_t {
        const auto hi = static_cast<unsigned char>(src[bigEndian ? i : i + 1]);
        const auto lo = static_cast<unsigned char>(src[bigEndian ? i + 1 : i]);
        return (uint32_t(hi) << 8) | lo;
    };
    for (size_t i = from; i + 1 < src.size(); i += 2) {
        uint32_t cp = unitAt(i);
        if (cp >= 0xD800 && cp <= 0xDBFF && i + 3 < src.size()) {
            const uint32_t low = unitAt(i + 2);
            if (low >= 0xDC00 && low <= 0xDFFF) {
                cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                i += 2;
            } else {
                cp = 0xFFFD;
            }
        } else if (cp >= 0xD800 && cp <= 0xDFFF) {
            cp = 0xFFFD;    // unpaired surrogate
        }
        appendUtf8(out, cp);
    }
    return out;
}

// encoding="..." from the XML declaration, lowercased; empty if none
std::string declaredEncoding(const std::string& src) {
    if (src.compare(0, 5, "<?xml") != 0) return {};
    const auto end = src.find("?>");
    if (end == std::string::npos) return {};
    const auto enc = src.find("encoding", 5);
    if (enc == std::string::npos || enc > end) return {};
    const auto quote = src.find_first_of("\"'", enc);
    if (quote == std::string::npos || quote > end) return {};
    const auto close = src.find(src[quote], quote + 1);
    if (close == std::string::npos || close > end) return {};
    return toLower(src.substr(quote + 1, close - quote - 1));
}

// Chapter html is cut from the source text, so the source itself must be
// UTF-8.  Covers the encodings expat knows besides UTF-8: UTF-16 and Latin-1.
std::string toUtf8Source(const std::string& src) {
    if (src.size() >= 2) {
        const auto b0 = static_cast<unsigned char>(src[0]);
        const auto b1 = static_cast<unsigned char>(src[1]);
        if (b0 == 0xFF && b1 == 0xFE) return utf16ToUtf8(src, 2, false);
        if (b0 == 0xFE && b1 == 0xFF) return utf16ToUtf8(src, 2, true);
        if (b0 == '<' && b1 == 0)     return utf16ToUtf8(src, 0, false);
        if (b0 == 0 && b1 == '<')     return utf16ToUtf8(src, 0, true);
    }

    const std::string enc = declaredEncoding(src);
    if (enc == "iso-8859-1" || enc == "iso_8859-1" || enc == "iso8859-1" || enc == "latin1" || enc == "latin-1") {
        std::string out;
        out.reserve(src.size() + src.size() / 8);
        for (char c : src) appendUtf8(out, static_cast<unsigned char>(c));
        return out;
    }
    return src;
}

bool startsWithNoCase(const std::string& s, size_t pos, const char* prefix) {
    const size_t n = std::strlen(prefix);
    return pos + n <= s.size() && strncasecmp(s.c_str() + pos, prefix, n) == 0;
}

}  // namespace

// Point every url(...) in a stylesheet at its re-hosted copy.  References are
// relative to the stylesheet itself; misses are left as written.
std::string ChapterSegmenter::rewriteCssUrls(const std::string& css, const std::string& docPath) {
    std::string out;
    out.reserve(css.size());
    size_t cursor = 0;
    size_t pos = 0;
    while ((pos = css.find_first_of("uU", pos)) != std::string::npos) {
        if (!startsWithNoCase(css, pos, "url(")) {
            ++pos;
            continue;
        }
        size_t start = pos + 4;
        while (start < css.size() && std::isspace(static_cast<unsigned char>(css[start]))) ++start;
        char quote = 0;
        if (start < css.size() && (css[start] == '"' || css[start] == '\'')) quote = css[start++];

        const size_t end = quote ? css.find(quote, start) : css.find(')', start);
        if (end == std::string::npos) break;

        const std::string ref = trim(css.substr(start, end - start));
        pos = end;
        if (ref.empty() || ref[0] == '#' || ResourceResolver::isExternal(ref)) continue;

        std::string url;
        if (!resources_.resolve(ref, docPath, url)) {
            syslog(SYSLOG_DEBUG, "ChapterSegmenter: [%s] url(%s) not found", docPath.c_str(), ref.c_str());
            continue;
        }
        out.append(css, cursor, start - cursor);
        out += url;
        cursor = end;
    }
    out.append(css, cursor, std::string::npos);
    return out;
}

bool ChapterSegmenter::segmentDocument(const SpineItem& item, SegmentedChapter& out, StyleSet& styles,
                                       SegmentResult& counts) {
    auto it = entries_.find(item.path);
    if (it == entries_.end()) {
        syslog(SYSLOG_WARNING, "ChapterSegmenter: spine item [%s] not in archive", item.path.c_str());
        return false;
    }
    const std::string source = toUtf8Source(it->second);

    // source is UTF-8 now, whatever the declaration says
    std::unique_ptr<XML_ParserStruct, decltype(&XML_ParserFree)> parser(XML_ParserCreate("UTF-8"), XML_ParserFree);
    if (!parser) {
        syslog(SYSLOG_ERR, "ChapterSegmenter: couldn't allocate XML parser");
        return false;
    }

    DocScan scan;
    scan.parser = parser.get();

    // Undeclared HTML entities would otherwise be fatal: treat the document as
    // having an (unread) external DTD so they are reported as skipped instead.
    XML_UseForeignDTD(parser.get(), XML_TRUE);
    XML_SetUserData(parser.get(), &scan);
    XML_SetElementHandler(parser.get(), startElement, endElement);
    XML_SetCharacterDataHandler(parser.get(), characterData);
    XML_SetDefaultHandlerExpand(parser.get(), defaultHandler);

    if (XML_Parse(parser.get(), source.data(), static_cast<int>(source.size()), XML_TRUE) == XML_STATUS_ERROR) {
        syslog(SYSLOG_WARNING, "ChapterSegmenter: [%s] parse error at line %lu: %s", item.path.c_str(),
               static_cast<unsigned long>(XML_GetCurrentLineNumber(parser.get())),
               XML_ErrorString(XML_GetErrorCode(parser.get())));
        return false;
    }

    for (const auto& css : scan.inlineStyles)
        styles.add(rewriteCssUrls(css, item.path));
    for (const auto& href : scan.stylesheetHrefs) {
        std::string path;
        if (resources_.locate(href, item.path, path))
            styles.add(rewriteCssUrls(entries_.at(path), path));
        else
            syslog(SYSLOG_DEBUG, "ChapterSegmenter: stylesheet [%s] in [%s] not found", href.c_str(), item.path.c_str());
    }

    if (!scan.bodyFound || !scan.bodyClosed) {
        syslog(SYSLOG_WARNING, "ChapterSegmenter: [%s] has no body", item.path.c_str());
        return false;
    }

    // rewrite image references inside the body, working on raw source ranges
    std::vector<Splice> splices;
    for (const auto& img : scan.images) {
        if (img.tagStart < scan.innerStart || img.tagStart + img.tagLen > scan.innerEnd) continue;

        const std::string raw = source.substr(img.tagStart, img.tagLen);
        MarkupTag tag;
        if (!parseStartTag(raw, 0, tag)) continue;

        const std::vector<std::string> names = img.svg ? std::vector<std::string>{"xlink:href", "href"}
                                                       : std::vector<std::string>{"src"};
        for (const auto& attrName : names) {
            const MarkupAttr* a = tag.attr(attrName);
            if (!a || a->value.empty() || ResourceResolver::isExternal(a->value)) continue;

            std::string url;
            if (resources_.resolve(a->value, item.path, url)) {
                splices.push_back(Splice{img.tagStart + a->valueStart, img.tagStart + a->valueEnd, escapeAttr(url)});
                ++counts.imagesReplaced;
            } else {
                // drop the dangling reference rather than leave a broken image
                splices.push_back(Splice{img.tagStart + a->attrStart, img.tagStart + a->attrEnd, std::string()});
                ++counts.imagesMissed;
                syslog(SYSLOG_DEBUG, "ChapterSegmenter: [%s] image [%s] not found", item.path.c_str(), a->value.c_str());
            }
        }
    }

    std::sort(splices.begin(), splices.end(), [](const Splice& a, const Splice& b) { return a.start < b.start; });

    std::string html;
    html.reserve(scan.innerEnd - scan.innerStart);
    size_t cursor = scan.innerStart;
    for (const auto& sp : splices) {
        if (sp.start < cursor) continue;    // overlapping edits can't happen, but never go backwards
        html.append(source, cursor, sp.start - cursor);
        html += sp.text;
        cursor = sp.end;
    }
    html.append(source, cursor, scan.innerEnd - cursor);

    if (trim(html).empty()) {
        syslog(SYSLOG_DEBUG, "ChapterSegmenter: [%s] has an empty body", item.path.c_str());
        return false;
    }

    out.href = item.href;
    out.html = std::move(html);
    out.charLength = scan.textLength;
    return true;
}

SegmentResult ChapterSegmenter::segment(const std::vector<SpineItem>& spine) {
    SegmentResult result;
    StyleSet styles;

    for (const auto& item : spine) {
        SegmentedChapter chapter;
        if (segmentDocument(item, chapter, styles, result))
            result.chapters.push_back(std::move(chapter));
        else
            ++result.skipped;
    }

    for (size_t i = 0; i < styles.ordered.size(); ++i) {
        if (i) result.styles += '\n';
        result.styles += styles.ordered[i];
    }

    syslog(SYSLOG_INFO, "ChapterSegmenter: %zu chapters, %d skipped, %zu stylesheets, images %d replaced / %d missing",
           result.chapters.size(), result.skipped, styles.ordered.size(), result.imagesReplaced, result.imagesMissed);
    return result;
}
