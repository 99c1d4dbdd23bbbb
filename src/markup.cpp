#include <cctype>
#include <cstdint>

#include "markup.h"
#include "utils.h"

static bool isNameChar(char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == ':' || c == '-' || c == '_' || c == '.' || u >= 0x80;
}

static bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f';
}

static std::string localPart(const std::string& qname) {
    const auto colon = qname.rfind(':');
    return (colon == std::string::npos) ? qname : qname.substr(colon + 1);
}

static void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp <= 0x10FFFF) {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string decodeXmlEntities(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '&') { out += s[i]; continue; }
        const auto semi = s.find(';', i + 1);
        if (semi == std::string::npos || semi - i > 12) { out += s[i]; continue; }

        const std::string ent = s.substr(i + 1, semi - i - 1);
        if      (ent == "amp")  out += '&';
        else if (ent == "lt")   out += '<';
        else if (ent == "gt")   out += '>';
        else if (ent == "quot") out += '"';
        else if (ent == "apos") out += '\'';
        else if (ent.size() > 1 && ent[0] == '#') {
            uint32_t cp = 0;
            bool ok = true;
            const bool hex = (ent[1] == 'x' || ent[1] == 'X');
            for (size_t k = hex ? 2 : 1; k < ent.size() && ok; ++k) {
                const char c = ent[k];
                if (hex && std::isxdigit(static_cast<unsigned char>(c)))
                    cp = cp * 16 + static_cast<uint32_t>(std::isdigit(static_cast<unsigned char>(c)) ? c - '0' : (std::tolower(c) - 'a' + 10));
                else if (!hex && std::isdigit(static_cast<unsigned char>(c)))
                    cp = cp * 10 + static_cast<uint32_t>(c - '0');
                else
                    ok = false;
            }
            if (!ok) { out += s[i]; continue; }
            appendUtf8(out, cp);
        } else {
            out += s[i];
            continue;
        }
        i = semi;
    }
    return out;
}

const MarkupAttr* MarkupTag::attr(const std::string& n) const {
    for (const auto& a : attrs)
        if (a.name == n) return &a;
    return nullptr;
}

std::string MarkupTag::attrValue(const std::string& n) const {
    const MarkupAttr* a = attr(n);
    return a ? a->value : std::string();
}

bool parseStartTag(const std::string& doc, size_t pos, MarkupTag& out) {
    if (pos >= doc.size() || doc[pos] != '<') return false;
    size_t i = pos + 1;
    if (i >= doc.size() || !(std::isalpha(static_cast<unsigned char>(doc[i])) || doc[i] == '_')) return false;

    out = MarkupTag();
    out.start = pos;
    const size_t nameStart = i;
    while (i < doc.size() && isNameChar(doc[i])) ++i;
    out.name = toLower(doc.substr(nameStart, i - nameStart));

    while (i < doc.size()) {
        const size_t attrStart = i;
        while (i < doc.size() && isSpace(doc[i])) ++i;
        if (i >= doc.size()) return false;

        if (doc[i] == '>') {
            out.end = i + 1;
            return true;
        }
        if (doc[i] == '/' && i + 1 < doc.size() && doc[i + 1] == '>') {
            out.selfClosing = true;
            out.end = i + 2;
            return true;
        }

        const size_t an = i;
        while (i < doc.size() && isNameChar(doc[i])) ++i;
        if (i == an) { ++i; continue; }     // stray character: skip it

        MarkupAttr a;
        a.name = toLower(doc.substr(an, i - an));
        a.attrStart = attrStart;

        size_t j = i;
        while (j < doc.size() && isSpace(doc[j])) ++j;
        if (j < doc.size() && doc[j] == '=') {
            ++j;
            while (j < doc.size() && isSpace(doc[j])) ++j;
            if (j >= doc.size()) return false;
            if (doc[j] == '"' || doc[j] == '\'') {
                const char q = doc[j];
                const auto close = doc.find(q, j + 1);
                if (close == std::string::npos) return false;
                a.valueStart = j + 1;
                a.valueEnd = close;
                i = close + 1;
            } else {
                // unquoted value
                a.valueStart = j;
                while (j < doc.size() && !isSpace(doc[j]) && doc[j] != '>' &&
                       !(doc[j] == '/' && j + 1 < doc.size() && doc[j + 1] == '>'))
                    ++j;
                a.valueEnd = j;
                i = j;
            }
            a.value = decodeXmlEntities(doc.substr(a.valueStart, a.valueEnd - a.valueStart));
        } else {
            a.valueStart = a.valueEnd = i;  // boolean attribute
        }
        a.attrEnd = i;
        out.attrs.push_back(std::move(a));
    }
    return false;
}

std::vector<MarkupTag> findTags(const std::string& doc, const std::string& localName) {
    std::vector<MarkupTag> tags;
    const std::string want = toLower(localName);
    size_t pos = 0;
    while ((pos = doc.find('<', pos)) != std::string::npos) {
        if (doc.compare(pos, 4, "<!--") == 0) {
            const auto close = doc.find("-->", pos + 4);
            if (close == std::string::npos) break;
            pos = close + 3;
            continue;
        }
        MarkupTag tag;
        if (parseStartTag(doc, pos, tag)) {
            if (localPart(tag.name) == want)
                tags.push_back(tag);
            pos = tag.end;
        } else {
            ++pos;
        }
    }
    return tags;
}

bool firstElementText(const std::string& doc, const std::string& qname, std::string& out) {
    const std::string want = toLower(qname);
    const std::string lowerDoc = toLower(doc);
    size_t pos = 0;
    while ((pos = doc.find('<', pos)) != std::string::npos) {
        MarkupTag tag;
        if (!parseStartTag(doc, pos, tag)) { ++pos; continue; }
        pos = tag.end;
        if (tag.name != want || tag.selfClosing) continue;

        // find the matching close tag, case-insensitively
        const auto close = lowerDoc.find("</" + want, tag.end);
        if (close == std::string::npos) return false;

        std::string text = trim(decodeXmlEntities(doc.substr(tag.end, close - tag.end)));
        if (text.empty()) continue;     // <dc:title/> style empties don't count
        out = text;
        return true;
    }
    return false;
}
