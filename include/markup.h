#ifndef BOOKPAGED_MARKUP_H
#define BOOKPAGED_MARKUP_H

#include <string>
#include <vector>

//
// Minimal tag/attribute scanner for small, fixed-shape XML documents
// (container.xml, the OPF package) and for single raw tags lifted out of
// chapter XHTML.  Not an XML parser: no nesting, no validation.
//
struct MarkupAttr {
    std::string name;          // lowercased
    std::string value;         // entity-decoded
    size_t valueStart = 0;     // raw value range in the scanned text (quotes excluded)
    size_t valueEnd   = 0;
    size_t attrStart  = 0;     // whole attribute range, leading whitespace included
    size_t attrEnd    = 0;
};

struct MarkupTag {
    std::string name;          // lowercased, namespace prefix kept ("dc:title", "opf:item")
    size_t start = 0;          // offset of '<'
    size_t end   = 0;          // offset just past '>'
    bool selfClosing = false;
    std::vector<MarkupAttr> attrs;

    const MarkupAttr* attr(const std::string& name) const;
    std::string attrValue(const std::string& name) const;   // empty if absent
};

// Parse the start tag that begins at doc[pos] ('<').  RETURNS false if it isn't one.
bool parseStartTag(const std::string& doc, size_t pos, MarkupTag& out);

// All start tags whose local name (prefix ignored) matches, in document order.
std::vector<MarkupTag> findTags(const std::string& doc, const std::string& localName);

// Text of the first element with this qualified name, trimmed and entity-decoded.
// RETURNS false if there is none.
bool firstElementText(const std::string& doc, const std::string& qname, std::string& out);

// Decode the five XML entities plus numeric character references.
std::string decodeXmlEntities(const std::string& s);

#endif // BOOKPAGED_MARKUP_H
