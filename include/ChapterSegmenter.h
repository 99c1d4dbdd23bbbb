#ifndef BOOKPAGED_CHAPTERSEGMENTER_H
#define BOOKPAGED_CHAPTERSEGMENTER_H

#include <string>
#include <unordered_set>
#include <vector>

#include "ContainerReader.h"
#include "PackageResolver.h"
#include "ResourceResolver.h"

struct SegmentedChapter {
    std::string href;          // spine href, the chapter's stable identity
    std::string html;          // body innerHTML, resource references rewritten
    long long charLength = 0;  // rendered plain-text length in code points
};

struct SegmentResult {
    std::vector<SegmentedChapter> chapters;    // spine order, failures left out
    std::string styles;                        // deduplicated, joined with '\n'
    int skipped        = 0;
    int imagesReplaced = 0;
    int imagesMissed   = 0;

    long long totalCharacters() const;
};

//
// ChapterSegmenter: walks the spine and turns each XHTML document into a
// chapter.  Offsets are not assigned here; the store does that when it
// writes the batch.
//
class ChapterSegmenter {
public:
    ChapterSegmenter(const ContainerReader::Entries& entries, ResourceResolver& resources);

    SegmentResult segment(const std::vector<SpineItem>& spine);

private:
    struct StyleSet {
        std::vector<std::string> ordered;
        std::unordered_set<std::string> seen;
        void add(const std::string& css);
    };

    std::string rewriteCssUrls(const std::string& css, const std::string& docPath);

    // RETURNS: false if the document is missing, not well-formed, or has no usable body
    bool segmentDocument(const SpineItem& item, SegmentedChapter& out, StyleSet& styles, SegmentResult& counts);

    const ContainerReader::Entries& entries_;
    ResourceResolver& resources_;
};

#endif // BOOKPAGED_CHAPTERSEGMENTER_H
