#include <gtest/gtest.h>

#include "ContainerReader.h"
#include "CoverExtractor.h"
#include "EpubFixture.h"
#include "PackageResolver.h"

TEST(CoverExtractor, ContentTypeFromExtension) {
    std::string type, ext;
    CoverExtractor::typeForHref("a/Front.PNG", type, ext);
    EXPECT_EQ(type, "image/png");
    EXPECT_EQ(ext, "png");

    CoverExtractor::typeForHref("cover.jpeg", type, ext);
    EXPECT_EQ(type, "image/jpeg");
    EXPECT_EQ(ext, "jpg");

    CoverExtractor::typeForHref("cover.webp", type, ext);
    EXPECT_EQ(type, "image/webp");

    CoverExtractor::typeForHref("cover.bmp", type, ext);      // unknown falls back to jpeg
    EXPECT_EQ(type, "image/jpeg");
    EXPECT_EQ(ext, "jpg");
}

TEST(CoverExtractor, ResolvesAgainstPackageDirectory) {
    ContainerReader::Entries entries;
    entries["OEBPS/images/My Cover.png"] = "PNGDATA";
    PackageInfo pkg;
    pkg.opfDir = "OEBPS/";
    pkg.coverHref = "images/My%20Cover.png";

    CoverImage cover;
    ASSERT_TRUE(CoverExtractor::extract(entries, pkg, cover));
    EXPECT_EQ(cover.bytes, "PNGDATA");
    EXPECT_EQ(cover.contentType, "image/png");
    EXPECT_EQ(cover.ext, "png");
}

TEST(CoverExtractor, ArchiveAbsoluteHref) {
    ContainerReader::Entries entries;
    entries["cover.jpg"] = "JPG";
    PackageInfo pkg;
    pkg.opfDir = "OEBPS/";
    pkg.coverHref = "/cover.jpg";

    CoverImage cover;
    ASSERT_TRUE(CoverExtractor::extract(entries, pkg, cover));
    EXPECT_EQ(cover.bytes, "JPG");
}

TEST(CoverExtractor, HrefClimbingOutOfPackageDirectory) {
    ContainerReader::Entries entries;
    entries["Images/cover.png"] = "PNG";
    PackageInfo pkg;
    pkg.opfPath = "OEBPS/content.opf";
    pkg.opfDir = "OEBPS/";
    pkg.coverHref = "../Images/cover.png";

    CoverImage cover;
    ASSERT_TRUE(CoverExtractor::extract(entries, pkg, cover));
    EXPECT_EQ(cover.bytes, "PNG");
    EXPECT_EQ(cover.contentType, "image/png");
}

TEST(CoverExtractor, HrefClimbingFromResolvedPackage) {
    EpubBuilder book;
    book.addItem("cover", "../Images/cover.png", "image/png", "PNGBYTES", "cover-image");
    book.addChapter("c1", "text/c1.xhtml", "<p>one</p>");

    ContainerReader::Entries entries;
    ASSERT_TRUE(ContainerReader::read(book.build(), entries));
    PackageInfo pkg;
    ASSERT_TRUE(PackageResolver::resolve(entries, pkg));
    ASSERT_EQ(pkg.coverHref, "../Images/cover.png");

    CoverImage cover;
    ASSERT_TRUE(CoverExtractor::extract(entries, pkg, cover));
    EXPECT_EQ(cover.bytes, "PNGBYTES");
}

TEST(CoverExtractor, MissingOrEmptyCover) {
    ContainerReader::Entries entries;
    entries["OEBPS/empty.jpg"] = "";
    PackageInfo pkg;
    pkg.opfDir = "OEBPS/";

    CoverImage cover;
    EXPECT_FALSE(CoverExtractor::extract(entries, pkg, cover));    // none declared

    pkg.coverHref = "gone.jpg";
    EXPECT_FALSE(CoverExtractor::extract(entries, pkg, cover));

    pkg.coverHref = "empty.jpg";
    EXPECT_FALSE(CoverExtractor::extract(entries, pkg, cover));
}

TEST(CoverExtractor, SameInputSameCover) {
    const std::string bytes = tenChapterEpub();

    CoverImage first, second;
    for (CoverImage* out : {&first, &second}) {
        ContainerReader::Entries entries;
        ASSERT_TRUE(ContainerReader::read(bytes, entries));
        PackageInfo pkg;
        ASSERT_TRUE(PackageResolver::resolve(entries, pkg));
        ASSERT_TRUE(CoverExtractor::extract(entries, pkg, *out));
    }
    EXPECT_EQ(first.bytes, second.bytes);
    EXPECT_EQ(first.contentType, "image/jpeg");
    EXPECT_EQ(second.contentType, first.contentType);
    EXPECT_EQ(second.ext, first.ext);
    EXPECT_EQ(first.bytes.size(), 14u);
}
