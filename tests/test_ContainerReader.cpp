#include <gtest/gtest.h>

#include "ContainerReader.h"
#include "EpubFixture.h"

namespace {

std::string binaryBlob(size_t n) {
    std::string s(n, '\0');
    for (size_t i = 0; i < n; ++i)
        s[i] = static_cast<char>((i * 131 + 7) & 0xFF);
    return s;
}

}  // namespace

TEST(ContainerReader, ExtractsStoredAndDeflatedEntriesByteExact) {
    const std::string text(5000, 'x');
    const std::string bin = binaryBlob(70000);      // larger than one inflate chunk

    ZipBuilder zip;
    zip.add("mimetype", "application/epub+zip", ZipBuilder::STORE);
    zip.add("OEBPS/text.xhtml", text, ZipBuilder::DEFLATE);
    zip.add("OEBPS/blob.bin", bin, ZipBuilder::DEFLATE);
    zip.add("OEBPS/raw.bin", bin, ZipBuilder::STORE);

    ContainerReader::Entries entries;
    ContainerReader::Stats stats;
    ASSERT_TRUE(ContainerReader::read(zip.build(), entries, &stats));

    ASSERT_EQ(entries.size(), 4u);
    EXPECT_EQ(entries["mimetype"], "application/epub+zip");
    EXPECT_EQ(entries["OEBPS/text.xhtml"], text);
    EXPECT_EQ(entries["OEBPS/blob.bin"], bin);
    EXPECT_EQ(entries["OEBPS/raw.bin"], bin);
    EXPECT_EQ(stats.listed, 4);
    EXPECT_EQ(stats.extracted, 4);
    EXPECT_EQ(stats.corrupt, 0);
}

TEST(ContainerReader, FindsEndRecordBehindArchiveComment) {
    ZipBuilder zip;
    zip.add("a.txt", "alpha");
    const std::string comment(4000, 'c');

    ContainerReader::Entries entries;
    ASSERT_TRUE(ContainerReader::read(zip.build(comment), entries));
    EXPECT_EQ(entries["a.txt"], "alpha");
}

TEST(ContainerReader, SkipsDirectories) {
    ZipBuilder zip;
    zip.addDirectory("OEBPS/");
    zip.add("OEBPS/a.txt", "alpha");

    ContainerReader::Entries entries;
    ASSERT_TRUE(ContainerReader::read(zip.build(), entries));
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries.count("OEBPS/"), 0u);
}

TEST(ContainerReader, DropsUnsupportedMethodPerEntry) {
    ZipBuilder zip;
    zip.add("good.txt", "still here");
    zip.addRaw("bzip2.bin", "BZh91AY&SY", 12, 100);

    ContainerReader::Entries entries;
    ContainerReader::Stats stats;
    ASSERT_TRUE(ContainerReader::read(zip.build(), entries, &stats));
    EXPECT_EQ(entries.count("bzip2.bin"), 0u);
    EXPECT_EQ(entries["good.txt"], "still here");
    EXPECT_EQ(stats.unsupported, 1);
    EXPECT_EQ(stats.extracted, 1);
}

TEST(ContainerReader, DropsCorruptDeflateStream) {
    ZipBuilder zip;
    zip.addRaw("bad.xhtml", std::string(32, '\xFF'), ZipBuilder::DEFLATE, 64);   // reserved block type
    zip.add("good.xhtml", "<p>fine</p>");

    ContainerReader::Entries entries;
    ContainerReader::Stats stats;
    ASSERT_TRUE(ContainerReader::read(zip.build(), entries, &stats));
    EXPECT_EQ(entries.count("bad.xhtml"), 0u);
    EXPECT_EQ(entries["good.xhtml"], "<p>fine</p>");
    EXPECT_EQ(stats.corrupt, 1);
}

TEST(ContainerReader, DropsTruncatedDeflateStream) {
    const std::string data = binaryBlob(20000);
    const std::string deflated = ZipBuilder::deflateRaw(data);

    ZipBuilder zip;
    zip.addRaw("cut.bin", deflated.substr(0, deflated.size() / 2), ZipBuilder::DEFLATE,
               static_cast<uint32_t>(data.size()));

    ContainerReader::Entries entries;
    ContainerReader::Stats stats;
    ASSERT_TRUE(ContainerReader::read(zip.build(), entries, &stats));
    EXPECT_TRUE(entries.empty());
    EXPECT_EQ(stats.corrupt, 1);
}

TEST(ContainerReader, RejectsBufferWithoutEndRecord) {
    ContainerReader::Entries entries;
    entries["stale"] = "x";
    EXPECT_FALSE(ContainerReader::read("this is plainly not a zip archive at all", entries));
    EXPECT_TRUE(entries.empty());
    EXPECT_FALSE(ContainerReader::read("", entries));
}

TEST(ContainerReader, TruncatedArchiveKeepsWhatItCanRead) {
    ZipBuilder zip;
    zip.add("a.txt", "alpha");
    zip.add("b.txt", "beta");
    std::string bytes = zip.build();

    // point the central directory past the end of the buffer
    const size_t eocd = bytes.size() - 22;
    bytes[eocd + 16] = '\xFF';
    bytes[eocd + 17] = '\xFF';

    ContainerReader::Entries entries;
    ContainerReader::Stats stats;
    EXPECT_TRUE(ContainerReader::read(bytes, entries, &stats));
    EXPECT_TRUE(entries.empty());
    EXPECT_EQ(stats.listed, 0);
}
