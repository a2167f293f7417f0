#include "engine/tar_archive.hpp"

#include <cstdio>
#include <cstring>
#include <stdexcept>

#include <gtest/gtest.h>

namespace kivybot::engine {
namespace {

// Header block for a member of the given type, with a valid-enough size field.
std::string Header(const std::string& name, std::size_t size, char type) {
    std::string header(512, '\0');
    std::memcpy(&header[0], name.data(), name.size());
    char size_field[12];
    std::snprintf(size_field, sizeof(size_field), "%011llo", static_cast<unsigned long long>(size));
    std::memcpy(&header[124], size_field, 11);
    header[156] = type;
    return header;
}

std::string Padded(const std::string& data) {
    std::string out = data;
    out.append((512 - data.size() % 512) % 512, '\0');
    return out;
}

TEST(TarArchiveTest, WrittenArchiveIsBlockAligned) {
    TarArchive archive;
    archive.AddFile("main.py", "print('hi')\n");
    const auto tar = archive.Finish();
    EXPECT_EQ(tar.size() % 512, 0u);
    EXPECT_EQ(tar.size(), 512u + 512u + 1024u);
    EXPECT_EQ(tar.substr(257, 5), "ustar");
}

TEST(TarArchiveTest, ParsesWhatItWrites) {
    TarArchive archive;
    archive.AddFile("main.py", "print('hi')\n");
    archive.AddFile("empty.txt", "");
    const auto entries = TarArchive::Parse(archive.Finish());
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "main.py");
    EXPECT_EQ(entries[0].data, "print('hi')\n");
    EXPECT_EQ(entries[1].name, "empty.txt");
    EXPECT_TRUE(entries[1].data.empty());
}

TEST(TarArchiveTest, RejectsLongNames) {
    TarArchive archive;
    EXPECT_THROW(archive.AddFile(std::string(100, 'a'), "x"), std::invalid_argument);
    EXPECT_THROW(archive.AddFile("", "x"), std::invalid_argument);
}

TEST(TarArchiveTest, ExtractIgnoresDotSlashPrefix) {
    const std::string tar = Header("./kivy_screenshot.png", 4, '0') + Padded("\x89PNG") + std::string(1024, '\0');
    const auto data = TarArchive::ExtractFile(tar, "kivy_screenshot.png");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(*data, "\x89PNG");
    EXPECT_FALSE(TarArchive::ExtractFile(tar, "other.png").has_value());
}

TEST(TarArchiveTest, GnuLongNameAppliesToNextMember) {
    const std::string long_name(150, 'n');
    const std::string tar = Header("././@LongLink", long_name.size() + 1, 'L') + Padded(long_name + '\0')
        + Header("truncated", 3, '0') + Padded("abc") + std::string(1024, '\0');
    const auto entries = TarArchive::Parse(tar);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].name, long_name);
    EXPECT_EQ(entries[0].data, "abc");
}

TEST(TarArchiveTest, PaxPathRecord) {
    const std::string record = "27 path=dir/kivy_video.mp4\n";
    const std::string tar = Header("PaxHeader", record.size(), 'x') + Padded(record)
        + Header("short", 2, '0') + Padded("ok") + std::string(1024, '\0');
    const auto data = TarArchive::ExtractFile(tar, "dir/kivy_video.mp4");
    ASSERT_TRUE(data.has_value());
    EXPECT_EQ(*data, "ok");
}

TEST(TarArchiveTest, TruncatedMemberThrows) {
    const std::string tar = Header("big.bin", 4096, '0') + std::string(100, 'x');
    EXPECT_THROW(TarArchive::Parse(tar), std::runtime_error);
}

}  // namespace
}  // namespace kivybot::engine
