#include "ZipWriter.hpp"
#include "ZipReader.hpp"
#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <fstream>

#include <unistd.h>

using namespace takclient;
using namespace takclient::package;
namespace fs = std::filesystem;

namespace {

class ZipReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("takclient_zip_" + std::to_string(::getpid()) + "_" +
                                            ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }
    void TearDown() override { fs::remove_all(dir_); }

    fs::path dir_;
};

} // namespace

TEST_F(ZipReaderTest, ReadsStoredAndDeflatedEntries) {
    ZipWriter zip;
    std::string big(10000, 'a');
    zip.add("MANIFEST/manifest.xml", "<MissionPackageManifest/>");
    zip.add("certs/big.txt", big, true);
    zip.add("empty.txt", "", true);
    zip.write(dir_ / "pkg.zip");

    ZipReader reader(dir_ / "pkg.zip");
    ASSERT_EQ(reader.entries().size(), 3u);
    EXPECT_EQ(reader.entries()[1].method, ZipReader::kDeflated);
    EXPECT_LT(reader.entries()[1].compressed_size, big.size());
    EXPECT_EQ(reader.read(reader.entries()[0]), "<MissionPackageManifest/>");
    EXPECT_EQ(reader.read(reader.entries()[1]), big);
    EXPECT_EQ(reader.read(reader.entries()[2]), "");
}

TEST_F(ZipReaderTest, ExtractsIntoNestedDirectories) {
    ZipWriter zip;
    zip.add("a/b/c.txt", "nested");
    zip.add("top.txt", "top", true);
    zip.write(dir_ / "pkg.zip");

    auto files = ZipReader(dir_ / "pkg.zip").extract_all(dir_ / "out");
    ASSERT_EQ(files.size(), 2u);
    EXPECT_TRUE(fs::is_regular_file(dir_ / "out" / "a" / "b" / "c.txt"));
    EXPECT_TRUE(fs::is_regular_file(dir_ / "out" / "top.txt"));
}

TEST_F(ZipReaderTest, RejectsEscapingNames) {
    EXPECT_FALSE(ZipReader::is_safe_name("../evil"));
    EXPECT_FALSE(ZipReader::is_safe_name("a/../../evil"));
    EXPECT_FALSE(ZipReader::is_safe_name("/etc/passwd"));
    EXPECT_FALSE(ZipReader::is_safe_name("C:\\evil"));
    EXPECT_TRUE(ZipReader::is_safe_name("certs/user..p12"));

    ZipWriter zip;
    zip.add("../escape.txt", "x");
    zip.write(dir_ / "evil.zip");
    EXPECT_THROW(ZipReader(dir_ / "evil.zip").extract_all(dir_ / "out"), PackageError);
    EXPECT_FALSE(fs::exists(dir_ / "escape.txt"));
}

TEST_F(ZipReaderTest, DetectsCorruption) {
    ZipWriter zip;
    zip.add("data.txt", "payload that will be damaged");
    auto bytes = zip.bytes();
    bytes[30 + 8 + 3] ^= 0x55; // inside the stored data of the first entry
    std::ofstream(dir_ / "bad.zip", std::ios::binary) << bytes;

    ZipReader reader(dir_ / "bad.zip");
    EXPECT_THROW(reader.read(reader.entries().front()), PackageError);
}

TEST_F(ZipReaderTest, OversizedDeclaredLengthIsPackageError) {
    ZipWriter zip;
    zip.add("settings.pref", "<preferences/>", true);
    const auto original = zip.bytes();

    auto patch_size = [&](std::uint32_t size) {
        auto bytes = original;
        const size_t eocd = bytes.size() - 22;
        const size_t cd = static_cast<unsigned char>(bytes[eocd + 16]) |
                          (static_cast<unsigned char>(bytes[eocd + 17]) << 8);
        for (int i = 0; i < 4; ++i) bytes[cd + 24 + i] = static_cast<char>((size >> (8 * i)) & 0xff);
        return bytes;
    };

    for (std::uint32_t claimed : {0xfffffff0u, 100000u}) {
        std::ofstream(dir_ / "huge.zip", std::ios::binary | std::ios::trunc) << patch_size(claimed);
        ZipReader reader(dir_ / "huge.zip");
        EXPECT_EQ(reader.entries().front().size, claimed);
        EXPECT_THROW(reader.read(reader.entries().front()), PackageError) << claimed;
        EXPECT_THROW(reader.extract_all(dir_ / "out"), PackageError) << claimed;
    }
}

TEST_F(ZipReaderTest, NonZipInputIsPackageError) {
    std::ofstream(dir_ / "plain.zip") << "this is not a zip archive at all";
    EXPECT_THROW(ZipReader(dir_ / "plain.zip"), PackageError);
    EXPECT_THROW(ZipReader(dir_ / "missing.zip"), PackageError);
}
