#include "DataPackageWriter.hpp"
#include "PreferencePackage.hpp"
#include "ZipReader.hpp"
#include "common/Errors.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

#include <fstream>

using namespace takclient;
using namespace takclient::package;
namespace fs = std::filesystem;

namespace {

class DataPackageWriterTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("takclient_dpw_" + std::to_string(::getpid()) + "_" +
                                            ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }
    void TearDown() override { fs::remove_all(dir_); }

    fs::path put(const fs::path& relative, const std::string& content) {
        auto path = dir_ / relative;
        fs::create_directories(path.parent_path());
        std::ofstream(path, std::ios::binary | std::ios::trunc) << content;
        return path;
    }

    static std::vector<std::string> names(const ZipReader& reader) {
        std::vector<std::string> out;
        for (const auto& entry : reader.entries()) out.push_back(entry.name);
        return out;
    }

    fs::path dir_;
};

} // namespace

TEST_F(DataPackageWriterTest, ManifestListsParametersAndContents) {
    DataPackageWriter writer("Ops & Maps", "pkg-1", true);
    writer.add_file(put("a.txt", "alpha"));
    writer.add_file(put("b.kml", "<kml/>"), true, "overlays/b.kml");

    auto xml = writer.manifest_xml();
    EXPECT_EQ(xml.rfind("<?xml version=\"1.0\" encoding=\"UTF-8\"?>", 0), 0u) << xml;
    EXPECT_NE(xml.find("<MissionPackageManifest version=\"2\">"), std::string::npos) << xml;
    EXPECT_NE(xml.find("<Parameter name=\"uid\" value=\"pkg-1\"/>"), std::string::npos) << xml;
    EXPECT_NE(xml.find("<Parameter name=\"name\" value=\"Ops &amp; Maps\"/>"), std::string::npos) << xml;
    EXPECT_NE(xml.find("<Parameter name=\"onReceiveDelete\" value=\"true\"/>"), std::string::npos) << xml;
    EXPECT_NE(xml.find("<Content ignore=\"false\" zipEntry=\"a.txt\"/>"), std::string::npos) << xml;
    EXPECT_NE(xml.find("<Content ignore=\"true\" zipEntry=\"overlays/b.kml\"/>"), std::string::npos) << xml;
    EXPECT_LT(xml.find("<Configuration>"), xml.find("<Contents>"));
}

TEST_F(DataPackageWriterTest, WritesDeflatedArchiveWithManifestLast) {
    put("src/a.txt", std::string(4000, 'a'));
    put("src/sub/b.kml", "<kml/>");
    put("src/scratch.tmp", "skip me");

    DataPackageWriter writer("maps", "pkg-2");
    writer.add_directory(dir_ / "src", true, ".tmp");
    ASSERT_EQ(writer.contents().size(), 2u);

    auto written = writer.write(dir_ / "out.bin", true);
    EXPECT_EQ(written, dir_ / "out.dpk");
    ASSERT_TRUE(fs::is_regular_file(written));

    ZipReader reader(written);
    EXPECT_EQ(names(reader), (std::vector<std::string>{"a.txt", "sub/b.kml", "MANIFEST/manifest.xml"}));
    EXPECT_EQ(reader.entries()[0].method, ZipReader::kDeflated);
    EXPECT_LT(reader.entries()[0].compressed_size, 4000u);
    EXPECT_EQ(reader.read(reader.entries()[0]), std::string(4000, 'a'));
    EXPECT_EQ(reader.read(reader.entries()[1]), "<kml/>");
    EXPECT_EQ(reader.read(reader.entries()[2]), writer.manifest_xml());
}

TEST_F(DataPackageWriterTest, NonRecursiveWithoutManifest) {
    put("src/top.txt", "top");
    put("src/nested/deep.txt", "deep");

    DataPackageWriter writer("flat");
    writer.add_directory(dir_ / "src", false);
    auto written = writer.write(dir_ / "flat");
    EXPECT_EQ(written, dir_ / "flat.zip");
    EXPECT_EQ(names(ZipReader(written)), (std::vector<std::string>{"top.txt", "MANIFEST/manifest.xml"}));

    written = writer.write(dir_ / "flat.zip", false, false);
    EXPECT_EQ(names(ZipReader(written)), std::vector<std::string>{"top.txt"});
}

TEST_F(DataPackageWriterTest, GeneratedPreferencePackageImports) {
    DataPackageWriter writer("server settings");
    writer.add_file(put("server.pref", R"(<?xml version='1.0' standalone='yes'?>
<preferences>
  <preference version="1" name="cot_streams">
    <entry key="connectString0" class="class java.lang.String">tak.example.org:8087:tcp</entry>
  </preference>
</preferences>
)"), false, "prefs/server.pref");
    auto written = writer.write(dir_ / "settings.zip");

    auto result = PreferencePackage().import(written, dir_ / "work");
    EXPECT_EQ(result.settings_file.filename(), "server.pref");
    EXPECT_EQ(result.settings.get(config::keys::CotUrl), "tcp://tak.example.org:8087");
    EXPECT_TRUE(fs::is_regular_file(dir_ / "work" / "MANIFEST" / "manifest.xml"));
}

TEST_F(DataPackageWriterTest, RejectsMissingFilesAndUnsafeNames) {
    DataPackageWriter writer("bad");
    EXPECT_THROW(writer.add_file(dir_ / "missing.txt"), PackageError);
    EXPECT_THROW(writer.add_directory(dir_ / "missing"), PackageError);
    auto file = put("ok.txt", "ok");
    EXPECT_THROW(writer.add_directory(file), PackageError);
    EXPECT_THROW(writer.add_file(file, false, "../escape.txt"), PackageError);
    EXPECT_THROW(writer.add_file(file, false, "/abs.txt"), PackageError);
    EXPECT_THROW(writer.add_file(file, false, DataPackageWriter::kManifestEntry), PackageError);
    EXPECT_TRUE(writer.contents().empty());

    try {
        writer.write(dir_ / "empty.zip");
        FAIL() << "expected PackageError";
    } catch (const PackageError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PackageError);
        EXPECT_NE(std::string(e.what()).find("No files"), std::string::npos);
    }
    EXPECT_FALSE(fs::exists(dir_ / "empty.zip"));
}

TEST(DataPackageUid, RandomUuidIsVersionFour) {
    auto a = DataPackageWriter::random_uuid();
    auto b = DataPackageWriter::random_uuid();
    ASSERT_EQ(a.size(), 36u);
    EXPECT_NE(a, b);
    EXPECT_EQ(a[8], '-');
    EXPECT_EQ(a[13], '-');
    EXPECT_EQ(a[14], '4');
    EXPECT_NE(std::string("89ab").find(a[19]), std::string::npos) << a;
    EXPECT_EQ(DataPackageWriter("x").uid().size(), 36u);
    EXPECT_EQ(DataPackageWriter("x", "given").uid(), "given");
}
