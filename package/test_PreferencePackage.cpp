#include "PreferencePackage.hpp"
#include "ZipWriter.hpp"
#include "common/Errors.hpp"
#include "transport/tls/TestPki.hpp"
#include "transport/tls/TlsIdentity.hpp"

#include <gtest/gtest.h>

#include <unistd.h>

using namespace takclient;
using namespace takclient::package;
using takclient::transport::tls::testing::TestPki;
namespace fs = std::filesystem;

namespace {

const char* kPref = R"(<?xml version='1.0' standalone='yes'?>
<preferences>
  <preference version="1" name="cot_streams">
    <entry key="count" class="class java.lang.Integer">1</entry>
    <entry key="description0" class="class java.lang.String">Test Server</entry>
    <entry key="enabled0" class="class java.lang.Boolean">true</entry>
    <entry key="connectString0" class="class java.lang.String">takserver.local:8089:ssl</entry>
  </preference>
  <preference version="1" name="com.atakmap.app_preferences">
    <entry key="clientPassword" class="class java.lang.String">atakatak</entry>
    <entry key="certificateLocation" class="class java.lang.String">/storage/emulated/0/atak/cert/user.p12</entry>
    <entry key="caLocation" class="class java.lang.String">cert/truststore.p12</entry>
    <entry key="caPassword" class="class java.lang.String">trustpw</entry>
  </preference>
</preferences>
)";

class PreferencePackageTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("takclient_pref_" + std::to_string(::getpid()) + "_" +
                                            ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }
    void TearDown() override { fs::remove_all(dir_); }

    fs::path dir_;
};

} // namespace

TEST(PreferencePackageParsing, ConnectStringBecomesUrl) {
    EXPECT_EQ(PreferencePackage::connect_string_to_url("tak.example.org:8089:ssl"), "ssl://tak.example.org:8089");
    EXPECT_EQ(PreferencePackage::connect_string_to_url("10.0.0.1:8087:tcp"), "tcp://10.0.0.1:8087");
    EXPECT_THROW(PreferencePackage::connect_string_to_url("tak.example.org"), PackageError);
    EXPECT_THROW(PreferencePackage::connect_string_to_url("tak.example.org:8089"), PackageError);
    EXPECT_THROW(PreferencePackage::connect_string_to_url("tak.example.org:8089:"), PackageError);
}

TEST(PreferencePackageParsing, PrefEntriesMapToKeys) {
    auto cfg = PreferencePackage::parse_pref(kPref);
    EXPECT_EQ(cfg.get(config::keys::CotUrl), "ssl://takserver.local:8089");
    EXPECT_EQ(cfg.get(config::keys::TlsClientPassword), "atakatak");
    EXPECT_EQ(cfg.get(config::keys::TlsClientCert), "/storage/emulated/0/atak/cert/user.p12");
    EXPECT_EQ(cfg.get(config::keys::TlsClientCaFile), "cert/truststore.p12");
    EXPECT_EQ(cfg.get(config::keys::TlsCaPassword), "trustpw");
    EXPECT_FALSE(cfg.contains("count"));
    EXPECT_THROW(PreferencePackage::parse_pref("<preferences>"), PackageError);
}

TEST_F(PreferencePackageTest, IniPackageRewritesCertificatePaths) {
    ZipWriter zip;
    zip.add("config/settings.ini",
            "[tak]\n"
            "# client settings\n"
            "COT_URL = tls://tak.example.org:8089\n"
            "TAK_TLS_CLIENT_CERT = certs/client.pem\n"
            "TAK_TLS_CLIENT_CAFILE = ca.pem\n");
    zip.add("certs/client.pem", "-----BEGIN CERTIFICATE-----\n");
    zip.add("config/ca.pem", "-----BEGIN CERTIFICATE-----\n", true);
    zip.write(dir_ / "pkg.zip");

    auto result = PreferencePackage().import(dir_ / "pkg.zip", dir_ / "work");
    EXPECT_EQ(result.workdir, dir_ / "work");
    EXPECT_EQ(result.settings_file.filename(), "settings.ini");
    EXPECT_EQ(result.files.size(), 3u);
    EXPECT_EQ(result.settings.get(config::keys::CotUrl), "tls://tak.example.org:8089");
    EXPECT_EQ(result.settings.get(config::keys::TlsClientCert), (dir_ / "work" / "certs" / "client.pem").string());
    EXPECT_EQ(result.settings.get(config::keys::TlsClientCaFile), (dir_ / "work" / "config" / "ca.pem").string());
}

TEST_F(PreferencePackageTest, PrefPackageConvertsPkcs12) {
    auto pki = TestPki::create();
    ZipWriter zip;
    zip.add("MANIFEST/manifest.xml", "<MissionPackageManifest version=\"2\"/>");
    zip.add("prefs/server.pref", kPref, true);
    zip.add("cert/user.p12", pki.client_pkcs12("atakatak"));
    zip.add("cert/truststore.p12",
            transport::tls::testing::to_pkcs12(nullptr, nullptr, pki.ca_cert.get(), "trustpw"));
    zip.write(dir_ / "pkg.zip");

    auto sink = std::make_shared<VectorSink>();
    auto logger = std::make_shared<Logger>("pref-test");
    logger->add_sink(sink);
    auto result = PreferencePackage(logger).import(dir_ / "pkg.zip", dir_ / "work");

    EXPECT_EQ(result.settings.get(config::keys::CotUrl), "ssl://takserver.local:8089");
    auto cert = result.settings.get_or(config::keys::TlsClientCert, "");
    auto key = result.settings.get_or(config::keys::TlsClientKey, "");
    auto ca = result.settings.get_or(config::keys::TlsClientCaFile, "");
    EXPECT_EQ(fs::path(cert).filename(), "user_cert.pem");
    EXPECT_EQ(fs::path(key).filename(), "user_key.pem");
    EXPECT_EQ(fs::path(ca).filename(), "truststore_truststore.pem");
    EXPECT_EQ(transport::tls::read_file(cert), pki.client_cert_pem());
    EXPECT_NE(transport::tls::read_file(key).value_or("").find("PRIVATE KEY"), std::string::npos);
    EXPECT_EQ(transport::tls::read_file(ca), pki.ca_pem());
    EXPECT_EQ(fs::status(key).permissions() & fs::perms::group_all, fs::perms::none);
    EXPECT_TRUE(sink->contains("Converted PKCS#12 client certificate"));
}

TEST_F(PreferencePackageTest, WrongPkcs12PasswordIsCertificateError) {
    auto pki = TestPki::create();
    ZipWriter zip;
    zip.add("server.pref", R"(<preferences><preference name="x">
        <entry key="connectString0">tak:8089:ssl</entry>
        <entry key="clientPassword">wrong</entry>
        <entry key="certificateLocation">user.p12</entry></preference></preferences>)");
    zip.add("user.p12", pki.client_pkcs12("atakatak"));
    zip.write(dir_ / "pkg.zip");
    EXPECT_THROW(PreferencePackage().import(dir_ / "pkg.zip", dir_ / "work"), CertificateError);
}

TEST_F(PreferencePackageTest, MissingCertificateIsPackageError) {
    ZipWriter zip;
    zip.add("settings.ini", "TAK_TLS_CLIENT_CERT=certs/absent.pem\n");
    zip.write(dir_ / "pkg.zip");
    EXPECT_THROW(PreferencePackage().import(dir_ / "pkg.zip", dir_ / "work"), PackageError);
}

TEST_F(PreferencePackageTest, PackageWithoutSettingsIsPackageError) {
    ZipWriter zip;
    zip.add("readme.txt", "nothing here");
    zip.write(dir_ / "pkg.zip");
    EXPECT_THROW(PreferencePackage().import(dir_ / "pkg.zip", dir_ / "work"), PackageError);
    EXPECT_THROW(PreferencePackage().import(dir_ / "absent.zip", dir_ / "work"), PackageError);
}

TEST_F(PreferencePackageTest, DefaultWorkdirIsFreshTempDirectory) {
    ZipWriter zip;
    zip.add("settings.ini", "COT_URL=udp://10.1.2.3:4242\n");
    zip.write(dir_ / "pkg.zip");

    PreferencePackage importer;
    auto first = importer.import(dir_ / "pkg.zip");
    auto second = importer.import(dir_ / "pkg.zip");
    EXPECT_EQ(first.workdir.filename().string().rfind("takclient_dp_", 0), 0u);
    EXPECT_NE(first.workdir, second.workdir);
    fs::remove_all(first.workdir);
    fs::remove_all(second.workdir);
}

TEST_F(PreferencePackageTest, MergeOnlyFillsMissingKeys) {
    ZipWriter zip;
    zip.add("settings.ini", "COT_URL=udp://10.1.2.3:4242\nTAK_PROTO=1\n");
    zip.write(dir_ / "pkg.zip");

    config::Config cfg;
    cfg.set(config::keys::CotUrl, "tcp://caller:8087");
    auto result = PreferencePackage().import(dir_ / "pkg.zip", dir_ / "work");
    EXPECT_EQ(result.merge_into(cfg), 1u);
    EXPECT_EQ(cfg.get(config::keys::CotUrl), "tcp://caller:8087");
    EXPECT_EQ(cfg.get(config::keys::TakProto), "1");
}
