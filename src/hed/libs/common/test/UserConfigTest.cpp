#include <cppunit/extensions/HelperMacros.h>

#include <string>
#include <cstdio>
#include <fstream>
#include <glibmm.h>

#include <aeat/FileUtils.h>
#include <aeat/SenderError.h>
#include <aeat/UserConfig.h>

class UserConfigTest
  : public CppUnit::TestFixture {

  CPPUNIT_TEST_SUITE(UserConfigTest);
  CPPUNIT_TEST(ParseConfigTest);
  CPPUNIT_TEST(DefaultsTest);
  CPPUNIT_TEST(ResolveTest);
  CPPUNIT_TEST(OperationTest);
  CPPUNIT_TEST(RejectionTest);
  CPPUNIT_TEST(ConfigFileTest);
  CPPUNIT_TEST_SUITE_END();

public:
  UserConfigTest() : conffile("test-sender.json") {}

  void setUp() {}
  void tearDown() { remove(conffile.c_str()); }

  void ParseConfigTest();
  void DefaultsTest();
  void ResolveTest();
  void OperationTest();
  void RejectionTest();
  void ConfigFileTest();

private:
  static std::string Config(const std::string& extra, const std::string& verifactu = "");
  Aeat::UserConfig uc;
  const std::string conffile;
};

std::string UserConfigTest::Config(const std::string& extra, const std::string& verifactu) {
  return
    "{\n"
    "  \"cert_path\": \"certificado.p12\",\n"
    "  \"cert_password\": \"secreto\",\n"
    "  \"entornos\": {\n"
    "    \"SII\": {\n"
    "      \"pruebas\": \"https://prewww1.aeat.es/wlpl/SSII-FACT/ws/fe/SiiFactFEV1SOAP\",\n"
    "      \"produccion\": \"https://www1.agenciatributaria.gob.es/wlpl/SSII-FACT/ws/fe/SiiFactFEV1SOAP\"\n"
    "    },\n"
    "    \"VERIFACTU\": {\n"
    "      \"pruebas\": \"https://prewww1.aeat.es/wlpl/TIKE-CONT/ws/SistemaFacturacion/VerifactuSOAP\",\n"
    "      \"produccion\": \"https://www1.agenciatributaria.gob.es/wlpl/TIKE-CONT/ws/SistemaFacturacion/VerifactuSOAP\"" +
    verifactu + "\n"
    "    }\n"
    "  }" + extra + "\n"
    "}\n";
}

void UserConfigTest::ParseConfigTest() {
  uc.LoadConfiguration(Config(",\n  \"timeouts\": { \"connect\": 5, \"read\": 30 },\n"
                              "  \"retry\": { \"attempts\": 4, \"backoff\": 0 }"));
  CPPUNIT_ASSERT_EQUAL(std::string("certificado.p12"), uc.CertificatePath());
  CPPUNIT_ASSERT_EQUAL(std::string("secreto"), uc.CertificatePassword());
  CPPUNIT_ASSERT_EQUAL(5, uc.ConnectTimeout());
  CPPUNIT_ASSERT_EQUAL(30, uc.ReadTimeout());
  CPPUNIT_ASSERT_EQUAL(4, uc.RetryAttempts());
  CPPUNIT_ASSERT_EQUAL(0, uc.RetryBackoff());
  CPPUNIT_ASSERT_EQUAL(std::string("https://www1.agenciatributaria.gob.es/wlpl/SSII-FACT/ws/fe/SiiFactFEV1SOAP"),
                       uc.System("SII").production_url);
  CPPUNIT_ASSERT_EQUAL(std::string("https://prewww1.aeat.es/wlpl/TIKE-CONT/ws/SistemaFacturacion/VerifactuSOAP"),
                       uc.System("verifactu").test_url);
}

void UserConfigTest::DefaultsTest() {
  uc.LoadConfiguration(Config(""));
  CPPUNIT_ASSERT_EQUAL(Aeat::DefaultConnectTimeout, uc.ConnectTimeout());
  CPPUNIT_ASSERT_EQUAL(Aeat::DefaultReadTimeout, uc.ReadTimeout());
  CPPUNIT_ASSERT_EQUAL(Aeat::DefaultRetryAttempts, uc.RetryAttempts());
  CPPUNIT_ASSERT_EQUAL(Aeat::DefaultRetryBackoff, uc.RetryBackoff());
  CPPUNIT_ASSERT_EQUAL(10, uc.ConnectTimeout());
  CPPUNIT_ASSERT_EQUAL(60, uc.ReadTimeout());
}

void UserConfigTest::ResolveTest() {
  uc.LoadConfiguration(Config(""));
  Aeat::TargetEndpoint ep = uc.Resolve("sii", "Pruebas");
  CPPUNIT_ASSERT_EQUAL(std::string("SII"), ep.system);
  CPPUNIT_ASSERT_EQUAL(std::string("pruebas"), ep.environment);
  CPPUNIT_ASSERT_EQUAL(std::string("prewww1.aeat.es"), ep.url.Host());
  CPPUNIT_ASSERT_EQUAL(std::string("/wlpl/SSII-FACT/ws/fe/SiiFactFEV1SOAP"), ep.url.Path());
  CPPUNIT_ASSERT_EQUAL(10, ep.connect_timeout);
  CPPUNIT_ASSERT_EQUAL(60, ep.read_timeout);

  ep = uc.Resolve("VERIFACTU", "production");
  CPPUNIT_ASSERT_EQUAL(std::string("VERIFACTU"), ep.system);
  CPPUNIT_ASSERT_EQUAL(std::string("produccion"), ep.environment);
  CPPUNIT_ASSERT_EQUAL(std::string("www1.agenciatributaria.gob.es"), ep.url.Host());

  CPPUNIT_ASSERT_THROW(uc.Resolve("TicketBAI", "pruebas"), Aeat::ConfigError);
  CPPUNIT_ASSERT_THROW(uc.Resolve("SII", "staging"), Aeat::ConfigError);

  CPPUNIT_ASSERT_EQUAL(std::string("SII"), Aeat::UserConfig::CanonicalSystem(" Sii "));
  CPPUNIT_ASSERT_EQUAL(std::string(""), Aeat::UserConfig::CanonicalSystem("SIIX"));
  CPPUNIT_ASSERT_EQUAL(std::string("pruebas"), Aeat::UserConfig::CanonicalEnvironment("TEST"));
  CPPUNIT_ASSERT_EQUAL(std::string("produccion"), Aeat::UserConfig::CanonicalEnvironment("Produccion"));
  CPPUNIT_ASSERT_EQUAL(std::string(""), Aeat::UserConfig::CanonicalEnvironment(""));
}

void UserConfigTest::OperationTest() {
  uc.LoadConfiguration(Config("", ",\n      \"operation\": \"\",\n      \"soap_action\": \"urn:registro\""));
  Aeat::TargetEndpoint sii = uc.Resolve("SII", "pruebas");
  CPPUNIT_ASSERT_EQUAL(std::string("SuministroLRFacturasEmitidas"), sii.operation);
  CPPUNIT_ASSERT(sii.op_namespace.find("/ssii/") != std::string::npos);
  CPPUNIT_ASSERT_EQUAL(std::string(""), sii.soap_action);
  Aeat::TargetEndpoint vf = uc.Resolve("VERIFACTU", "pruebas");
  CPPUNIT_ASSERT_EQUAL(std::string(""), vf.operation);
  CPPUNIT_ASSERT_EQUAL(std::string("urn:registro"), vf.soap_action);
}

void UserConfigTest::RejectionTest() {
  CPPUNIT_ASSERT_THROW(uc.LoadConfiguration("{ not json"), Aeat::ConfigError);
  CPPUNIT_ASSERT_THROW(uc.LoadConfiguration("{\"cert_path\":\"a.p12\",\"entornos\":{}}"), Aeat::ConfigError);
  CPPUNIT_ASSERT_THROW(uc.LoadConfiguration("{\"cert_path\":\"a.p12\",\"cert_password\":\"x\",\"entornos\":\"SII\"}"),
                       Aeat::ConfigError);
  CPPUNIT_ASSERT_THROW(uc.LoadConfiguration(
    "{\"cert_path\":\"a.p12\",\"cert_password\":\"x\",\"entornos\":"
    "{\"SII\":{\"pruebas\":\"https://a/\",\"produccion\":\"https://b/\"}}}"), Aeat::ConfigError);
  CPPUNIT_ASSERT_THROW(uc.LoadConfiguration(
    "{\"cert_path\":\"a.p12\",\"cert_password\":\"x\",\"entornos\":"
    "{\"SII\":{\"pruebas\":\"https://a/\"},\"VERIFACTU\":{\"pruebas\":\"https://a/\",\"produccion\":\"https://b/\"}}}"),
    Aeat::ConfigError);

  // Valid configuration survives failed reload
  uc.LoadConfiguration(Config(""));
  CPPUNIT_ASSERT_THROW(uc.LoadConfiguration(Config(",\"timeouts\":{\"connect\":0}")), Aeat::ConfigError);
  CPPUNIT_ASSERT_THROW(uc.LoadConfiguration(Config(",\"retry\":{\"attempts\":\"many\"}")), Aeat::ConfigError);
  CPPUNIT_ASSERT_THROW(uc.LoadConfiguration(Config(",\"retry\":{\"backoff\":-1}")), Aeat::ConfigError);
  CPPUNIT_ASSERT_NO_THROW(uc.Resolve("SII", "pruebas"));
  CPPUNIT_ASSERT_EQUAL(Aeat::DefaultConnectTimeout, uc.ConnectTimeout());

  // Endpoint must be https
  uc.LoadConfiguration(Config("", "").replace(Config("", "").find("https://prewww1.aeat.es/wlpl/TIKE"), 5, "http"));
  CPPUNIT_ASSERT_THROW(uc.Resolve("VERIFACTU", "pruebas"), Aeat::ConfigError);
  CPPUNIT_ASSERT_NO_THROW(uc.Resolve("VERIFACTU", "produccion"));

  try {
    uc.LoadConfiguration("[]", "broken.json");
    CPPUNIT_FAIL("ConfigError expected");
  } catch (const Aeat::ConfigError& e) {
    CPPUNIT_ASSERT_EQUAL(Aeat::ConfigurationError, e.Kind());
    CPPUNIT_ASSERT(std::string(e.what()).find("broken.json") != std::string::npos);
  }
}

void UserConfigTest::ConfigFileTest() {
  CPPUNIT_ASSERT_THROW(uc.LoadConfigurationFile("no-such-dir/config.json"), Aeat::ConfigError);
  std::ofstream f(conffile.c_str(), std::ios::trunc);
  f << Config(",\"retry\":{\"attempts\":1}");
  f.close();
  uc.LoadConfigurationFile(conffile);
  CPPUNIT_ASSERT_EQUAL(1, uc.RetryAttempts());
  CPPUNIT_ASSERT_EQUAL(1, uc.Resolve("SII", "produccion").retry_attempts);
}

CPPUNIT_TEST_SUITE_REGISTRATION(UserConfigTest);
