#include <cppunit/extensions/HelperMacros.h>

#include <aeat/JSON.h>
#include <aeat/XMLNode.h>

class JSONTest
  : public CppUnit::TestFixture {

  CPPUNIT_TEST_SUITE(JSONTest);
  CPPUNIT_TEST(TestObject);
  CPPUNIT_TEST(TestArray);
  CPPUNIT_TEST(TestStrings);
  CPPUNIT_TEST(TestMalformed);
  CPPUNIT_TEST_SUITE_END();

public:
  void TestObject();
  void TestArray();
  void TestStrings();
  void TestMalformed();
};

void JSONTest::TestObject() {
  Aeat::XMLNode xml(Aeat::NS(), "config");
  CPPUNIT_ASSERT(Aeat::JSON::Parse(xml,
    "{ \"cert_path\": \"cert.p12\",\n"
    "  \"timeouts\": { \"connect\": 10, \"read\": 6.5e1 },\n"
    "  \"debug\": false, \"proxy\": null, \"empty\": {} }\n"));
  CPPUNIT_ASSERT_EQUAL(std::string("cert.p12"), (std::string)xml["cert_path"]);
  CPPUNIT_ASSERT_EQUAL(std::string("10"), (std::string)xml["timeouts"]["connect"]);
  CPPUNIT_ASSERT_EQUAL(std::string("6.5e1"), (std::string)xml["timeouts"]["read"]);
  CPPUNIT_ASSERT_EQUAL(std::string("false"), (std::string)xml["debug"]);
  CPPUNIT_ASSERT_EQUAL(std::string("null"), (std::string)xml["proxy"]);
  CPPUNIT_ASSERT((bool)xml["empty"]);
  CPPUNIT_ASSERT_EQUAL(0, xml["empty"].Size());
  CPPUNIT_ASSERT_EQUAL(5, xml.Size());
}

void JSONTest::TestArray() {
  Aeat::XMLNode xml(Aeat::NS(), "doc");
  CPPUNIT_ASSERT(Aeat::JSON::Parse(xml, "{\"item\":[1,\"two\",{\"three\":3}],\"none\":[]}"));
  CPPUNIT_ASSERT_EQUAL(std::string("1"), (std::string)xml["item"][0]);
  CPPUNIT_ASSERT_EQUAL(std::string("two"), (std::string)xml["item"][1]);
  CPPUNIT_ASSERT_EQUAL(std::string("3"), (std::string)xml["item"][2]["three"]);
  CPPUNIT_ASSERT(!xml["item"][3]);
  CPPUNIT_ASSERT(!xml["none"]);
}

void JSONTest::TestStrings() {
  Aeat::XMLNode xml(Aeat::NS(), "doc");
  CPPUNIT_ASSERT(Aeat::JSON::Parse(xml,
    "{\"esc\":\"a\\\"b\\\\c\\/d\\n\",\"uni\":\"Espa\\u00f1a \\u20ac\",\"pair\":\"\\ud83d\\ude00\","
    "\"markup\":\"<x> & y\"}"));
  CPPUNIT_ASSERT_EQUAL(std::string("a\"b\\c/d\n"), (std::string)xml["esc"]);
  CPPUNIT_ASSERT_EQUAL(std::string("Espa\xC3\xB1" "a \xE2\x82\xAC"), (std::string)xml["uni"]);
  CPPUNIT_ASSERT_EQUAL(std::string("\xF0\x9F\x98\x80"), (std::string)xml["pair"]);
  CPPUNIT_ASSERT_EQUAL(std::string("<x> & y"), (std::string)xml["markup"]);
}

void JSONTest::TestMalformed() {
  const char* bad[] = {
    "",
    "{",
    "{\"a\":1,}",
    "{\"a\" 1}",
    "{\"a\":tru}",
    "{\"a\":01}",
    "{\"a\":\"unterminated}",
    "{\"a\":\"bad \\x escape\"}",
    "{\"a\":\"\\udc00\"}",
    "{\"a\":1} trailing",
    NULL
  };
  for (int n = 0; bad[n]; ++n) {
    Aeat::XMLNode xml(Aeat::NS(), "doc");
    CPPUNIT_ASSERT_MESSAGE(bad[n], !Aeat::JSON::Parse(xml, bad[n]));
  }
  Aeat::XMLNode xml(Aeat::NS(), "doc");
  CPPUNIT_ASSERT(!Aeat::JSON::Parse(xml, NULL));
}

CPPUNIT_TEST_SUITE_REGISTRATION(JSONTest);
