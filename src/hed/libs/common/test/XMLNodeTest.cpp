#include <cppunit/extensions/HelperMacros.h>

#include <aeat/XMLNode.h>

class XMLNodeTest
  : public CppUnit::TestFixture {

  CPPUNIT_TEST_SUITE(XMLNodeTest);
  CPPUNIT_TEST(TestParsing);
  CPPUNIT_TEST(TestNamespaces);
  CPPUNIT_TEST(TestCreation);
  CPPUNIT_TEST(TestNewChildren);
  CPPUNIT_TEST(TestXPath);
  CPPUNIT_TEST(TestDestroy);
  CPPUNIT_TEST_SUITE_END();

public:
  void setUp() {}
  void tearDown() {}
  void TestParsing();
  void TestNamespaces();
  void TestCreation();
  void TestNewChildren();
  void TestXPath();
  void TestDestroy();
};

void XMLNodeTest::TestParsing() {
  std::string xml_str(
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
    "<root>\n"
    "  <item>first</item>\n"
    "  <item><![CDATA[<second>]]></item>\n"
    "  <other>text</other>\n"
    "</root>");
  Aeat::XMLNode xml(xml_str);
  CPPUNIT_ASSERT((bool)xml);
  CPPUNIT_ASSERT_EQUAL(std::string("root"), xml.Name());
  CPPUNIT_ASSERT_EQUAL(3, xml.Size());
  CPPUNIT_ASSERT_EQUAL(std::string("first"), (std::string)xml["item"]);
  CPPUNIT_ASSERT_EQUAL(std::string("<second>"), (std::string)xml["item"][1]);
  CPPUNIT_ASSERT(!xml["item"][2]);
  CPPUNIT_ASSERT_EQUAL(std::string("other"), xml.Child(2).Name());
  CPPUNIT_ASSERT(!xml.Child(3));
  CPPUNIT_ASSERT(!xml["missing"]);
  CPPUNIT_ASSERT(!xml["missing"]["deeper"]);

  int n = 0;
  for (Aeat::XMLNode item = xml["item"]; (bool)item; ++item) ++n;
  CPPUNIT_ASSERT_EQUAL(2, n);

  CPPUNIT_ASSERT(xml["item"].Parent() == xml);
  CPPUNIT_ASSERT(xml["other"].GetRoot() == xml);

  Aeat::XMLNode broken("<root><unclosed></root>");
  CPPUNIT_ASSERT(!broken);
  Aeat::XMLNode empty("");
  CPPUNIT_ASSERT(!empty);
}

void XMLNodeTest::TestNamespaces() {
  std::string xml_str(
    "<soapenv:Envelope xmlns:soapenv=\"http://schemas.xmlsoap.org/soap/envelope/\">"
    "<soapenv:Body><r:Answer xmlns:r=\"urn:answer\"><r:Value>42</r:Value></r:Answer></soapenv:Body>"
    "</soapenv:Envelope>");
  Aeat::XMLNode xml(xml_str);
  CPPUNIT_ASSERT((bool)xml);
  CPPUNIT_ASSERT_EQUAL(std::string("soapenv"), xml.Prefix());
  CPPUNIT_ASSERT_EQUAL(std::string("http://schemas.xmlsoap.org/soap/envelope/"), xml.Namespace());
  CPPUNIT_ASSERT_EQUAL(std::string("soapenv:Envelope"), xml.FullName());
  // Lookup by prefix, by URI and ignoring namespace
  CPPUNIT_ASSERT((bool)xml["soapenv:Body"]);
  CPPUNIT_ASSERT((bool)xml["http://schemas.xmlsoap.org/soap/envelope/:Body"]);
  CPPUNIT_ASSERT((bool)xml["Body"]);
  CPPUNIT_ASSERT(!xml["other:Body"]);
  CPPUNIT_ASSERT(Aeat::MatchXMLNamespace(xml["Body"]["Answer"], "urn:answer"));
  CPPUNIT_ASSERT(Aeat::MatchXMLName(xml["Body"]["Answer"], "r:Answer"));

  // Changing prefixes
  Aeat::NS ns;
  ns["soap"] = "http://schemas.xmlsoap.org/soap/envelope/";
  xml.Namespaces(ns);
  CPPUNIT_ASSERT_EQUAL(std::string("soap:Envelope"), xml.FullName());
  CPPUNIT_ASSERT((bool)xml["soap:Body"]);
  CPPUNIT_ASSERT_EQUAL(std::string("soap"), xml.NamespacePrefix("http://schemas.xmlsoap.org/soap/envelope/"));

  // Serialized subtree carries namespaces defined above it
  std::string answer;
  xml["Body"]["Answer"]["Value"].GetXML(answer);
  Aeat::XMLNode value(answer);
  CPPUNIT_ASSERT((bool)value);
  CPPUNIT_ASSERT_EQUAL(std::string("urn:answer"), value.Namespace());
  CPPUNIT_ASSERT_EQUAL(std::string("42"), (std::string)value);
}

void XMLNodeTest::TestCreation() {
  Aeat::NS ns;
  ns["t"] = "urn:test";
  Aeat::XMLNode xml(ns, "t:Root");
  CPPUNIT_ASSERT((bool)xml);
  xml.NewChild("t:Item") = "a < b & c";
  xml.NewChild("t:Item") = "second";
  xml.NewChild("t:Item", 0) = "zero";
  Aeat::NS other;
  other[""] = "urn:other";
  xml.NewChild("Plain", other) = "x";
  CPPUNIT_ASSERT_EQUAL(std::string("zero"), (std::string)xml["Item"][0]);
  CPPUNIT_ASSERT_EQUAL(std::string("a < b & c"), (std::string)xml["Item"][1]);
  CPPUNIT_ASSERT_EQUAL(std::string("urn:other"), xml["Plain"].Namespace());

  std::string str;
  xml.GetXML(str);
  CPPUNIT_ASSERT(str.find("a &lt; b &amp; c") != std::string::npos);
  xml.GetDoc(str);
  CPPUNIT_ASSERT_EQUAL(std::string("<?xml"), str.substr(0, 5));
  CPPUNIT_ASSERT_EQUAL(4, xml.Size());

  // Assignment replaces content
  xml["Item"] = "replaced";
  CPPUNIT_ASSERT_EQUAL(std::string("replaced"), (std::string)xml["Item"]);
  CPPUNIT_ASSERT_EQUAL(4, xml.Size());
}

void XMLNodeTest::TestNewChildren() {
  Aeat::XMLNode xml("<doc xmlns:p=\"urn:p\"><head/></doc>");
  CPPUNIT_ASSERT(xml.NewChildren("<p:first a=\"1\">one</p:first><second>two</second>"));
  CPPUNIT_ASSERT_EQUAL(3, xml.Size());
  CPPUNIT_ASSERT_EQUAL(std::string("urn:p"), xml["first"].Namespace());
  CPPUNIT_ASSERT_EQUAL(std::string("one"), (std::string)xml["first"]);
  CPPUNIT_ASSERT_EQUAL(std::string("two"), (std::string)xml.Child(2));
  // Empty fragment adds nothing
  CPPUNIT_ASSERT(xml.NewChildren(""));
  CPPUNIT_ASSERT_EQUAL(3, xml.Size());
  // Malformed fragment leaves element untouched
  CPPUNIT_ASSERT(!xml.NewChildren("<third>three</fourth>"));
  CPPUNIT_ASSERT_EQUAL(3, xml.Size());
  CPPUNIT_ASSERT(!xml["third"]);
  // Invalid node
  Aeat::XMLNode invalid;
  CPPUNIT_ASSERT(!invalid.NewChildren("<a/>"));
}

void XMLNodeTest::TestXPath() {
  Aeat::XMLNode xml(
    "<e:Envelope xmlns:e=\"http://schemas.xmlsoap.org/soap/envelope/\"><e:Body>"
    "<e:Fault><faultcode>e:Client</faultcode></e:Fault>"
    "<Fault><faultcode>Server</faultcode></Fault>"
    "</e:Body></e:Envelope>");
  CPPUNIT_ASSERT((bool)xml);
  Aeat::XMLNodeList qualified = xml.XPathLookup("//soap:Fault",
      Aeat::NS("soap", "http://schemas.xmlsoap.org/soap/envelope/"));
  CPPUNIT_ASSERT_EQUAL(1, (int)qualified.size());
  CPPUNIT_ASSERT_EQUAL(std::string("e:Client"), (std::string)qualified.front()["faultcode"]);
  Aeat::XMLNodeList bare = xml.XPathLookup("//Fault", Aeat::NS());
  CPPUNIT_ASSERT_EQUAL(1, (int)bare.size());
  CPPUNIT_ASSERT_EQUAL(std::string("Server"), (std::string)bare.front()["faultcode"]);
  // Only nodes under starting node are returned
  Aeat::XMLNodeList under = xml["Body"]["Fault"].XPathLookup("//Fault", Aeat::NS());
  CPPUNIT_ASSERT(under.empty());
}

void XMLNodeTest::TestDestroy() {
  Aeat::XMLNode xml("<root>\n  <a/>\n  <b/>\n</root>");
  Aeat::XMLNode a = xml["a"];
  a.Destroy();
  CPPUNIT_ASSERT(!a);
  CPPUNIT_ASSERT_EQUAL(1, xml.Size());
  CPPUNIT_ASSERT_EQUAL(std::string("b"), xml.Child(0).Name());
  xml.Destroy();
  CPPUNIT_ASSERT(!xml);
}

CPPUNIT_TEST_SUITE_REGISTRATION(XMLNodeTest);
