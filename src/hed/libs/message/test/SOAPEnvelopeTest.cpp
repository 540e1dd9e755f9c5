#include <cppunit/extensions/HelperMacros.h>

#include <aeat/message/SOAPEnvelope.h>

class SOAPEnvelopeTest
  : public CppUnit::TestFixture {

  CPPUNIT_TEST_SUITE(SOAPEnvelopeTest);
  CPPUNIT_TEST(TestNewEnvelope);
  CPPUNIT_TEST(TestAcquire);
  CPPUNIT_TEST(TestFault);
  CPPUNIT_TEST_SUITE_END();

public:
  void TestNewEnvelope();
  void TestAcquire();
  void TestFault();
};

void SOAPEnvelopeTest::TestNewEnvelope() {
  Aeat::SOAPEnvelope soap;
  CPPUNIT_ASSERT((bool)soap);
  CPPUNIT_ASSERT_EQUAL(std::string("Body"), soap.Name());
  CPPUNIT_ASSERT_EQUAL(std::string(SOAP11_ENV_NAMESPACE), soap.Namespace());
  CPPUNIT_ASSERT_EQUAL(std::string("Envelope"), soap.Envelope().Name());
  CPPUNIT_ASSERT(!soap.Header());
  soap.NewChild("Ping") = "1";

  std::string xml;
  soap.GetXML(xml);
  CPPUNIT_ASSERT_EQUAL(std::string("<?xml"), xml.substr(0, 5));
  CPPUNIT_ASSERT(xml.find("UTF-8") != std::string::npos);
  Aeat::XMLNode doc(xml);
  CPPUNIT_ASSERT((bool)doc);
  CPPUNIT_ASSERT(Aeat::MatchXMLName(doc, SOAP11_ENV_NAMESPACE ":Envelope"));
  CPPUNIT_ASSERT_EQUAL(std::string("1"), (std::string)doc["Body"]["Ping"]);
}

void SOAPEnvelopeTest::TestAcquire() {
  Aeat::XMLNode doc(
    "<e:Envelope xmlns:e=\"http://schemas.xmlsoap.org/soap/envelope/\">"
    "<e:Header><h/></e:Header><e:Body><r>ok</r></e:Body></e:Envelope>");
  Aeat::SOAPEnvelope soap(doc);
  CPPUNIT_ASSERT((bool)soap);
  CPPUNIT_ASSERT_EQUAL(std::string("Body"), soap.Name());
  CPPUNIT_ASSERT((bool)soap.Header()["h"]);
  CPPUNIT_ASSERT_EQUAL(std::string("ok"), (std::string)soap["r"]);

  // SOAP 1.2 namespace is not accepted
  Aeat::XMLNode soap12(
    "<e:Envelope xmlns:e=\"http://www.w3.org/2003/05/soap-envelope\"><e:Body/></e:Envelope>");
  CPPUNIT_ASSERT(!Aeat::SOAPEnvelope(soap12));
  Aeat::XMLNode nobody(
    "<e:Envelope xmlns:e=\"http://schemas.xmlsoap.org/soap/envelope/\"><e:Other/></e:Envelope>");
  CPPUNIT_ASSERT(!Aeat::SOAPEnvelope(nobody));
  CPPUNIT_ASSERT(!Aeat::SOAPEnvelope(Aeat::XMLNode()));
}

void SOAPEnvelopeTest::TestFault() {
  Aeat::XMLNode doc(
    "<Fault><faultcode> soapenv:Client.Validation </faultcode><faultstring>Invalid NIF</faultstring>"
    "<detail><err code=\"4104\"/><err code=\"1100\"/></detail></Fault>");
  Aeat::SOAPFault fault(doc);
  CPPUNIT_ASSERT((bool)fault);
  CPPUNIT_ASSERT_EQUAL(std::string("soapenv:Client.Validation"), fault.CodeText());
  CPPUNIT_ASSERT_EQUAL(Aeat::SOAPFault::Sender, fault.Code());
  CPPUNIT_ASSERT_EQUAL(std::string("Invalid NIF"), fault.Reason());
  CPPUNIT_ASSERT_EQUAL(std::string(""), fault.Actor());
  CPPUNIT_ASSERT_EQUAL(std::string("<err code=\"4104\"/><err code=\"1100\"/>"), fault.DetailXML());

  Aeat::XMLNode empty("<Fault/>");
  Aeat::SOAPFault empty_fault(empty);
  CPPUNIT_ASSERT((bool)empty_fault);
  CPPUNIT_ASSERT_EQUAL(Aeat::SOAPFault::undefined, empty_fault.Code());
  CPPUNIT_ASSERT_EQUAL(std::string(""), empty_fault.CodeText());
  CPPUNIT_ASSERT_EQUAL(std::string(""), empty_fault.Reason());
  CPPUNIT_ASSERT_EQUAL(std::string(""), empty_fault.DetailXML());

  Aeat::XMLNode server("<Fault><faultcode>Server</faultcode><detail> text only </detail></Fault>");
  Aeat::SOAPFault server_fault(server);
  CPPUNIT_ASSERT_EQUAL(Aeat::SOAPFault::Receiver, server_fault.Code());
  CPPUNIT_ASSERT_EQUAL(std::string("text only"), server_fault.DetailXML());

  Aeat::XMLNode other("<Error/>");
  CPPUNIT_ASSERT(!Aeat::SOAPFault(other));
}

CPPUNIT_TEST_SUITE_REGISTRATION(SOAPEnvelopeTest);
