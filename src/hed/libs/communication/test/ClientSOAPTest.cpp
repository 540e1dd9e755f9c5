#include <cppunit/extensions/HelperMacros.h>

#include <string>

#include <glibmm/timer.h>

#include <aeat/SenderError.h>
#include <aeat/StringConv.h>
#include <aeat/UserConfig.h>
#include <aeat/communication/ClientSOAP.h>

#include "MockConnection.h"

static const char* fault_response =
  "HTTP/1.1 500 Internal Server Error\r\n"
  "Content-Type: text/xml; charset=utf-8\r\n"
  "\r\n"
  "<env:Envelope xmlns:env=\"http://schemas.xmlsoap.org/soap/envelope/\"><env:Body>"
  "<env:Fault><faultcode>env:Client</faultcode><faultstring>Invalid NIF</faultstring></env:Fault>"
  "</env:Body></env:Envelope>";

static const char* ok_body =
  "<env:Envelope xmlns:env=\"http://schemas.xmlsoap.org/soap/envelope/\"><env:Body><r>Correcto</r></env:Body></env:Envelope>";

class ClientSOAPTest
  : public CppUnit::TestFixture {

  CPPUNIT_TEST_SUITE(ClientSOAPTest);
  CPPUNIT_TEST(TestSend);
  CPPUNIT_TEST(TestRetryConnect);
  CPPUNIT_TEST(TestRetryExhausted);
  CPPUNIT_TEST(TestSingleAttempt);
  CPPUNIT_TEST(TestBackoff);
  CPPUNIT_TEST(TestTLSNotRetried);
  CPPUNIT_TEST(TestReadTimeoutNotRetried);
  CPPUNIT_TEST(TestFaultStatus);
  CPPUNIT_TEST(TestHTTPError);
  CPPUNIT_TEST_SUITE_END();

public:
  void setUp();
  void TestSend();
  void TestRetryConnect();
  void TestRetryExhausted();
  void TestSingleAttempt();
  void TestBackoff();
  void TestTLSNotRetried();
  void TestReadTimeoutNotRetried();
  void TestFaultStatus();
  void TestHTTPError();

private:
  static std::string OK() {
    return "HTTP/1.1 200 OK\r\nContent-Type: text/xml\r\nContent-Length: " +
           Aeat::tostring(std::string(ok_body).length()) + "\r\n\r\n" + ok_body;
  }
  Aeat::TargetEndpoint endpoint;
};

void ClientSOAPTest::setUp() {
  endpoint.url = Aeat::URL("https://prewww1.aeat.es/wlpl/SSII-FACT/ws/fe/SiiFactFEV1SOAP");
  endpoint.connect_timeout = 5;
  endpoint.read_timeout = 30;
  endpoint.retry_attempts = 3;
  endpoint.retry_backoff = 0;
  endpoint.soap_action = "urn:SuministroLRFacturasEmitidas";
}

void ClientSOAPTest::TestSend() {
  MockConnector connector(OK());
  Aeat::ClientSOAP client(endpoint, &connector);
  std::string response = client.Send("<Envelope/>", "/tmp/cert.pem", "/tmp/key.pem");
  CPPUNIT_ASSERT_EQUAL(std::string(ok_body), response);
  CPPUNIT_ASSERT_EQUAL(1, client.Attempts());
  CPPUNIT_ASSERT_EQUAL(200, client.ResponseCode());
  CPPUNIT_ASSERT_EQUAL(std::string("/tmp/cert.pem"), connector.config.cert_file);
  CPPUNIT_ASSERT_EQUAL(std::string("/tmp/key.pem"), connector.config.key_file);
  CPPUNIT_ASSERT_EQUAL(5, connector.config.connect_timeout);
  CPPUNIT_ASSERT_EQUAL(30, connector.config.read_timeout);
  CPPUNIT_ASSERT_EQUAL(std::string("prewww1.aeat.es"), connector.config.url.Host());
  CPPUNIT_ASSERT_EQUAL((std::string::size_type)0,
                       connector.sent.find("POST /wlpl/SSII-FACT/ws/fe/SiiFactFEV1SOAP HTTP/1.1\r\n"));
  CPPUNIT_ASSERT(connector.sent.find("\r\nContent-Type: text/xml; charset=utf-8\r\n") != std::string::npos);
  CPPUNIT_ASSERT(connector.sent.find("\r\nSOAPAction: \"urn:SuministroLRFacturasEmitidas\"\r\n") != std::string::npos);
  CPPUNIT_ASSERT_EQUAL(std::string("<Envelope/>"), connector.sent.substr(connector.sent.length() - 11));
}

void ClientSOAPTest::TestRetryConnect() {
  MockConnector connector(OK());
  connector.Fail(Aeat::CONNECT_ERROR, 2);
  Aeat::ClientSOAP client(endpoint, &connector);
  CPPUNIT_ASSERT_EQUAL(std::string(ok_body), client.Send("<Envelope/>", "", ""));
  CPPUNIT_ASSERT_EQUAL(3, client.Attempts());
  CPPUNIT_ASSERT_EQUAL(3, connector.calls);
  CPPUNIT_ASSERT_EQUAL(1, connector.connections);
  // Request is sent exactly once
  CPPUNIT_ASSERT_EQUAL(connector.sent.find("POST "), connector.sent.rfind("POST "));
}

void ClientSOAPTest::TestRetryExhausted() {
  MockConnector connector(OK());
  connector.Fail(Aeat::CONNECT_ERROR, 3);
  Aeat::ClientSOAP client(endpoint, &connector);
  try {
    client.Send("<Envelope/>", "", "");
    CPPUNIT_FAIL("CommunicationException expected");
  } catch (const Aeat::CommunicationException& e) {
    CPPUNIT_ASSERT_EQUAL(Aeat::CommunicationError, e.Kind());
    CPPUNIT_ASSERT(std::string(e.what()).find("3 attempts") != std::string::npos);
  }
  CPPUNIT_ASSERT_EQUAL(3, client.Attempts());
  CPPUNIT_ASSERT_EQUAL(3, connector.calls);
  CPPUNIT_ASSERT_EQUAL(0, connector.connections);
  CPPUNIT_ASSERT(connector.sent.empty());
}

void ClientSOAPTest::TestSingleAttempt() {
  endpoint.retry_attempts = 0;
  MockConnector connector(OK());
  connector.Fail(Aeat::CONNECT_ERROR);
  Aeat::ClientSOAP client(endpoint, &connector);
  CPPUNIT_ASSERT_THROW(client.Send("<Envelope/>", "", ""), Aeat::CommunicationException);
  CPPUNIT_ASSERT_EQUAL(1, connector.calls);
}

void ClientSOAPTest::TestBackoff() {
  endpoint.retry_backoff = 1;
  MockConnector connector(OK());
  connector.Fail(Aeat::CONNECT_ERROR);
  Aeat::ClientSOAP client(endpoint, &connector);
  Glib::Timer timer;
  client.Send("<Envelope/>", "", "");
  timer.stop();
  CPPUNIT_ASSERT(timer.elapsed() >= 0.9);
  CPPUNIT_ASSERT_EQUAL(2, client.Attempts());
}

void ClientSOAPTest::TestTLSNotRetried() {
  MockConnector connector(OK());
  connector.Fail(Aeat::TLS_ERROR);
  Aeat::ClientSOAP client(endpoint, &connector);
  CPPUNIT_ASSERT_THROW(client.Send("<Envelope/>", "", ""), Aeat::CommunicationException);
  CPPUNIT_ASSERT_EQUAL(1, connector.calls);
  CPPUNIT_ASSERT_EQUAL(1, client.Attempts());
}

void ClientSOAPTest::TestReadTimeoutNotRetried() {
  MockConnector connector("", Aeat::TransportStatus(Aeat::READ_TIMEOUT, "Mock", "No response within 30 s"));
  Aeat::ClientSOAP client(endpoint, &connector);
  try {
    client.Send("<Envelope/>", "", "");
    CPPUNIT_FAIL("CommunicationException expected");
  } catch (const Aeat::CommunicationException& e) {
    CPPUNIT_ASSERT(std::string(e.what()).find("Timeout") != std::string::npos);
  }
  CPPUNIT_ASSERT_EQUAL(1, connector.calls);
  CPPUNIT_ASSERT_EQUAL(0, client.ResponseCode());
}

void ClientSOAPTest::TestFaultStatus() {
  MockConnector connector(fault_response);
  Aeat::ClientSOAP client(endpoint, &connector);
  std::string response = client.Send("<Envelope/>", "", "");
  CPPUNIT_ASSERT(response.find("Invalid NIF") != std::string::npos);
  CPPUNIT_ASSERT_EQUAL(500, client.ResponseCode());
}

void ClientSOAPTest::TestHTTPError() {
  MockConnector unavailable("HTTP/1.1 503 Service Unavailable\r\nContent-Length: 19\r\n\r\nService Unavailable");
  Aeat::ClientSOAP client(endpoint, &unavailable);
  try {
    client.Send("<Envelope/>", "", "");
    CPPUNIT_FAIL("CommunicationException expected");
  } catch (const Aeat::CommunicationException& e) {
    CPPUNIT_ASSERT_EQUAL(std::string("HTTP 503 Service Unavailable"), std::string(e.what()));
  }
  CPPUNIT_ASSERT_EQUAL(503, client.ResponseCode());
  CPPUNIT_ASSERT_EQUAL(1, unavailable.calls);

  // Well-formed document without Fault is not accepted with error status
  MockConnector server_error("HTTP/1.1 500 Internal Server Error\r\n\r\n<error>boom</error>");
  Aeat::ClientSOAP client2(endpoint, &server_error);
  CPPUNIT_ASSERT_THROW(client2.Send("<Envelope/>", "", ""), Aeat::CommunicationException);
}

CPPUNIT_TEST_SUITE_REGISTRATION(ClientSOAPTest);
