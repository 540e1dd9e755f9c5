#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <cctype>
#include <cstring>

#include <aeat/Logger.h>
#include <aeat/SenderError.h>
#include <aeat/XMLNode.h>

#include "SOAPEnvelope.h"
#include "EnvelopeCodec.h"

namespace Aeat {

  Logger EnvelopeCodec::logger(Logger::getRootLogger(), "EnvelopeCodec");

  // Replaced by payload text after envelope is serialized
  static const char* PAYLOAD_MARKER = "@@AEAT-PAYLOAD@@";

  // Fragment parser does not accept XML declaration.
  static std::string StripDeclaration(const std::string& payload) {
    std::string::size_type p = 0;
    // UTF-8 byte order mark
    if (payload.compare(0, 3, "\xEF\xBB\xBF") == 0) p = 3;
    std::string::size_type start = payload.find_first_not_of(" \t\r\n", p);
    if (start == std::string::npos) return "";
    if ((payload.compare(start, 5, "<?xml") == 0) &&
        (start + 5 < payload.length()) &&
        isspace(static_cast<unsigned char>(payload[start + 5]))) {
      std::string::size_type end = payload.find("?>", start);
      if (end == std::string::npos) return payload;
      return payload.substr(end + 2);
    }
    if (p == 0) return payload;
    return payload.substr(p);
  }

  static XMLNode FindFault(const XMLNode& doc) {
    XMLNodeList faults = doc.XPathLookup("//soap-env:Fault", NS("soap-env", SOAP11_ENV_NAMESPACE));
    if (faults.empty()) {
      // Servers which do not qualify Fault
      faults = doc.XPathLookup("//Fault", NS());
    }
    if (faults.empty()) return XMLNode();
    return faults.front();
  }

  static XMLNode FindBody(const XMLNode& doc) {
    SOAPEnvelope envelope(doc);
    if (envelope) return envelope;
    XMLNodeList bodies = doc.XPathLookup("//soap-env:Body", NS("soap-env", SOAP11_ENV_NAMESPACE));
    if (bodies.empty()) bodies = doc.XPathLookup("//Body", NS());
    if (bodies.empty()) return XMLNode();
    return bodies.front();
  }

  std::string EnvelopeCodec::BuildEnvelope(const std::string& operation,
                                           const std::string& op_namespace,
                                           const std::string& payload) {
    SOAPEnvelope envelope;
    if (!envelope) throw PayloadError("Failed to create SOAP envelope");
    XMLNode container = envelope;
    if (!operation.empty()) {
      if (op_namespace.empty()) {
        container = envelope.NewChild(operation);
      } else {
        NS ns;
        ns[""] = op_namespace;
        container = envelope.NewChild(operation, ns);
      }
      if (!container) {
        throw PayloadError("Failed to create element for operation " + operation);
      }
    }
    std::string fragment = StripDeclaration(payload);
    // Parsed only for checking, serialization would rewrite payload
    if (!container.NewChildren(fragment)) {
      logger.msg(ERROR, "Payload is not well-formed XML");
      throw PayloadError("Payload is not well-formed XML");
    }
    container = PAYLOAD_MARKER;
    std::string xml;
    envelope.GetXML(xml);
    std::string::size_type marker = xml.find(PAYLOAD_MARKER);
    if (marker == std::string::npos) {
      throw PayloadError("Failed to place payload into SOAP envelope");
    }
    xml.replace(marker, strlen(PAYLOAD_MARKER), fragment);
    logger.msg(DEBUG, "SOAP envelope built: operation '%s', %d bytes",
               operation, (int)xml.length());
    return xml;
  }

  OperationResult EnvelopeCodec::ParseResponse(const std::string& response) {
    XMLNode doc(response);
    if (!doc) {
      logger.msg(ERROR, "Response is not well-formed XML (%d bytes)", (int)response.length());
      throw EnvelopeError("Response is not well-formed XML");
    }
    XMLNode fault = FindFault(doc);
    if (fault) {
      SOAPFault soapfault(fault);
      FaultInfo info(soapfault.CodeText(), soapfault.Reason(), soapfault.DetailXML());
      fault.GetXML(info.xml);
      logger.msg(VERBOSE, "SOAP Fault found in response: %s", info.Message());
      return OperationResult::FunctionalFailure(info);
    }
    std::string payload;
    XMLNode body = FindBody(doc);
    body.GetContentXML(payload);
    if (payload.find_first_not_of(" \t\r\n") == std::string::npos) {
      logger.msg(VERBOSE, "Response has no content in SOAP Body, returning whole document");
      payload = response;
    }
    logger.msg(DEBUG, "Response payload extracted: %d bytes", (int)payload.length());
    return OperationResult::Success(payload);
  }

  bool EnvelopeCodec::HasFault(const std::string& response) {
    XMLNode doc(response);
    if (!doc) return false;
    return (bool)FindFault(doc);
  }

} // namespace Aeat
