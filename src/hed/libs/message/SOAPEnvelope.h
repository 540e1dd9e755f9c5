#ifndef __AEAT_SOAPENVELOP_H__
#define __AEAT_SOAPENVELOP_H__

#include <string>

#include <aeat/XMLNode.h>

#define SOAP11_ENV_NAMESPACE "http://schemas.xmlsoap.org/soap/envelope/"
#define SOAP11_ENC_NAMESPACE "http://schemas.xmlsoap.org/soap/encoding/"

namespace Aeat {

  /// Interface to SOAP 1.1 Fault element.
  /** SOAPFault class provides a convenience interface for accessing elements
    of SOAP faults. This class is not intended to 'own' any information
    stored. It's purpose is to read information which is kept under
    control of XMLNode or SOAPEnvelope classes. Children of Fault are
    matched by local name so that faults with missing or unexpected
    namespaces are handled too. */
  class SOAPFault {
   private:
    XMLNode fault;     /** Fault element of SOAP */
    XMLNode code;      /** faultcode element */
    XMLNode reason;    /** faultstring element */
    XMLNode actor;     /** faultactor element */
    XMLNode detail;    /** detail element */
   public:
    /** Fault codes of SOAP specs */
    typedef enum {
      undefined,
      unknown,
      VersionMismatch,
      MustUnderstand,
      Sender,   /* Client in SOAP 1.1 */
      Receiver  /* Server in SOAP 1.1 */
    } SOAPFaultCode;
    /** Wrap existing Fault element */
    SOAPFault(XMLNode fault);
    /** Returns true if instance refers to Fault element */
    operator bool(void) const { return (bool)fault; };
    /** Returns category of faultcode */
    SOAPFaultCode Code(void) const;
    /** Returns content of faultcode, empty if missing */
    std::string CodeText(void) const;
    /** Returns content of faultstring, empty if missing */
    std::string Reason(void) const;
    /** Returns content of faultactor */
    std::string Actor(void) const;
    /** Access Fault detail element */
    XMLNode Detail(void) const { return detail; };
    /** Serialized content of detail element, empty if missing */
    std::string DetailXML(void) const;
  };

  /// Extends XMLNode class to support structures of SOAP 1.1 message.
  /** All XMLNode methods are exposed by inheriting from XMLNode and node itself
    is translated into Body part of SOAP. Default namespace prefixes are
     soap-enc http://schemas.xmlsoap.org/soap/encoding/
     soap-env http://schemas.xmlsoap.org/soap/envelope/
  */
  class SOAPEnvelope: public XMLNode {
   public:
    /** Create new empty SOAP message with Envelope and Body.
      Additional namespaces are defined at Envelope element.
      Created XML structure is owned by this instance. */
    SOAPEnvelope(const NS& ns = NS());
    /** Acquire XML document as SOAP message.
      Created XML structure is NOT owned by this instance. If doc is
      not SOAP Envelope with Body instance is invalid. */
    SOAPEnvelope(XMLNode doc);
    ~SOAPEnvelope(void);
    /** Serialize whole SOAP message into XML document with declaration */
    void GetXML(std::string& xml, bool user_friendly = false) const;
    /** Get SOAP header as XML node. Invalid if message has no Header. */
    XMLNode Header(void) const { return header; };
    /** Returns Envelope element */
    XMLNode Envelope(void) const { return envelope; };
   private:
    SOAPEnvelope(const SOAPEnvelope&);
    SOAPEnvelope& operator=(const SOAPEnvelope&);
    XMLNode envelope; /** Envelope element of SOAP */
    XMLNode header;   /** Header element of SOAP */
    /** Fill instance variables. This method is called from constructors. */
    void set(void);
  };

} // namespace Aeat

#endif /* __AEAT_SOAPENVELOP_H__ */
