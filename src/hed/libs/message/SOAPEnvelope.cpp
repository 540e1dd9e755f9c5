#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <cstring>
#include <strings.h>

#include <aeat/StringConv.h>

#include "SOAPEnvelope.h"

namespace Aeat {

namespace internal {

class SOAPNS: public NS {
 public:
  SOAPNS(void) {
    (*this)["soap-enc"]=SOAP11_ENC_NAMESPACE;
    (*this)["soap-env"]=SOAP11_ENV_NAMESPACE;
  }
};

}

SOAPEnvelope::SOAPEnvelope(const NS& ns):XMLNode(ns,"Envelope") {
  XMLNode& it = *this;
  if(!it) return;
  internal::SOAPNS ns_;
  XMLNode::Namespaces(ns_);
  XMLNode::Name("soap-env:Envelope"); // Fixing namespace
  XMLNode body=XMLNode::NewChild("soap-env:Body");
  // Envelope is always serialized as UTF-8
  xmlDocPtr doc = XMLNode::node_->doc;
  if(doc && !doc->encoding) doc->encoding = xmlStrdup((const xmlChar*)"UTF-8");
  envelope=it; ((SOAPEnvelope*)(&envelope))->is_owner_=true;
  XMLNode::is_owner_=false; XMLNode::node_=((SOAPEnvelope*)(&body))->node_;
}

SOAPEnvelope::SOAPEnvelope(XMLNode root):XMLNode(root) {
  if(!node_) return;
  if(node_->type != XML_ELEMENT_NODE) { node_=NULL; return; };
  set();
}

SOAPEnvelope::~SOAPEnvelope(void) {
}

// This function is only called from constructor
void SOAPEnvelope::set(void) {
  XMLNode& it = *this;
  envelope = it;
  if((!envelope) || (!MatchXMLName(envelope,SOAP11_ENV_NAMESPACE ":Envelope"))) {
    // No SOAP Envelope found
    envelope=XMLNode(); node_=NULL;
    return;
  };
  XMLNode body;
  if(MatchXMLName(envelope.Child(0),SOAP11_ENV_NAMESPACE ":Header")) {
    // SOAP has Header
    header=envelope.Child(0);
    body=envelope.Child(1);
  } else {
    body=envelope.Child(0);
  };
  if(!MatchXMLName(body,SOAP11_ENV_NAMESPACE ":Body")) {
    // No SOAP Body found
    envelope=XMLNode(); header=XMLNode(); node_=NULL;
    return;
  };
  // Make this object represent SOAP Body
  this->node_=((SOAPEnvelope*)(&body))->node_;
}

void SOAPEnvelope::GetXML(std::string& out_xml_str,bool user_friendly) const {
  if(envelope == envelope.GetRoot()) {
    envelope.GetDoc(out_xml_str,user_friendly);
    return;
  };
  envelope.GetXML(out_xml_str,user_friendly);
}

// Wrap existing fault
SOAPFault::SOAPFault(XMLNode f) {
  if(!MatchXMLName(f,"Fault")) return;
  fault=f;
  code=fault["faultcode"];
  reason=fault["faultstring"];
  actor=fault["faultactor"];
  detail=fault["detail"];
}

std::string SOAPFault::CodeText(void) const {
  return trim((std::string)code);
}

std::string SOAPFault::Reason(void) const {
  return trim((std::string)reason);
}

std::string SOAPFault::Actor(void) const {
  return trim((std::string)actor);
}

std::string SOAPFault::DetailXML(void) const {
  std::string out;
  if(!detail) return out;
  XMLNode child;
  for(int n = 0; (bool)(child = detail.Child(n)); ++n) {
    std::string xml;
    child.GetXML(xml);
    out += xml;
  }
  if(out.empty()) out = trim((std::string)detail);
  return out;
}

static const char* FaultCodeMatch(const char* base,const char* code) {
  if(!base) base = "";
  if(!code) code = "";
  int l = strlen(base);
  if(strncasecmp(base,code,l) != 0) return NULL;
  if(code[l] == 0) return code+l;
  if(code[l] == '.') return code+l+1;
  return NULL;
}

SOAPFault::SOAPFaultCode SOAPFault::Code(void) const {
  if(!code) return undefined;
  std::string c = CodeText();
  std::string::size_type p = c.find(":");
  if(p != std::string::npos) c.erase(0,p+1);
  if(FaultCodeMatch("VersionMismatch",c.c_str()))
    return VersionMismatch;
  if(FaultCodeMatch("MustUnderstand",c.c_str()))
    return MustUnderstand;
  if(FaultCodeMatch("Client",c.c_str()))
    return Sender;
  if(FaultCodeMatch("Server",c.c_str()))
    return Receiver;
  return unknown;
}

} // namespace Aeat
