#ifndef __AEAT_ENVELOPECODEC_H__
#define __AEAT_ENVELOPECODEC_H__

#include <string>

#include <aeat/message/OperationResult.h>

namespace Aeat {

  class Logger;

  /// Builds SOAP 1.1 requests and classifies responses.
  /** Request is document/literal envelope: payload is wrapped into
    element named after operation in operation's namespace and placed
    into Body. Response is either business payload or Fault.
    \headerfile EnvelopeCodec.h aeat/message/EnvelopeCodec.h */
  class EnvelopeCodec {
   public:
    /// Build serialized envelope around payload.
    /** Payload text is embedded byte for byte, without any schema
      validation. It is parsed only to check it is well-formed. It may
      contain several sibling elements and leading byte order mark and
      XML declaration which are dropped. If operation is empty payload is placed directly
      into Body. Throws PayloadError if payload is not well-formed XML. */
    static std::string BuildEnvelope(const std::string& operation,
                                     const std::string& op_namespace,
                                     const std::string& payload);

    /// Classify response document.
    /** Fault under SOAP envelope namespace is searched first and then
      Fault without namespace. If any is found result is functional
      failure and content of Body is ignored. Otherwise result is success
      carrying all content of Body including text and comments between
      elements, or whole document if there is no Body or it is empty.
      Throws EnvelopeError if response is not well-formed XML. */
    static OperationResult ParseResponse(const std::string& response);

    /// Check if response contains Fault without classifying it.
    /** Returns false for malformed XML. */
    static bool HasFault(const std::string& response);

   private:
    EnvelopeCodec();
    static Logger logger;
  };

} // namespace Aeat

#endif /* __AEAT_ENVELOPECODEC_H__ */
