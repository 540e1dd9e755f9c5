// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include "SenderError.h"

namespace Aeat {

  std::string ErrorKindString(ErrorKind kind) {
    switch (kind) {
    case NoError:
      return "no error";
    case ConfigurationError:
      return "configuration error";
    case PayloadFormatError:
      return "payload format error";
    case CertificateFormatError:
      return "certificate format error";
    case CommunicationError:
      return "communication error";
    case EnvelopeParseError:
      return "envelope parse error";
    case FunctionalError:
      return "functional error";
    }
    return "unknown error";
  }

} // namespace Aeat
