// TransportStatus.cpp

#include "TransportStatus.h"

namespace Aeat {

  static const char* kind_string[] = {
    "STATUS_OK",
    "CONNECT_ERROR",
    "TLS_ERROR",
    "WRITE_ERROR",
    "READ_TIMEOUT",
    "READ_ERROR",
    "PROTOCOL_ERROR",
    "UNKNOWN"
  };

  std::string string(TransportStatusKind kind) {
    int n = 0;
    switch(kind) {
      case STATUS_OK: n = 0; break;
      case CONNECT_ERROR: n = 1; break;
      case TLS_ERROR: n = 2; break;
      case WRITE_ERROR: n = 3; break;
      case READ_TIMEOUT: n = 4; break;
      case READ_ERROR: n = 5; break;
      case PROTOCOL_ERROR: n = 6; break;
      default: n = 7; break;
    }
    return kind_string[n];
  }

  TransportStatus::TransportStatus(TransportStatusKind kind,
                                   const std::string& origin,
                                   const std::string& explanation) :
    kind(kind),
    origin(origin),
    explanation(explanation)
  {
  }

  bool TransportStatus::isOk() const {
    return kind == STATUS_OK;
  }

  bool TransportStatus::isRetriable() const {
    return kind == CONNECT_ERROR;
  }

  TransportStatusKind TransportStatus::getKind() const {
    return kind;
  }

  const std::string& TransportStatus::getOrigin() const {
    return origin;
  }

  const std::string& TransportStatus::getExplanation() const {
    return explanation;
  }

  TransportStatus::operator std::string() const {
    if(explanation.empty()) return string(kind) + " (" + origin + ")";
    return string(kind) + " (" + origin + "): " + explanation;
  }

}
