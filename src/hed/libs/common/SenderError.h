// -*- indent-tabs-mode: nil -*-

#ifndef __AEAT_SENDERERROR_H__
#define __AEAT_SENDERERROR_H__

#include <stdexcept>
#include <string>

namespace Aeat {

  /** \addtogroup common
   *  @{ */

  /// Categories of failures of one send operation.
  /** Each category maps to its own exit code of command line tools so
     that automated callers can branch without parsing messages. */
  enum ErrorKind {
    NoError = 0,
    ConfigurationError,      ///< Missing or invalid configuration.
    PayloadFormatError,      ///< Payload to be sent is not usable XML.
    CertificateFormatError,  ///< Client certificate container can not be used.
    CommunicationError,      ///< Request could not be delivered or answered.
    EnvelopeParseError,      ///< Response is not a well-formed document.
    FunctionalError          ///< Server returned a SOAP Fault.
  };

  /// Human readable name of error category.
  std::string ErrorKindString(ErrorKind kind);

  /// Base class for exceptions raised by components of the sender.
  /** Exceptions are used inside one component only. At boundary of
     one send operation they are converted into OperationResult. */
  class SenderError
    : public std::runtime_error {
  public:
    SenderError(ErrorKind kind, const std::string& what)
      : std::runtime_error(what), kind_(kind) {}
    ErrorKind Kind() const {
      return kind_;
    }
  private:
    ErrorKind kind_;
  };

  /// Raised when configuration can not be loaded or is incomplete.
  class ConfigError
    : public SenderError {
  public:
    ConfigError(const std::string& what = "")
      : SenderError(ConfigurationError, what) {}
  };

  /// Raised when payload can not be embedded into envelope.
  class PayloadError
    : public SenderError {
  public:
    PayloadError(const std::string& what = "")
      : SenderError(PayloadFormatError, what) {}
  };

  /// Raised when PKCS#12 container is unreadable or passphrase is rejected.
  class CertificateError
    : public SenderError {
  public:
    CertificateError(const std::string& what = "")
      : SenderError(CertificateFormatError, what) {}
  };

  /// Raised on network, TLS or HTTP level failures.
  class CommunicationException
    : public SenderError {
  public:
    CommunicationException(const std::string& what = "")
      : SenderError(CommunicationError, what) {}
  };

  /// Raised when response can not be parsed as XML document.
  class EnvelopeError
    : public SenderError {
  public:
    EnvelopeError(const std::string& what = "")
      : SenderError(EnvelopeParseError, what) {}
  };

  /** @} */

} // namespace Aeat

#endif // __AEAT_SENDERERROR_H__
