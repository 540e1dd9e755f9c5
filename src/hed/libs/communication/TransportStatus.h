// TransportStatus.h

#ifndef __AEAT_TRANSPORTSTATUS_H__
#define __AEAT_TRANSPORTSTATUS_H__

#include <string>

namespace Aeat {

  //! Status kinds of network operations.
  /*! Only CONNECT_ERROR is allowed to be retried because it is reported
    before any byte of request left this host.
  */
  enum TransportStatusKind {
    STATUS_OK = 0,       //! Operation succeeded
    CONNECT_ERROR = 1,   //! Name resolution or TCP connection failed
    TLS_ERROR = 2,       //! TLS context setup or handshake failed
    WRITE_ERROR = 4,     //! Request could not be written completely
    READ_TIMEOUT = 8,    //! No response data within read timeout
    READ_ERROR = 16,     //! Connection failed or closed while reading
    PROTOCOL_ERROR = 32  //! Response is not valid HTTP
  };

  //! Conversion to string.
  std::string string(TransportStatusKind kind);

  //! Status of connection level operation.
  /*! Contains kind of status, place where it was produced and
    textual explanation.
  */
  class TransportStatus {
  public:

    //! Default constructor produces STATUS_OK.
    TransportStatus(TransportStatusKind kind = STATUS_OK,
                    const std::string& origin = "???",
                    const std::string& explanation = "");

    //! Is the status kind STATUS_OK?
    bool isOk() const;

    //! May operation which produced this status be attempted again?
    bool isRetriable() const;

    //! Returns status kind.
    TransportStatusKind getKind() const;

    //! Returns component which produced status.
    const std::string& getOrigin() const;

    //! Returns explanation.
    const std::string& getExplanation() const;

    //! Conversion to string.
    operator std::string() const;

    //! Is the status kind STATUS_OK?
    operator bool(void) const { return isOk(); };

    //! Returns true if status kind is not STATUS_OK.
    bool operator!(void) const { return !isOk(); };

  private:

    TransportStatusKind kind;

    std::string origin;

    std::string explanation;

  };

}

#endif
