// -*- indent-tabs-mode: nil -*-

#ifndef __AEAT_CLIENTHTTP_H__
#define __AEAT_CLIENTHTTP_H__

#include <map>
#include <string>

#include <aeat/URL.h>
#include <aeat/communication/Connection.h>

namespace Aeat {

  class Logger;

  struct HTTPClientInfo {
    HTTPClientInfo() : code(0) {}
    int code; /// HTTP response code
    std::string reason; /// HTTP response reason
    std::string type; /// Content-type
    /// All returned headers with names in lower case
    std::multimap<std::string, std::string> headers;
  };

  //! Performs one HTTP/1.1 exchange over established connection.
  /** Request is sent with "Connection: close", hence response body
     ends either at Content-Length, at last chunk or when server closes
     connection. */
  class ClientHTTP {
  public:
    ClientHTTP(Connection& connection, const URL& url);
    ~ClientHTTP();
    /// Sends request and reads whole response.
    /** Response body is stored in response. On failure the status
       tells in which phase it happened. */
    TransportStatus process(const std::string& method,
                            const std::multimap<std::string, std::string>& attributes,
                            const std::string& request,
                            HTTPClientInfo& info, std::string& response);
    /// True once any part of request was passed to connection.
    bool RequestStarted() const { return started_; }
  private:
    bool readbuf(TransportStatus& status);
    bool readline(std::string& line, TransportStatus& status);
    bool read(std::string& body, long long int size, TransportStatus& status);
    bool readall(std::string& body, TransportStatus& status);
    bool read_chunked(std::string& body, TransportStatus& status);
    bool parse_header(HTTPClientInfo& info, TransportStatus& status);
    Connection& connection_;
    URL url_;
    std::string buf_;
    bool started_;
    static Logger logger;
  };

} // namespace Aeat

#endif // __AEAT_CLIENTHTTP_H__
