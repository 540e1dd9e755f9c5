// -*- indent-tabs-mode: nil -*-

#ifndef __AEAT_CONNECTION_H__
#define __AEAT_CONNECTION_H__

#include <string>

#include <aeat/URL.h>
#include <aeat/communication/TransportStatus.h>

namespace Aeat {

  /** \addtogroup communication
   *  @{ */

  /// Parameters of one outgoing connection.
  class ConnectionConfig {
  public:
    ConnectionConfig()
      : connect_timeout(-1),
        read_timeout(-1) {}
    URL url;
    /// Limit for name resolution, TCP connect and TLS handshake, in seconds.
    int connect_timeout;
    /// Limit for waiting for each piece of response, in seconds.
    int read_timeout;
    /// PEM file with client certificate and its chain.
    std::string cert_file;
    /// PEM file with unencrypted private key.
    std::string key_file;
    /// Trusted CA certificates. System defaults are used if both empty.
    std::string ca_file;
    std::string ca_dir;
  };

  /// Established bidirectional byte stream.
  /** Implementations apply timeouts of ConnectionConfig they were
     created with. */
  class Connection {
  public:
    virtual ~Connection() {}
    /// Writes whole buffer.
    virtual TransportStatus Write(const char* buf, int size) = 0;
    /// Reads at most size bytes.
    /** On return size holds number of bytes read. Zero with STATUS_OK
       means peer closed connection. */
    virtual TransportStatus Read(char* buf, int& size) = 0;
    /// Closes connection. Further Write and Read calls fail.
    virtual void Close() = 0;
  };

  /// Factory of connections.
  /** Separated from Connection so that network can be replaced in
     tests. */
  class Connector {
  public:
    virtual ~Connector() {}
    /// Establishes connection.
    /** Returns new object owned by caller or NULL in which case status
       describes failure. */
    virtual Connection* Connect(const ConnectionConfig& cfg, TransportStatus& status) = 0;
  };

  /** @} */

} // namespace Aeat

#endif // __AEAT_CONNECTION_H__
