// -*- indent-tabs-mode: nil -*-

#ifndef __AEAT_TLSCONNECTION_H__
#define __AEAT_TLSCONNECTION_H__

#include <openssl/ssl.h>

#include <aeat/communication/Connection.h>

namespace Aeat {

  class Logger;
  class TCPSocket;

  /// TLS stream over TCPSocket.
  /** Takes ownership of socket and OpenSSL objects passed to it. */
  class TLSConnection
    : public Connection {
  public:
    TLSConnection(TCPSocket* socket, SSL_CTX* ctx, SSL* ssl);
    virtual ~TLSConnection();
    virtual TransportStatus Write(const char* buf, int size);
    virtual TransportStatus Read(char* buf, int& size);
    virtual void Close();
  private:
    TLSConnection(const TLSConnection&);
    TLSConnection& operator=(const TLSConnection&);
    TCPSocket* socket_;
    SSL_CTX* sslctx_;
    SSL* ssl_;
  };

  /// Opens mutually authenticated TLS connections.
  /** Server certificate is verified against trusted CAs and its name
     must match host of URL. Client certificate and key are loaded from
     PEM files of ConnectionConfig. Name resolution and TCP connection
     failures are reported as CONNECT_ERROR, any problem after TCP
     connection is established is TLS_ERROR. */
  class TLSConnector
    : public Connector {
  public:
    TLSConnector() {}
    virtual ~TLSConnector() {}
    virtual Connection* Connect(const ConnectionConfig& cfg, TransportStatus& status);
    /// Collects and clears queued OpenSSL errors.
    static std::string HandleError(void);
  private:
    static Logger logger;
  };

} // namespace Aeat

#endif /* __AEAT_TLSCONNECTION_H__ */
