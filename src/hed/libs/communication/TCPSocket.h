// -*- indent-tabs-mode: nil -*-

#ifndef __AEAT_TCPSOCKET_H__
#define __AEAT_TCPSOCKET_H__

#include <string>

#include <aeat/communication/Connection.h>

namespace Aeat {

  class Logger;

  /// Waits for events on socket h for at most timeout seconds.
  /** Negative timeout means infinite wait. Returns result of poll()
     and stores received events in events. */
  int spoll(int h, int timeout, unsigned int& events);

  /// Plain TCP connection.
  class TCPSocket
    : public Connection {
  public:
    /// Connects to host:port trying all resolved addresses.
    /** Socket is non-blocking, connect_timeout applies to every
       address. Check with operator bool and Failure(). */
    TCPSocket(const std::string& host, int port, int connect_timeout, int read_timeout);
    virtual ~TCPSocket();
    virtual TransportStatus Write(const char* buf, int size);
    virtual TransportStatus Read(char* buf, int& size);
    virtual void Close();
    int Handle() const { return handle_; }
    int ReadTimeout() const { return read_timeout_; }
    /// Description of failed connection attempt.
    const std::string& Failure() const { return error_; }
    operator bool() const { return (handle_ != -1); }
    bool operator!() const { return (handle_ == -1); }
  private:
    TCPSocket(const TCPSocket&);
    TCPSocket& operator=(const TCPSocket&);
    int connect_socket(const std::string& host, int port);
    int handle_;
    int connect_timeout_;
    int read_timeout_;
    std::string error_;
    static Logger logger;
  };

} // namespace Aeat

#endif /* __AEAT_TCPSOCKET_H__ */
