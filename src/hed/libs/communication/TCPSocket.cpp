#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <ctime>
#include <cstring>
#include <unistd.h>
#include <errno.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/poll.h>
#include <fcntl.h>

#include <aeat/Logger.h>
#include <aeat/StringConv.h>
#include <aeat/Utils.h>

#include "TCPSocket.h"

namespace Aeat {

Logger TCPSocket::logger(Logger::getRootLogger(), "TCPSocket");

int spoll(int h, int timeout, unsigned int& events) {
  int r;
  // Second resolution is enough
  time_t c_time = time(NULL);
  time_t f_time = c_time + timeout;
  struct pollfd fd;
  for(;;) {
    fd.fd=h; fd.events=events; fd.revents=0;
    r = ::poll(&fd,1,(timeout < 0)?-1:(f_time-c_time)*1000);
    if(r != -1) break; // success or timeout
    // Checking for operation interrupted by signal
    if(errno != EINTR) break;
    if(timeout < 0) continue;
    time_t n_time = time(NULL);
    // Protection against time jumping backward
    if(((int)(n_time - c_time)) < 0) f_time -= (c_time - n_time);
    c_time = n_time;
    // If over time, make one more try with 0 timeout
    if(((int)(f_time - c_time)) < 0) c_time = f_time;
  }
  events = fd.revents;
  return r;
}

int TCPSocket::connect_socket(const std::string& hostname, int port) {
  std::string port_str = tostring(port);
  struct addrinfo hint;
  memset(&hint, 0, sizeof(hint));
  hint.ai_family = AF_UNSPEC;
  hint.ai_socktype = SOCK_STREAM;
  hint.ai_protocol = IPPROTO_TCP;
  struct addrinfo *info = NULL;
  int ret = getaddrinfo(hostname.c_str(), port_str.c_str(), &hint, &info);
  if ((ret != 0) || (!info)) {
    std::string err_str = gai_strerror(ret);
    error_ = IString("Failed to resolve %s (%s)", hostname, err_str).str();
    logger.msg(VERBOSE, "%s", error_);
    return -1;
  }
  int s = -1;
  for(struct addrinfo *info_ = info;info_;info_=info_->ai_next) {
    int family = info_->ai_family;
    const char* family_str = (family==AF_INET6)?"IPv6":"IPv4";
    logger.msg(VERBOSE,"Trying to connect %s(%s):%d",hostname,family_str,port);
    s = ::socket(family, SOCK_STREAM, IPPROTO_TCP);
    if(s == -1) {
      error_ = IString("Failed to create socket for connecting to %s(%s):%d - %s",
                       hostname,family_str,port,StrError(errno)).str();
      logger.msg(VERBOSE, "%s", error_);
      continue;
    }
    // Non-blocking socket because poll() is used for waiting
    int s_flags = ::fcntl(s, F_GETFL, 0);
    if((s_flags == -1) || (::fcntl(s, F_SETFL, s_flags | O_NONBLOCK) == -1)) {
      logger.msg(VERBOSE, "Failed to set TCP socket options for connection"
                          " to %s(%s):%d - timeout won't work - %s",
                          hostname,family_str,port,StrError(errno));
    }
    if(::connect(s, info_->ai_addr, info_->ai_addrlen) == -1) {
      if(errno != EINPROGRESS) {
        error_ = IString("Failed to connect to %s(%s):%i - %s",
                         hostname,family_str,port,StrError(errno)).str();
        logger.msg(VERBOSE, "%s", error_);
        ::close(s); s = -1;
        continue;
      }
      unsigned int events = POLLOUT | POLLPRI;
      int pres = spoll(s,connect_timeout_,events);
      if(pres == 0) {
        error_ = IString("Timeout connecting to %s(%s):%i - %i s",
                         hostname,family_str,port,connect_timeout_).str();
        logger.msg(VERBOSE, "%s", error_);
        ::close(s); s = -1;
        continue;
      }
      if(pres != 1) {
        error_ = IString("Failed while waiting for connection to %s(%s):%i - %s",
                         hostname,family_str,port,StrError(errno)).str();
        logger.msg(VERBOSE, "%s", error_);
        ::close(s); s = -1;
        continue;
      }
      int so_error = 0;
      socklen_t so_len = sizeof(so_error);
      if(::getsockopt(s, SOL_SOCKET, SO_ERROR, &so_error, &so_len) != 0) so_error = errno;
      if((so_error != 0) || (events & (POLLERR | POLLHUP))) {
        error_ = IString("Failed to connect to %s(%s):%i - %s",
                         hostname,family_str,port,
                         StrError(so_error?so_error:ECONNREFUSED)).str();
        logger.msg(VERBOSE, "%s", error_);
        ::close(s); s = -1;
        continue;
      }
    }
    break;
  };
  freeaddrinfo(info);
  if(s != -1) error_ = "";
  return s;
}

TCPSocket::TCPSocket(const std::string& host, int port, int connect_timeout, int read_timeout)
  : handle_(-1),
    connect_timeout_(connect_timeout),
    read_timeout_(read_timeout) {
  handle_ = connect_socket(host, port);
}

TCPSocket::~TCPSocket() {
  Close();
}

void TCPSocket::Close() {
  if(handle_ != -1) { ::shutdown(handle_,2); ::close(handle_); };
  handle_ = -1;
}

TransportStatus TCPSocket::Write(const char* buf, int size) {
  if(handle_ == -1) return TransportStatus(WRITE_ERROR, "TCP", "Connection is closed");
  for(;size > 0;) {
    unsigned int events = POLLOUT | POLLERR;
    int pres = spoll(handle_,read_timeout_,events);
    if(pres == 0) return TransportStatus(WRITE_ERROR, "TCP", "Timeout while sending request");
    if(pres != 1) return TransportStatus(WRITE_ERROR, "TCP", StrError(errno));
    if(!(events & POLLOUT)) return TransportStatus(WRITE_ERROR, "TCP", "Connection failed");
    ssize_t l = ::send(handle_,buf,size,MSG_NOSIGNAL);
    if(l == -1) {
      if((errno == EINTR) || (errno == EAGAIN) || (errno == EWOULDBLOCK)) continue;
      return TransportStatus(WRITE_ERROR, "TCP", StrError(errno));
    }
    buf += l; size -= l;
  }
  return TransportStatus(STATUS_OK, "TCP");
}

TransportStatus TCPSocket::Read(char* buf, int& size) {
  int l = size;
  size = 0;
  if(handle_ == -1) return TransportStatus(READ_ERROR, "TCP", "Connection is closed");
  for(;;) {
    unsigned int events = POLLIN | POLLPRI | POLLERR;
    int pres = spoll(handle_,read_timeout_,events);
    if(pres == 0) {
      return TransportStatus(READ_TIMEOUT, "TCP",
                             IString("No response within %i s", read_timeout_).str());
    }
    if(pres != 1) return TransportStatus(READ_ERROR, "TCP", StrError(errno));
    ssize_t ll = ::recv(handle_,buf,l,0);
    if(ll == -1) {
      if((errno == EINTR) || (errno == EAGAIN) || (errno == EWOULDBLOCK)) continue;
      return TransportStatus(READ_ERROR, "TCP", StrError(errno));
    }
    size = ll;
    break;
  }
  return TransportStatus(STATUS_OK, "TCP");
}

} // namespace Aeat
