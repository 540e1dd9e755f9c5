#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <ctime>
#include <errno.h>
#include <sys/poll.h>
#include <arpa/inet.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <aeat/Logger.h>
#include <aeat/Utils.h>

#include "TCPSocket.h"
#include "TLSConnection.h"

namespace Aeat {

Logger TLSConnector::logger(Logger::getRootLogger(), "TLSConnector");

std::string TLSConnector::HandleError(void) {
  std::string errstr;
  unsigned long e = ERR_get_error();
  while(e != 0) {
    const char* lib = ERR_lib_error_string(e);
    const char* reason = ERR_reason_error_string(e);
    // Ignore unknown errors
    if (reason || lib) {
      if(!errstr.empty()) errstr += "\n";
      errstr += "SSL error";
      if (reason) errstr += ", \"" + std::string(reason) + "\"";
      if (lib) errstr += ", at \"" + std::string(lib) + "\" library";
    }
    e = ERR_get_error();
  }
  return errstr;
}

static bool is_ip_address(const std::string& host) {
  unsigned char buf[sizeof(struct in6_addr)];
  if(inet_pton(AF_INET, host.c_str(), buf) == 1) return true;
  if(inet_pton(AF_INET6, host.c_str(), buf) == 1) return true;
  return false;
}

// Waits for socket to become ready as requested by OpenSSL.
// Returns 1 if ready, 0 on timeout and -1 on failure.
static int wait_ssl(int h, int err, int timeout) {
  unsigned int events = POLLERR;
  if(err == SSL_ERROR_WANT_READ) events |= POLLIN | POLLPRI;
  else events |= POLLOUT;
  int pres = spoll(h, timeout, events);
  if(pres == 0) return 0;
  if(pres != 1) return -1;
  if(!(events & (POLLIN | POLLPRI | POLLOUT))) return -1;
  return 1;
}

Connection* TLSConnector::Connect(const ConnectionConfig& cfg, TransportStatus& status) {
  const std::string& host = cfg.url.Host();
  AutoPointer<TCPSocket> socket(new TCPSocket(host, cfg.url.Port(), cfg.connect_timeout, cfg.read_timeout));
  if(!(*socket)) {
    status = TransportStatus(CONNECT_ERROR, "TCP", socket->Failure());
    return NULL;
  }
  ERR_clear_error();
  AutoPointer<SSL_CTX> sslctx(SSL_CTX_new(TLS_client_method()), &SSL_CTX_free);
  if(!sslctx) {
    status = TransportStatus(TLS_ERROR, "TLS", "Failed to create SSL context\n" + HandleError());
    return NULL;
  }
  SSL_CTX_set_min_proto_version(sslctx.Ptr(), TLS1_2_VERSION);
  SSL_CTX_set_mode(sslctx.Ptr(), SSL_MODE_ENABLE_PARTIAL_WRITE);
  SSL_CTX_set_session_cache_mode(sslctx.Ptr(), SSL_SESS_CACHE_OFF);
  long ctx_options = SSL_OP_ALL | SSL_OP_NO_TICKET;
  // Servers often close connection without close_notify after response
  ctx_options |= SSL_OP_IGNORE_UNEXPECTED_EOF;
  SSL_CTX_set_options(sslctx.Ptr(), ctx_options);
  if(!cfg.ca_file.empty() || !cfg.ca_dir.empty()) {
    logger.msg(VERBOSE, "Using CA file: %s", cfg.ca_file);
    logger.msg(VERBOSE, "Using CA dir: %s", cfg.ca_dir);
    if(!SSL_CTX_load_verify_locations(sslctx.Ptr(), cfg.ca_file.empty()?NULL:cfg.ca_file.c_str(),
                                      cfg.ca_dir.empty()?NULL:cfg.ca_dir.c_str())) {
      status = TransportStatus(TLS_ERROR, "TLS", "Can not assign CA location\n" + HandleError());
      return NULL;
    }
  } else {
    logger.msg(VERBOSE, "Using CA default location");
    if(!SSL_CTX_set_default_verify_paths(sslctx.Ptr())) {
      status = TransportStatus(TLS_ERROR, "TLS", "Can not assign default CA location\n" + HandleError());
      return NULL;
    }
  }
  if(!cfg.cert_file.empty()) {
    if(SSL_CTX_use_certificate_chain_file(sslctx.Ptr(), cfg.cert_file.c_str()) != 1) {
      status = TransportStatus(TLS_ERROR, "TLS", "Can not load certificate file\n" + HandleError());
      return NULL;
    }
    if(SSL_CTX_use_PrivateKey_file(sslctx.Ptr(), cfg.key_file.c_str(), SSL_FILETYPE_PEM) != 1) {
      status = TransportStatus(TLS_ERROR, "TLS", "Can not load key file\n" + HandleError());
      return NULL;
    }
    if(SSL_CTX_check_private_key(sslctx.Ptr()) != 1) {
      status = TransportStatus(TLS_ERROR, "TLS", "Private key does not match certificate\n" + HandleError());
      return NULL;
    }
  }
  SSL_CTX_set_verify(sslctx.Ptr(), SSL_VERIFY_PEER, NULL);
  AutoPointer<SSL> ssl(SSL_new(sslctx.Ptr()), &SSL_free);
  if(!ssl) {
    status = TransportStatus(TLS_ERROR, "TLS", "Can not create the SSL object\n" + HandleError());
    return NULL;
  }
  X509_VERIFY_PARAM* param = SSL_get0_param(ssl.Ptr());
  X509_VERIFY_PARAM_set_hostflags(param, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
  int host_set = 0;
  if(is_ip_address(host)) {
    host_set = X509_VERIFY_PARAM_set1_ip_asc(param, host.c_str());
  } else {
    host_set = X509_VERIFY_PARAM_set1_host(param, host.c_str(), host.length());
    if(host_set && !SSL_set_tlsext_host_name(ssl.Ptr(), host.c_str())) {
      logger.msg(WARNING, "Failed to set SNI host name %s", host);
    }
  }
  if(!host_set) {
    status = TransportStatus(TLS_ERROR, "TLS", "Can not set expected server name\n" + HandleError());
    return NULL;
  }
  if(!SSL_set_fd(ssl.Ptr(), socket->Handle())) {
    status = TransportStatus(TLS_ERROR, "TLS", "Can not attach socket\n" + HandleError());
    return NULL;
  }
  // Handshake as a whole is limited by connect timeout
  time_t deadline = time(NULL) + cfg.connect_timeout;
  for(;;) {
    int r = SSL_connect(ssl.Ptr());
    if(r == 1) break;
    int err = SSL_get_error(ssl.Ptr(), r);
    if((err == SSL_ERROR_WANT_READ) || (err == SSL_ERROR_WANT_WRITE)) {
      int left = -1;
      if(cfg.connect_timeout >= 0) {
        left = deadline - time(NULL);
        if(left < 0) left = 0;
      }
      int w = wait_ssl(socket->Handle(), err, left);
      if(w == 1) continue;
      if(w == 0) {
        status = TransportStatus(TLS_ERROR, "TLS",
                   IString("Timeout during TLS handshake with %s", host).str());
      } else {
        status = TransportStatus(TLS_ERROR, "TLS",
                   IString("Connection failed during TLS handshake with %s", host).str());
      }
      return NULL;
    }
    std::string reason;
    long verify = SSL_get_verify_result(ssl.Ptr());
    if(verify != X509_V_OK) {
      reason = std::string("Server certificate verification failed: ") +
               X509_verify_cert_error_string(verify) + "\n";
    }
    reason += HandleError();
    if(err == SSL_ERROR_SYSCALL) reason += "\n" + StrError(errno);
    logger.msg(VERBOSE, "TLS handshake with %s failed: %s", host, reason);
    status = TransportStatus(TLS_ERROR, "TLS", "Failed to establish TLS connection\n" + reason);
    return NULL;
  }
  logger.msg(VERBOSE, "Using protocol %s, cipher: %s",
             SSL_get_version(ssl.Ptr()), SSL_get_cipher_name(ssl.Ptr()));
  status = TransportStatus(STATUS_OK, "TLS");
  SSL_CTX* ctx = sslctx.Release();
  return new TLSConnection(socket.Release(), ctx, ssl.Release());
}

TLSConnection::TLSConnection(TCPSocket* socket, SSL_CTX* ctx, SSL* ssl)
  : socket_(socket),
    sslctx_(ctx),
    ssl_(ssl) {
}

TLSConnection::~TLSConnection() {
  Close();
  if(ssl_) { SSL_free(ssl_); ssl_=NULL; }
  if(sslctx_) { SSL_CTX_free(sslctx_); sslctx_=NULL; }
  delete socket_;
}

void TLSConnection::Close() {
  if(ssl_ && socket_ && (*socket_)) {
    // Best effort close_notify, peer answer is not awaited
    SSL_shutdown(ssl_);
    ERR_clear_error();
  }
  if(socket_) socket_->Close();
}

TransportStatus TLSConnection::Write(const char* buf, int size) {
  if(!socket_ || !(*socket_)) return TransportStatus(WRITE_ERROR, "TLS", "Connection is closed");
  for(;size > 0;) {
    int l = SSL_write(ssl_, buf, size);
    if(l > 0) {
      buf += l; size -= l;
      continue;
    }
    int err = SSL_get_error(ssl_, l);
    if((err == SSL_ERROR_WANT_READ) || (err == SSL_ERROR_WANT_WRITE)) {
      int w = wait_ssl(socket_->Handle(), err, socket_->ReadTimeout());
      if(w == 1) continue;
      if(w == 0) return TransportStatus(WRITE_ERROR, "TLS", "Timeout while sending request");
      return TransportStatus(WRITE_ERROR, "TLS", "Connection failed while sending request");
    }
    std::string reason = TLSConnector::HandleError();
    if(err == SSL_ERROR_SYSCALL) reason += StrError(errno);
    return TransportStatus(WRITE_ERROR, "TLS", reason);
  }
  return TransportStatus(STATUS_OK, "TLS");
}

TransportStatus TLSConnection::Read(char* buf, int& size) {
  int bufsize = size;
  size = 0;
  if(!socket_ || !(*socket_)) return TransportStatus(READ_ERROR, "TLS", "Connection is closed");
  for(;;) {
    int l = SSL_read(ssl_, buf, bufsize);
    if(l > 0) {
      size = l;
      break;
    }
    int err = SSL_get_error(ssl_, l);
    if(err == SSL_ERROR_ZERO_RETURN) break;
    if((err == SSL_ERROR_WANT_READ) || (err == SSL_ERROR_WANT_WRITE)) {
      int w = wait_ssl(socket_->Handle(), err, socket_->ReadTimeout());
      if(w == 1) continue;
      if(w == 0) {
        return TransportStatus(READ_TIMEOUT, "TLS",
                 IString("No response within %i s", socket_->ReadTimeout()).str());
      }
      return TransportStatus(READ_ERROR, "TLS", "Connection failed while waiting for response");
    }
    std::string reason = TLSConnector::HandleError();
    if(err == SSL_ERROR_SYSCALL) reason += StrError(errno);
    return TransportStatus(READ_ERROR, "TLS", reason);
  }
  return TransportStatus(STATUS_OK, "TLS");
}

} // namespace Aeat
