// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <cstdlib>
#include <cstring>
#include <strings.h>

#include <aeat/Logger.h>
#include <aeat/StringConv.h>

#include "ClientHTTP.h"

namespace Aeat {

  Logger ClientHTTP::logger(Logger::getRootLogger(), "ClientHTTP");

  // keeping line size sane
  static const std::string::size_type MaxLineLength = 4096;

  static bool ParseHTTPVersion(const std::string& s, int& major, int& minor) {
    major = 0; minor = 0;
    if (strncasecmp("HTTP/", s.c_str(), 5) != 0) return false;
    const char* p = s.c_str() + 5;
    char* e;
    major = strtol(p, &e, 10);
    if (*e != '.') return false;
    p = e + 1;
    minor = strtol(p, &e, 10);
    if (*e != 0) return false;
    return true;
  }

  ClientHTTP::ClientHTTP(Connection& connection, const URL& url)
    : connection_(connection),
      url_(url),
      started_(false) {}

  ClientHTTP::~ClientHTTP() {}

  bool ClientHTTP::readbuf(TransportStatus& status) {
    char buf[4096];
    int l = sizeof(buf);
    status = connection_.Read(buf, l);
    if (!status) return false;
    if (l <= 0) return false;
    buf_.append(buf, l);
    return true;
  }

  bool ClientHTTP::readline(std::string& line, TransportStatus& status) {
    line.resize(0);
    for (;;) {
      std::string::size_type p = buf_.find('\n');
      if (p != std::string::npos) {
        line = buf_.substr(0, p);
        buf_.erase(0, p + 1);
        if ((!line.empty()) && (line[line.length() - 1] == '\r')) line.resize(line.length() - 1);
        return true;
      }
      if (buf_.length() > MaxLineLength) {
        status = TransportStatus(PROTOCOL_ERROR, "HTTP", "Header line is too long");
        return false;
      }
      if (!readbuf(status)) {
        if (status) status = TransportStatus(READ_ERROR, "HTTP", "Connection closed before response was complete");
        return false;
      }
    }
  }

  bool ClientHTTP::read(std::string& body, long long int size, TransportStatus& status) {
    while ((long long int)buf_.length() < size) {
      if (!readbuf(status)) {
        if (status) status = TransportStatus(READ_ERROR, "HTTP", "Connection closed before response was complete");
        return false;
      }
    }
    body.append(buf_, 0, size);
    buf_.erase(0, size);
    return true;
  }

  bool ClientHTTP::readall(std::string& body, TransportStatus& status) {
    body += buf_;
    buf_.resize(0);
    while (readbuf(status)) {
      body += buf_;
      buf_.resize(0);
    }
    return (bool)status;
  }

  bool ClientHTTP::read_chunked(std::string& body, TransportStatus& status) {
    for (;;) {
      std::string line;
      if (!readline(line, status)) return false;
      // Chunk extensions are ignored
      long long int chunk_size = -1;
      if (!strtoint(trim(line.substr(0, line.find(';'))), chunk_size, 16) || (chunk_size < 0)) {
        status = TransportStatus(PROTOCOL_ERROR, "HTTP", "Invalid chunk size: " + line);
        return false;
      }
      if (chunk_size == 0) break;
      if (!read(body, chunk_size, status)) return false;
      // CRLF at end of chunk
      if (!readline(line, status)) return false;
      if (!line.empty()) {
        status = TransportStatus(PROTOCOL_ERROR, "HTTP", "Missing end of chunk");
        return false;
      }
    }
    // Trailer
    for (;;) {
      std::string line;
      if (!readline(line, status)) return false;
      if (line.empty()) break;
    }
    return true;
  }

  bool ClientHTTP::parse_header(HTTPClientInfo& info, TransportStatus& status) {
    std::string line;
    // Skip empty lines
    for (; line.empty();) if (!readline(line, status)) return false;
    logger.msg(DEBUG, "< %s", line);
    std::string::size_type pos2 = line.find(' ');
    int version_major, version_minor;
    if ((pos2 == std::string::npos) ||
        !ParseHTTPVersion(line.substr(0, pos2), version_major, version_minor)) {
      status = TransportStatus(PROTOCOL_ERROR, "HTTP", "Response is not HTTP: " + line);
      return false;
    }
    char* e;
    info.code = strtol(line.c_str() + pos2 + 1, &e, 10);
    if ((e == line.c_str() + pos2 + 1) || ((*e != ' ') && (*e != 0))) {
      status = TransportStatus(PROTOCOL_ERROR, "HTTP", "Invalid response status: " + line);
      return false;
    }
    std::string::size_type pos3 = line.find(' ', pos2 + 1);
    info.reason = (pos3 == std::string::npos) ? "" : line.substr(pos3 + 1);
    info.headers.clear();
    for (;;) {
      if (!readline(line, status)) return false;
      if (line.empty()) break;
      logger.msg(DEBUG, "< %s", line);
      std::string::size_type pos = line.find(':');
      if (pos == std::string::npos) continue;
      std::string name = lower(line.substr(0, pos));
      info.headers.insert(std::pair<std::string, std::string>(name, trim(line.substr(pos + 1))));
    }
    std::multimap<std::string, std::string>::iterator it = info.headers.find("content-type");
    info.type = (it != info.headers.end()) ? it->second : "";
    return true;
  }

  TransportStatus ClientHTTP::process(const std::string& method,
                                      const std::multimap<std::string, std::string>& attributes,
                                      const std::string& request,
                                      HTTPClientInfo& info, std::string& response) {
    response.resize(0);
    std::string header = method + " " + url_.FullPath() + " HTTP/1.1\r\n";
    header += "Host: " + url_.HostPort() + "\r\n";
    for (std::multimap<std::string, std::string>::const_iterator a = attributes.begin();
         a != attributes.end(); ++a) {
      header += a->first + ": " + a->second + "\r\n";
    }
    header += "Content-Length: " + tostring(request.length()) + "\r\n";
    header += "Connection: close\r\n";
    header += "\r\n";
    logger.msg(DEBUG, "> %s %s HTTP/1.1", method, url_.FullPath());
    std::string message = header + request;
    started_ = true;
    TransportStatus status = connection_.Write(message.c_str(), message.length());
    if (!status) return status;
    logger.msg(DEBUG, "Request sent: %d bytes", (int)message.length());
    // Informational responses precede final one
    do {
      if (!parse_header(info, status)) return status;
    } while ((info.code >= 100) && (info.code < 200));
    if ((method == "HEAD") || (info.code == 204) || (info.code == 304)) {
      return TransportStatus(STATUS_OK, "HTTP");
    }
    std::multimap<std::string, std::string>::iterator it = info.headers.find("transfer-encoding");
    if (it != info.headers.end()) {
      if (strcasecmp(it->second.c_str(), "chunked") != 0) {
        return TransportStatus(PROTOCOL_ERROR, "HTTP", "Unsupported transfer encoding: " + it->second);
      }
      if (!read_chunked(response, status)) return status;
    } else if ((it = info.headers.find("content-length")) != info.headers.end()) {
      long long int length = -1;
      if (!stringto(it->second, length) || (length < 0)) {
        return TransportStatus(PROTOCOL_ERROR, "HTTP", "Invalid Content-Length: " + it->second);
      }
      if (!read(response, length, status)) return status;
    } else {
      if (!readall(response, status)) return status;
    }
    logger.msg(DEBUG, "Response received: %d %s, %d bytes", info.code, info.reason, (int)response.length());
    return TransportStatus(STATUS_OK, "HTTP");
  }

} // namespace Aeat
