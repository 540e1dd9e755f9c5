// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <cctype>

#include <aeat/Logger.h>
#include <aeat/StringConv.h>

#include "URL.h"

namespace Aeat {

  static Logger URLLogger(Logger::getRootLogger(), "URL");

  static int DefaultPort(const std::string& protocol) {
    if (protocol == "https") return 443;
    if (protocol == "http") return 80;
    return -1;
  }

  URL::URL()
    : ip6addr(false),
      port(-1),
      valid(false) {}

  URL::URL(const std::string& url)
    : ip6addr(false),
      port(-1),
      valid(false) {

    std::string::size_type pos, pos2;

    if (url.empty()) return;

    // Looking for protocol separator
    pos = url.find("://");
    if ((pos == std::string::npos) || (pos == 0)) {
      URLLogger.msg(VERBOSE, "URL is not valid: %s", url);
      return;
    }
    for (std::string::size_type p = 0; p < pos; ++p) {
      char c = url[p];
      if (isalnum(c) || (c == '+') || (c == '-') || (c == '.')) continue;
      URLLogger.msg(VERBOSE, "URL is not valid: %s", url);
      return;
    }
    // RFC says protocols should be lowercase and uppercase
    // must be converted to lowercase for consistency
    protocol = lower(url.substr(0, pos));
    pos += 3;

    // End of authority part
    pos2 = url.find_first_of("/?#", pos);
    std::string hostport = url.substr(pos, (pos2 == std::string::npos) ? std::string::npos : (pos2 - pos));
    if (hostport.find('@') != std::string::npos) {
      URLLogger.msg(VERBOSE, "Illegal URL - credentials are not supported: %s", url);
      return;
    }

    std::string portstr;
    if (!hostport.empty() && (hostport[0] == '[')) {
      std::string::size_type close = hostport.find(']');
      if (close == std::string::npos) {
        URLLogger.msg(VERBOSE, "Illegal URL - no closing ] for IPv6 address found: %s", url);
        return;
      }
      ip6addr = true;
      host = hostport.substr(1, close - 1);
      if (close + 1 < hostport.length()) {
        if (hostport[close + 1] != ':') {
          URLLogger.msg(VERBOSE, "Illegal URL - closing ] for IPv6 address is followed by illegal token: %s", url);
          return;
        }
        portstr = hostport.substr(close + 2);
      }
    } else {
      std::string::size_type colon = hostport.find(':');
      host = hostport.substr(0, colon);
      if (colon != std::string::npos) portstr = hostport.substr(colon + 1);
    }
    host = lower(host);
    if (host.empty()) {
      URLLogger.msg(VERBOSE, "Illegal URL - no hostname given: %s", url);
      return;
    }

    if (!portstr.empty()) {
      if (!stringto(portstr, port) || (port <= 0) || (port > 65535)) {
        URLLogger.msg(VERBOSE, "Invalid port number in %s", url);
        return;
      }
    } else {
      port = DefaultPort(protocol);
    }

    if (pos2 != std::string::npos) {
      std::string rest = url.substr(pos2);
      // Fragment is never sent to server
      std::string::size_type frag = rest.find('#');
      if (frag != std::string::npos) rest.resize(frag);
      std::string::size_type q = rest.find('?');
      if (q != std::string::npos) {
        query = rest.substr(q + 1);
        rest.resize(q);
      }
      path = rest;
    }
    if (path.empty() || (path[0] != '/')) path = "/" + path;
    valid = true;
  }

  const std::string& URL::Protocol() const {
    return protocol;
  }

  const std::string& URL::Host() const {
    return host;
  }

  int URL::Port() const {
    return port;
  }

  const std::string& URL::Path() const {
    return path;
  }

  const std::string& URL::Query() const {
    return query;
  }

  std::string URL::FullPath() const {
    if (query.empty()) return path;
    return path + "?" + query;
  }

  std::string URL::HostPort() const {
    std::string hp = ip6addr ? ("[" + host + "]") : host;
    if ((port > 0) && (port != DefaultPort(protocol))) hp += ":" + tostring(port);
    return hp;
  }

  std::string URL::str() const {
    if (!valid) return "";
    return protocol + "://" + HostPort() + FullPath();
  }

  URL::operator bool() const {
    return valid;
  }

  bool URL::operator!() const {
    return !valid;
  }

  std::ostream& operator<<(std::ostream& out, const URL& u) {
    return (out << u.str());
  }

} // namespace Aeat
