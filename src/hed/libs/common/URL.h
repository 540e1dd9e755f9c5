// -*- indent-tabs-mode: nil -*-

#ifndef __AEAT_URL_H__
#define __AEAT_URL_H__

#include <string>
#include <iostream>

namespace Aeat {

  /// Class to hold general URLs.
  /** Only URLs with host part are handled, i.e.
     protocol://host[:port][/path][?query]. IPv6 addresses must be enclosed
     in square brackets. Protocol and host are converted to lower case.
     \ingroup common
     \headerfile URL.h aeat/URL.h */
  class URL {
  public:
    /// Empty constructor. URL object is invalid.
    URL();
    /// Constructs a new URL from a string representation.
    URL(const std::string& url);

    /// Returns the protocol of the URL.
    const std::string& Protocol() const;
    /// Returns the hostname of the URL without IPv6 brackets.
    const std::string& Host() const;
    /// Returns the port of the URL. Default port of protocol if not specified.
    int Port() const;
    /// Returns the path of the URL. Always starts with '/'.
    const std::string& Path() const;
    /// Returns the query part of the URL without '?'.
    const std::string& Query() const;
    /// Returns path and query as used in HTTP request line.
    std::string FullPath() const;
    /// Returns a string representation of the URL.
    std::string str() const;
    /// Returns the host with port as used in HTTP Host header.
    std::string HostPort() const;

    /// Check if instance holds valid URL.
    operator bool() const;
    bool operator!() const;

  protected:
    std::string protocol;
    std::string host;
    bool ip6addr;
    int port;
    std::string path;
    std::string query;
    bool valid;
  };

  /// Overloaded operator << to print a URL.
  std::ostream& operator<<(std::ostream& out, const URL& u);

} // namespace Aeat

#endif // __AEAT_URL_H__
