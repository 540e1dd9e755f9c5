// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <algorithm>
#include <ctype.h>
#include <errno.h>
#include <stdlib.h>

#include "StringConv.h"

namespace Aeat {

  bool strtoint(const std::string& s, signed int& t, int base) {
    signed long long r;
    if(!strtoint(s, r, base)) return false;
    if((r > 0x7fffffffLL) || (r < -0x7fffffffLL-1)) return false;
    t = (signed int)r;
    return true;
  }

  bool strtoint(const std::string& s, signed long long& t, int base) {
    if(s.empty()) return false;
    if((base < 2) || (base > 16)) return false;
    char* end = NULL;
    errno = 0;
    signed long long r = strtoll(s.c_str(), &end, base);
    if(errno != 0) return false;
    if((!end) || (*end != 0)) return false;
    t = r;
    return true;
  }

  std::string lower(const std::string& s) {
    std::string ret = s;
    std::transform(ret.begin(), ret.end(), ret.begin(), (int(*) (int)) std::tolower);
    return ret;
  }

  std::string upper(const std::string& s) {
    std::string ret = s;
    std::transform(ret.begin(), ret.end(), ret.begin(), (int(*) (int)) std::toupper);
    return ret;
  }

  static const char *blank_chars = " \t\n\v\f\r";

  std::string trim(const std::string& str, const char *sep) {
    if (sep == NULL)
      sep = blank_chars;
    std::string::size_type const first = str.find_first_not_of(sep);
    return (first == std::string::npos) ? std::string() : str.substr(first, str.find_last_not_of(sep) - first + 1);
  }

} // namespace Aeat
