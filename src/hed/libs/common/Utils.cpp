// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <string.h>

#include <aeat/StringConv.h>

#include "Utils.h"

#define BUFLEN 1024

namespace Aeat {

  std::string StrError(int errnum) {
    char errbuf[BUFLEN];
#if defined(_GNU_SOURCE) && !defined(__APPLE__)
    return strerror_r(errnum, errbuf, sizeof(errbuf));
#else
    if (strerror_r(errnum, errbuf, sizeof(errbuf)) == 0)
      return errbuf;
    else
      return "Unknown error " + tostring(errnum);
#endif
  }

} // namespace Aeat
