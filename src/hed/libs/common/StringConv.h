// -*- indent-tabs-mode: nil -*-

#ifndef AEATLIB_STRINGCONV
#define AEATLIB_STRINGCONV

#include <iomanip>
#include <sstream>
#include <string>

namespace Aeat {

  /** \addtogroup common
   *  @{ */

  /// This method converts a string to any type but lets calling function process errors.
  /** Returns false if string is empty or is not fully consumed by conversion. */
  template<typename T>
  bool stringto(const std::string& s, T& t) {
    t = 0;
    if (s.empty())
      return false;
    std::stringstream ss(s);
    ss >> t;
    if (ss.fail())
      return false;
    if (!ss.eof())
      return false;
    return true;
  }

  /// Convert string to integer with specified base.
  /** \return false if any argument is wrong. */
  bool strtoint(const std::string& s, signed int& t, int base = 10);

  /// Convert string to long long integer with specified base.
  /** \return false if any argument is wrong. */
  bool strtoint(const std::string& s, signed long long& t, int base = 10);

  /// This method converts any type to a string of the width given.
  template<typename T>
  std::string tostring(T t, int width = 0, int precision = 0) {
    std::stringstream ss;
    if (precision)
      ss << std::setprecision(precision);
    ss << std::setw(width) << t;
    return ss.str();
  }

  /// This method converts the given string to lower case.
  std::string lower(const std::string& s);

  /// This method converts the given string to upper case.
  std::string upper(const std::string& s);

  /// This method removes given separators from the beginning and the end of the string.
  /** Default separators are white space characters. */
  std::string trim(const std::string& str, const char *sep = NULL);

  /** @} */

} // namespace Aeat

#endif // AEATLIB_STRINGCONV
