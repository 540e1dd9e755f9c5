// -*- indent-tabs-mode: nil -*-

#ifndef AEATLIB_JSON
#define AEATLIB_JSON

#include <aeat/XMLNode.h>

namespace Aeat {

  /// Holder class for parsing JSON into XML container.
  /** Object members become child elements named after their keys.
     Array items become sibling elements sharing the name of the array.
     Scalars are stored as textual content, strings with escapes resolved.
     Keys which are not valid XML names are kept as they are. */
  class JSON {
   public:
    /// Parse JSON document and store results into XMLNode container.
    /** Returns false if input is not a complete JSON document. Content
       already stored into xml is not removed in that case. */
    static bool Parse(Aeat::XMLNode& xml, char const * input);

   private:
    /// Constructor is not implemented. Use static methods instead.
    JSON();
    static char const * ParseInternal(Aeat::XMLNode& xml, char const * input, int depth);
    static char const * ParseString(std::string& str, char const * input);
  };

} // namespace Aeat

#endif // AEATLIB_JSON
