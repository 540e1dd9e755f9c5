// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <string>
#include <cctype>
#include <cstring>

#include "XMLNode.h"
#include "JSON.h"

namespace Aeat {

  static const int MaxDepth = 64;

  static char const * SkipWS(char const * input) {
    while(*input) {
      if(!std::isspace(static_cast<unsigned char>(*input)))
        break;
      ++input;
    }
    return input;
  }

  static int HexValue(char c) {
    if((c >= '0') && (c <= '9')) return c - '0';
    if((c >= 'a') && (c <= 'f')) return c - 'a' + 10;
    if((c >= 'A') && (c <= 'F')) return c - 'A' + 10;
    return -1;
  }

  static char const * ParseHex4(char const * input, unsigned int& code) {
    code = 0;
    for(int n = 0; n < 4; ++n) {
      int v = HexValue(input[n]);
      if(v < 0) return NULL;
      code = (code << 4) | v;
    }
    return input + 4;
  }

  static void AppendUTF8(std::string& str, unsigned int code) {
    if(code < 0x80) {
      str += (char)code;
    } else if(code < 0x800) {
      str += (char)(0xC0 | (code >> 6));
      str += (char)(0x80 | (code & 0x3F));
    } else if(code < 0x10000) {
      str += (char)(0xE0 | (code >> 12));
      str += (char)(0x80 | ((code >> 6) & 0x3F));
      str += (char)(0x80 | (code & 0x3F));
    } else {
      str += (char)(0xF0 | (code >> 18));
      str += (char)(0x80 | ((code >> 12) & 0x3F));
      str += (char)(0x80 | ((code >> 6) & 0x3F));
      str += (char)(0x80 | (code & 0x3F));
    }
  }

  // Input points just after opening quote. Returns pointer after closing quote.
  char const * JSON::ParseString(std::string& str, char const * input) {
    str.clear();
    while(*input) {
      char c = *input;
      if(c == '"') return input + 1;
      if(static_cast<unsigned char>(c) < 0x20) return NULL;
      if(c != '\\') {
        str += c;
        ++input;
        continue;
      }
      ++input;
      switch(*input) {
        case '"': str += '"'; break;
        case '\\': str += '\\'; break;
        case '/': str += '/'; break;
        case 'b': str += '\b'; break;
        case 'f': str += '\f'; break;
        case 'n': str += '\n'; break;
        case 'r': str += '\r'; break;
        case 't': str += '\t'; break;
        case 'u': {
          unsigned int code = 0;
          input = ParseHex4(input + 1, code);
          if(!input) return NULL;
          if((code >= 0xD800) && (code <= 0xDBFF)) {
            // surrogate pair
            unsigned int low = 0;
            if((input[0] != '\\') || (input[1] != 'u')) return NULL;
            input = ParseHex4(input + 2, low);
            if(!input) return NULL;
            if((low < 0xDC00) || (low > 0xDFFF)) return NULL;
            code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
          } else if((code >= 0xDC00) && (code <= 0xDFFF)) {
            return NULL;
          }
          AppendUTF8(str, code);
          continue;
        }
        default:
          return NULL;
      }
      ++input;
    }
    return NULL;
  }

  static char const * ParseLiteral(std::string& str, char const * input) {
    static char const * const literals[] = { "true", "false", "null", NULL };
    for(int n = 0; literals[n]; ++n) {
      size_t l = std::strlen(literals[n]);
      if(std::strncmp(input, literals[n], l) == 0) {
        if(std::isalnum(static_cast<unsigned char>(input[l]))) return NULL;
        str.assign(input, l);
        return input + l;
      }
    }
    return NULL;
  }

  static char const * ParseNumber(std::string& str, char const * input) {
    char const * start = input;
    if(*input == '-') ++input;
    if(!std::isdigit(static_cast<unsigned char>(*input))) return NULL;
    if(*input == '0') {
      ++input;
    } else {
      while(std::isdigit(static_cast<unsigned char>(*input))) ++input;
    }
    if(*input == '.') {
      ++input;
      if(!std::isdigit(static_cast<unsigned char>(*input))) return NULL;
      while(std::isdigit(static_cast<unsigned char>(*input))) ++input;
    }
    if((*input == 'e') || (*input == 'E')) {
      ++input;
      if((*input == '+') || (*input == '-')) ++input;
      if(!std::isdigit(static_cast<unsigned char>(*input))) return NULL;
      while(std::isdigit(static_cast<unsigned char>(*input))) ++input;
    }
    str.assign(start, input - start);
    return input;
  }

  char const * JSON::ParseInternal(Aeat::XMLNode& xml, char const * input, int depth) {
    if(depth > MaxDepth) return NULL;
    input = SkipWS(input);
    if(!*input) return NULL;
    if(*input == '{') {
      // complex item
      ++input;
      input = SkipWS(input);
      if(*input == '}') return input + 1;
      while(true) {
        if(*input != '"') return NULL;
        std::string name;
        input = ParseString(name, input + 1);
        if(!input) return NULL;
        input = SkipWS(input);
        if(*input != ':') return NULL;
        XMLNode item = xml.NewChild(name);
        input = ParseInternal(item, input + 1, depth + 1);
        if(!input) return NULL;
        input = SkipWS(input);
        if(*input == ',') {
          // next element
          input = SkipWS(input + 1);
        } else if(*input == '}') {
          // last element
          break;
        } else {
          return NULL;
        };
      };
      ++input;
    } else if(*input == '[') {
      // array - items are stored in siblings of same name
      ++input;
      input = SkipWS(input);
      if(*input == ']') {
        xml.Destroy();
        return input + 1;
      }
      XMLNode parent = xml.Parent();
      if(!parent) return NULL;
      std::string name = xml.FullName();
      XMLNode item = xml;
      while(true) {
        input = ParseInternal(item, input, depth + 1);
        if(!input) return NULL;
        input = SkipWS(input);
        if(*input == ',') {
          // next element
          ++input;
          item = parent.NewChild(name);
        } else if(*input == ']') {
          // last element
          break;
        } else {
          return NULL;
        };
      };
      ++input;
    } else if(*input == '"') {
      std::string str;
      input = ParseString(str, input + 1);
      if(!input) return NULL;
      xml = str;
    } else if((*input == '-') || std::isdigit(static_cast<unsigned char>(*input))) {
      std::string str;
      input = ParseNumber(str, input);
      if(!input) return NULL;
      xml = str;
    } else {
      // true, false, null
      std::string str;
      input = ParseLiteral(str, input);
      if(!input) return NULL;
      xml = str;
    };
    return input;
  }

  bool JSON::Parse(Aeat::XMLNode& xml, char const * input) {
    if(!input) return false;
    input = ParseInternal(xml, input, 0);
    if(input == NULL)
      return false;
    // Only whitespace may follow document
    return (*SkipWS(input) == 0);
  }

} // namespace Aeat
