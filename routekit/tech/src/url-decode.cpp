#include "routekit/url-decode.hpp"

#include <cstddef>
#include <string>
#include <string_view>

#include "routekit/char-hexadecimal-converter.hpp"

namespace routekit::url {

char* DecodeInPlace(char* first, const char* last, char plusAs, bool strictInvalid) {
  char* out = first;
  for (; first < last; ++first) {
    char ch = *first;
    switch (ch) {
      case '+':
        *out++ = plusAs;
        break;
      case '%': {
        if (first + 2 >= last) {
          if (strictInvalid) {
            return nullptr;
          }
          // truncated escape, keep the remaining chars literally
          for (; first < last; ++first) {
            *out++ = *first;
          }
          return out;
        }
        char c1 = *++first;
        char c2 = *++first;
        int v1 = from_hex_digit(c1);
        int v2 = from_hex_digit(c2);
        if (v1 < 0 || v2 < 0) {
          if (strictInvalid) {
            return nullptr;
          }
          *out++ = '%';
          *out++ = c1;
          *out++ = c2;
          break;
        }
        *out++ = static_cast<char>((v1 << 4) | v2);
        break;
      }
      default:
        *out++ = ch;
        break;
    }
  }
  return out;
}

std::string DecodeComponent(std::string_view encoded, char plusAs) {
  std::string ret(encoded);
  if (encoded.find('%') == std::string_view::npos && (plusAs == '+' || encoded.find('+') == std::string_view::npos)) {
    return ret;
  }
  char* newEnd = DecodeInPlace(ret.data(), ret.data() + ret.size(), plusAs, /*strictInvalid*/ false);
  ret.resize(static_cast<std::size_t>(newEnd - ret.data()));
  return ret;
}

}  // namespace routekit::url
