#pragma once

#include <string>
#include <string_view>

namespace routekit::url {

// Decodes within the provided buffer, compacting percent-encoded sequences and translating '+' into plusAs.
// Returns nullptr on invalid encoding (truncated % or non-hex digits) if strictInvalid is true, leaving the buffer
// in an unspecified partially modified state. Otherwise invalid sequences are kept verbatim.
// Returns a pointer to the new logical end of the decoded sequence.
// plusAs should be ' ' only for query string components, not for paths.
char* DecodeInPlace(char* first, const char* last, char plusAs = '+', bool strictInvalid = true);

// Best effort decoding of a single component into a new string. Never fails.
[[nodiscard]] std::string DecodeComponent(std::string_view encoded, char plusAs = '+');

}  // namespace routekit::url
