#pragma once

#include <string>
#include <string_view>

namespace peppol_lookup {

// Percent-encode a string per RFC 3986.
// Unreserved characters (alphanumeric, '-', '_', '.', '~') pass through;
// everything else, ':' included, becomes %XX (uppercase hex).
std::string UrlEncode(std::string_view value);

// Reverse of UrlEncode. Accepts upper- and lowercase hex digits. A '%' not
// followed by two hex digits is copied through unchanged; '+' is left as-is
// because SMP hrefs are path components, not form data.
std::string UrlDecode(std::string_view value);

} // namespace peppol_lookup
