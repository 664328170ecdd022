#pragma once
#include <string>

namespace routeopt {

// Escapes & < > " ' for XML text and attribute values.
std::string XmlEscape(const std::string& s);

// RFC 4180 field: quoted when it contains a comma, quote or line break.
std::string CsvField(const std::string& s);

// "(612) 555-0100" when there are at least 10 digits, the input unchanged
// otherwise, "N/A" when empty.
std::string FormatPhone(const std::string& raw);

// Fixed-point, locale independent.
std::string FormatFixed(double v, int decimals);

} // namespace routeopt
