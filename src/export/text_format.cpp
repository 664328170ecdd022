#include "export/text_format.hpp"

#include <cctype>
#include <iomanip>
#include <locale>
#include <sstream>

namespace routeopt {

std::string XmlEscape(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
      case '&':  out += "&amp;"; break;
      case '<':  out += "&lt;"; break;
      case '>':  out += "&gt;"; break;
      case '"':  out += "&quot;"; break;
      case '\'': out += "&apos;"; break;
      default:   out.push_back(c); break;
    }
  }
  return out;
}

std::string CsvField(const std::string& s) {
  if (s.find_first_of(",\"\r\n") == std::string::npos) return s;
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out.push_back(c);
  }
  out += "\"";
  return out;
}

std::string FormatPhone(const std::string& raw) {
  if (raw.empty()) return "N/A";
  std::string digits;
  for (unsigned char c : raw) {
    if (std::isdigit(c)) digits.push_back(static_cast<char>(c));
  }
  if (digits.size() == 11 && digits[0] == '1') digits.erase(0, 1); // US country code
  if (digits.size() < 10) return raw;
  return "(" + digits.substr(0, 3) + ") " + digits.substr(3, 3) + "-" + digits.substr(6, 4);
}

std::string FormatFixed(double v, int decimals) {
  std::ostringstream oss;
  oss.imbue(std::locale::classic());
  oss << std::fixed << std::setprecision(decimals) << v;
  return oss.str();
}

} // namespace routeopt
