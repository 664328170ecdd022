#include "geocode/address_variations.hpp"

#include <algorithm>
#include <regex>
#include <sstream>
#include <utility>

namespace routeopt {

namespace {

struct Rewrite {
  std::regex pattern;
  std::string replacement;
};

Rewrite MakeRewrite(const char* abbr, const char* full, bool icase = true) {
  auto flags = std::regex::ECMAScript;
  if (icase) flags |= std::regex::icase;
  return {std::regex(std::string("\\b") + abbr + "\\b\\.?", flags), full};
}

const std::vector<Rewrite>& AbbreviationRewrites() {
  static const std::vector<Rewrite> kRewrites = [] {
    std::vector<Rewrite> v;
    // 街道类型
    v.push_back(MakeRewrite("St", "Street"));
    v.push_back(MakeRewrite("Ave", "Avenue"));
    v.push_back(MakeRewrite("Blvd", "Boulevard"));
    v.push_back(MakeRewrite("Dr", "Drive"));
    v.push_back(MakeRewrite("Ln", "Lane"));
    v.push_back(MakeRewrite("Rd", "Road"));
    v.push_back(MakeRewrite("Ct", "Court"));
    v.push_back(MakeRewrite("Pl", "Place"));
    v.push_back(MakeRewrite("Pkwy", "Parkway"));
    v.push_back(MakeRewrite("Hwy", "Highway"));
    v.push_back(MakeRewrite("Cir", "Circle"));
    v.push_back(MakeRewrite("Trl", "Trail"));
    v.push_back(MakeRewrite("Ter", "Terrace"));
    // 方位词只认大写（"Joe's" 不能变成 "Joe'South"）；两字母的先替换
    v.push_back(MakeRewrite("NE", "Northeast", false));
    v.push_back(MakeRewrite("NW", "Northwest", false));
    v.push_back(MakeRewrite("SE", "Southeast", false));
    v.push_back(MakeRewrite("SW", "Southwest", false));
    v.push_back(MakeRewrite("N", "North", false));
    v.push_back(MakeRewrite("S", "South", false));
    v.push_back(MakeRewrite("E", "East", false));
    v.push_back(MakeRewrite("W", "West", false));
    return v;
  }();
  return kRewrites;
}

std::string CollapseWhitespace(const std::string& s) {
  std::istringstream iss(s);
  std::string out;
  for (std::string tok; iss >> tok;) {
    if (!out.empty()) out.push_back(' ');
    out += tok;
  }
  return out;
}

// 去掉首尾空白和末尾逗号。
std::string TrimSeparators(std::string s) {
  s = CollapseWhitespace(s);
  while (!s.empty() && (s.back() == ',' || s.back() == ' ')) s.pop_back();
  while (!s.empty() && (s.front() == ',' || s.front() == ' ')) s.erase(s.begin());
  return s;
}

} // namespace

std::string ExpandAbbreviations(const std::string& address) {
  std::string out = address;
  for (const auto& rw : AbbreviationRewrites()) {
    out = std::regex_replace(out, rw.pattern, rw.replacement);
  }
  return CollapseWhitespace(out);
}

std::string StripUnitQualifiers(const std::string& address) {
  static const std::regex kUnit(R"(,?\s*(\b(Suite|Ste|Unit|Apt)\b\.?|#)\s*[\w-]+)", std::regex::icase);
  return TrimSeparators(std::regex_replace(address, kUnit, ""));
}

std::string DropTrailingUnitNumber(const std::string& address) {
  static const std::regex kTrailing(R"(^(\d+\s+.*\S)\s+#?\d+[A-Za-z]?$)");
  const auto comma = address.find(',');
  const std::string street = TrimSeparators(address.substr(0, comma));
  const std::string rest = (comma == std::string::npos) ? std::string() : address.substr(comma);
  const std::string stripped = std::regex_replace(street, kTrailing, "$1");
  return TrimSeparators(stripped + rest);
}

std::string StripZipCode(const std::string& address) {
  static const std::regex kZip(R"(\b\d{5}(-\d{4})?\b)");
  std::string out = std::regex_replace(address, kZip, "");
  static const std::regex kEmptyField(R"(,\s*,)");
  out = std::regex_replace(out, kEmptyField, ",");
  return TrimSeparators(out);
}

std::vector<std::string> BuildAddressVariations(const std::string& address, int max_count) {
  std::vector<std::string> out;
  const std::string base = CollapseWhitespace(address);
  if (base.empty() || max_count <= 0) return out;

  auto add = [&](std::string v) {
    if (static_cast<int>(out.size()) >= max_count) return;
    v = TrimSeparators(v);
    if (v.empty()) return;
    if (std::find(out.begin(), out.end(), v) != out.end()) return;
    out.push_back(std::move(v));
  };

  const std::string no_unit = StripUnitQualifiers(base);

  add(base);
  add(no_unit);
  add(ExpandAbbreviations(base));
  add(ExpandAbbreviations(no_unit));
  add(DropTrailingUnitNumber(no_unit));
  add(base + ", USA");
  add(no_unit + ", USA");
  add(StripZipCode(no_unit));
  return out;
}

} // namespace routeopt
