#pragma once
#include <string>
#include <vector>

namespace routeopt {

// Expands street-type (St, Ave, Blvd...) and compass (N, SW...) abbreviations
// and collapses whitespace.
std::string ExpandAbbreviations(const std::string& address);

// Removes "Suite 200", "Apt 4B", "Unit 7", "# 12" style qualifiers.
std::string StripUnitQualifiers(const std::string& address);

// "123 Main St 4B, City" -> "123 Main St, City". Only the street segment
// (text before the first comma) is touched.
std::string DropTrailingUnitNumber(const std::string& address);

// Removes 5 or 5+4 digit ZIP codes and dangling separators.
std::string StripZipCode(const std::string& address);

// Query strings to try, in priority order. Element 0 is the trimmed address
// itself; the list has no duplicates or empty entries and at most
// max_count elements.
std::vector<std::string> BuildAddressVariations(const std::string& address, int max_count);

} // namespace routeopt
