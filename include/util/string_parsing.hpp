#pragma once

/*
 String Parsing Utilities

 Purpose:
 - Safe parsing of command-line values and wire fields
 - Hex encoding for identity tokens and invitation contexts

 Key functions:
 - SafeParseInt: Parse integer with bounds checking
 - SafeParsePort: Parse port number (1-65535)
 - ParseHostPort: Split "address:port"
 - HexEncode / HexDecode: lowercase hex <-> bytes
 - SplitList: comma-separated list

 All parsers validate that the entire input is consumed and return
 std::nullopt on any error (no exceptions escape).
*/

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nearlink {
namespace util {

/**
 * Parse integer string with bounds checking
 *
 * Examples:
 *   SafeParseInt("42", 0, 100) -> 42
 *   SafeParseInt("999", 0, 100) -> std::nullopt (out of range)
 *   SafeParseInt("42x", 0, 100) -> std::nullopt (trailing chars)
 *   SafeParseInt("", 0, 100) -> std::nullopt (empty string)
 */
std::optional<int> SafeParseInt(const std::string& str, int min, int max);

/**
 * Parse port number string (1-65535)
 *
 * Examples:
 *   SafeParsePort("45454") -> 45454
 *   SafeParsePort("0") -> std::nullopt (port 0 invalid)
 */
std::optional<uint16_t> SafeParsePort(const std::string& str);

/**
 * Split "host:port" at the last colon
 *
 * Examples:
 *   ParseHostPort("239.255.42.99:45454") -> {"239.255.42.99", 45454}
 *   ParseHostPort("239.255.42.99") -> std::nullopt
 */
std::optional<std::pair<std::string, uint16_t>> ParseHostPort(const std::string& str);

/**
 * Validate hexadecimal string
 * Returns true if non-empty and all characters are hex digits [0-9a-fA-F]
 */
bool IsValidHex(const std::string& str);

// Lowercase hex encoding of a byte buffer
std::string HexEncode(const std::vector<uint8_t>& data);

/**
 * Decode hex string to bytes
 * Empty input decodes to an empty buffer; odd length or non-hex
 * characters return std::nullopt.
 */
std::optional<std::vector<uint8_t>> HexDecode(const std::string& str);

/**
 * Split on a separator, dropping empty items
 *
 * Example:
 *   SplitList("network,,session", ',') -> {"network", "session"}
 */
std::vector<std::string> SplitList(const std::string& str, char separator = ',');

} // namespace util
} // namespace nearlink
