#pragma once
#include <string>
#include <vector>

namespace basil {
namespace detail {

// Quote when the field contains the delimiter, a quote or a line break.
std::string csv_escape(const std::string &field, char delim = ',');

std::string csv_line(const std::vector<std::string> &fields, char delim = ',');

// RFC 4180 style: quoted fields may span lines, "" is an escaped quote.
// Throws std::runtime_error on an unterminated quoted field.
std::vector<std::vector<std::string>> parse_csv(const std::string &text,
                                                char delim = ',');

} // namespace detail
} // namespace basil
