#include "private/csv.hpp"

#include <stdexcept>

namespace basil {
namespace detail {

std::string csv_escape(const std::string &field, char delim) {
  bool needs_quote = false;
  for (char c : field) {
    if (c == delim || c == '"' || c == '\n' || c == '\r') {
      needs_quote = true;
      break;
    }
  }
  if (!needs_quote) {
    return field;
  }
  std::string out = "\"";
  for (char c : field) {
    if (c == '"') {
      out += "\"\"";
    } else {
      out += c;
    }
  }
  out += "\"";
  return out;
}

std::string csv_line(const std::vector<std::string> &fields, char delim) {
  std::string out;
  for (size_t i = 0; i < fields.size(); ++i) {
    if (i > 0) {
      out += delim;
    }
    out += csv_escape(fields[i], delim);
  }
  out += '\n';
  return out;
}

std::vector<std::vector<std::string>> parse_csv(const std::string &text,
                                                char delim) {
  std::vector<std::vector<std::string>> rows;
  std::vector<std::string> row;
  std::string field;
  bool in_quotes = false;
  bool row_has_content = false;

  for (size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field += '"';
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field += c;
      }
      continue;
    }
    if (c == '"') {
      in_quotes = true;
      row_has_content = true;
    } else if (c == delim) {
      row.push_back(field);
      field.clear();
      row_has_content = true;
    } else if (c == '\n' || c == '\r') {
      if (c == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      if (row_has_content || !field.empty()) {
        row.push_back(field);
        rows.push_back(row);
      }
      row.clear();
      field.clear();
      row_has_content = false;
    } else {
      field += c;
      row_has_content = true;
    }
  }
  if (in_quotes) {
    throw std::runtime_error("Unterminated quoted CSV field");
  }
  if (row_has_content || !field.empty()) {
    row.push_back(field);
    rows.push_back(row);
  }
  return rows;
}

} // namespace detail
} // namespace basil
