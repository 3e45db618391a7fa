#include "private/smiles.hpp"

#include <cctype>
#include <set>
#include <sstream>

namespace basil {
namespace detail {

namespace {

enum class Token { None, Atom, Bond, Open, Close, Ring, Dot };

bool is_bond(char c) {
  return c == '-' || c == '=' || c == '#' || c == '$' || c == ':' ||
         c == '/' || c == '\\';
}

// Organic-subset atom starting at s[i]; returns its length or 0.
size_t organic_atom_length(const std::string &s, size_t i) {
  char c = s[i];
  char next = i + 1 < s.size() ? s[i + 1] : '\0';
  if (c == 'C' && next == 'l')
    return 2;
  if (c == 'B' && next == 'r')
    return 2;
  switch (c) {
  case 'B':
  case 'C':
  case 'N':
  case 'O':
  case 'P':
  case 'S':
  case 'F':
  case 'I':
  case 'b':
  case 'c':
  case 'n':
  case 'o':
  case 'p':
  case 's':
  case '*':
    return 1;
  default:
    return 0;
  }
}

std::string at(size_t pos) {
  std::ostringstream ss;
  ss << " at position " << pos;
  return ss.str();
}

} // namespace

bool parse_smiles(const std::string &smiles, std::string &error) {
  if (smiles.empty()) {
    error = "empty SMILES";
    return false;
  }

  Token last = Token::None;
  int depth = 0;
  bool atom_seen = false;
  std::set<int> open_rings;

  size_t i = 0;
  while (i < smiles.size()) {
    char c = smiles[i];

    if (c == '(') {
      if (last != Token::Atom && last != Token::Ring && last != Token::Close) {
        error = "branch without preceding atom" + at(i);
        return false;
      }
      ++depth;
      last = Token::Open;
      ++i;
    } else if (c == ')') {
      if (depth == 0) {
        error = "unbalanced ')'" + at(i);
        return false;
      }
      if (last != Token::Atom && last != Token::Ring && last != Token::Close) {
        error = "empty or dangling branch" + at(i);
        return false;
      }
      --depth;
      last = Token::Close;
      ++i;
    } else if (is_bond(c)) {
      if (last == Token::None || last == Token::Bond || last == Token::Dot) {
        error = std::string("unexpected bond '") + c + "'" + at(i);
        return false;
      }
      last = Token::Bond;
      ++i;
    } else if (c == '.') {
      if (last != Token::Atom && last != Token::Ring && last != Token::Close) {
        error = "unexpected '.'" + at(i);
        return false;
      }
      last = Token::Dot;
      ++i;
    } else if (std::isdigit(static_cast<unsigned char>(c)) || c == '%') {
      if (!atom_seen || (last != Token::Atom && last != Token::Ring &&
                         last != Token::Bond)) {
        error = "ring closure without atom" + at(i);
        return false;
      }
      int ring = 0;
      if (c == '%') {
        if (i + 2 >= smiles.size() ||
            !std::isdigit(static_cast<unsigned char>(smiles[i + 1])) ||
            !std::isdigit(static_cast<unsigned char>(smiles[i + 2]))) {
          error = "'%' must be followed by two digits" + at(i);
          return false;
        }
        ring = (smiles[i + 1] - '0') * 10 + (smiles[i + 2] - '0');
        i += 3;
      } else {
        ring = c - '0';
        ++i;
      }
      if (open_rings.count(ring)) {
        open_rings.erase(ring);
      } else {
        open_rings.insert(ring);
      }
      last = Token::Ring;
    } else if (c == '[') {
      size_t close = smiles.find(']', i);
      if (close == std::string::npos) {
        error = "unterminated bracket atom" + at(i);
        return false;
      }
      std::string inner = smiles.substr(i + 1, close - i - 1);
      bool has_symbol = false;
      for (char ch : inner) {
        if (std::isalpha(static_cast<unsigned char>(ch)) || ch == '*') {
          has_symbol = true;
          break;
        }
      }
      if (!has_symbol) {
        error = "bracket atom without element" + at(i);
        return false;
      }
      atom_seen = true;
      last = Token::Atom;
      i = close + 1;
    } else {
      size_t len = organic_atom_length(smiles, i);
      if (len == 0) {
        error = std::string("unexpected character '") + c + "'" + at(i);
        return false;
      }
      atom_seen = true;
      last = Token::Atom;
      i += len;
    }
  }

  if (depth != 0) {
    error = "unbalanced '('";
    return false;
  }
  if (!open_rings.empty()) {
    std::ostringstream ss;
    ss << "unclosed ring " << *open_rings.begin();
    error = ss.str();
    return false;
  }
  if (last == Token::Bond || last == Token::Dot || !atom_seen) {
    error = "dangling bond or missing atom at end";
    return false;
  }
  return true;
}

} // namespace detail
} // namespace basil
