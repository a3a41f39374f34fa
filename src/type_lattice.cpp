#include "include/type_lattice.hpp"
#include <algorithm>

std::string_view type_name(ColumnType t) {
  switch (t) {
  case ColumnType::Unknown:
    return "UNKNOWN";
  case ColumnType::Integer:
    return "INTEGER";
  case ColumnType::Real:
    return "REAL";
  case ColumnType::Text:
    return "TEXT";
  }
  return "TEXT";
}

static bool is_space(char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' ||
         c == '\f';
}

static bool is_digit(char c) { return c >= '0' && c <= '9'; }

static std::string_view trim(std::string_view s) {
  while (!s.empty() && is_space(s.front()))
    s.remove_prefix(1);
  while (!s.empty() && is_space(s.back()))
    s.remove_suffix(1);
  return s;
}

bool is_integer(std::string_view s) {
  s = trim(s);
  size_t i = 0;
  if (i < s.size() && (s[i] == '-' || s[i] == '+'))
    ++i;
  if (i == s.size())
    return false;
  for (; i < s.size(); ++i) {
    if (!is_digit(s[i]))
      return false;
  }
  return true;
}

bool is_real(std::string_view s) {
  s = trim(s);
  size_t i = 0;
  if (i < s.size() && (s[i] == '-' || s[i] == '+'))
    ++i;

  bool has_digit = false;
  while (i < s.size() && is_digit(s[i])) {
    has_digit = true;
    ++i;
  }
  if (i < s.size() && s[i] == '.') {
    ++i;
    while (i < s.size() && is_digit(s[i])) {
      has_digit = true;
      ++i;
    }
  }
  if (!has_digit)
    return false;

  if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
    ++i;
    if (i < s.size() && (s[i] == '+' || s[i] == '-'))
      ++i;
    bool exp_digit = false;
    while (i < s.size() && is_digit(s[i])) {
      exp_digit = true;
      ++i;
    }
    if (!exp_digit)
      return false;
  }
  return i == s.size();
}

ColumnType classify(std::string_view value) {
  if (is_integer(value))
    return ColumnType::Integer;
  if (is_real(value))
    return ColumnType::Real;
  return ColumnType::Text;
}

ColumnType join(ColumnType a, ColumnType b) { return std::max(a, b); }

ColumnType TypeLattice::observe(size_t col, std::string_view value) {
  ColumnType &t = types_[col];
  if (value.empty() || t == ColumnType::Text)
    return t;
  t = join(t, classify(value));
  return t;
}

std::vector<ColumnType> TypeLattice::finalize() const {
  std::vector<ColumnType> out(types_);
  for (auto &t : out) {
    if (t == ColumnType::Unknown)
      t = ColumnType::Text;
  }
  return out;
}
