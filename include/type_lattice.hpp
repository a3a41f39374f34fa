#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

// Ordered by generality; a column only ever moves to a larger value.
enum class ColumnType { Unknown, Integer, Real, Text };

struct ColumnSchema {
  std::string name;
  ColumnType type;
};

std::string_view type_name(ColumnType t);

bool is_integer(std::string_view s);
bool is_real(std::string_view s);

// Integer, Real or Text. Never Unknown.
ColumnType classify(std::string_view value);

ColumnType join(ColumnType a, ColumnType b);

class TypeLattice {
private:
  std::vector<ColumnType> types_;

public:
  explicit TypeLattice(size_t ncols) : types_(ncols, ColumnType::Unknown) {}

  // Empty values are no evidence and leave the column unchanged.
  ColumnType observe(size_t col, std::string_view value);

  ColumnType type(size_t col) const { return types_[col]; }
  size_t column_count() const { return types_.size(); }

  // Current types with Unknown resolved to Text.
  std::vector<ColumnType> finalize() const;
};
