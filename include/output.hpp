#pragma once

#include "type_lattice.hpp"
#include <string>
#include <string_view>
#include <vector>

std::string json_escape(std::string_view s);

// Header name to a bare SQL identifier: [0-9A-Za-z_], not starting with a
// digit, never empty.
std::string normalize_identifier(std::string_view name);

// {"columns":[...],"types":[...]} on one line.
void render_schema_json(const std::vector<ColumnSchema> &schema);

void render_create_table(const std::vector<ColumnSchema> &schema,
                         std::string_view table);
