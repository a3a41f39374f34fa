#include "include/output.hpp"
#include <cstdio>
#include <iostream>

std::string json_escape(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (char c : s) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        char hex[7];
        std::snprintf(hex, sizeof(hex), "\\u%04x",
                      static_cast<unsigned>(static_cast<unsigned char>(c)));
        out += hex;
      } else {
        out += c;
      }
    }
  }
  return out;
}

static bool is_ident_char(char c) {
  return (c >= '0' && c <= '9') || (c >= 'A' && c <= 'Z') ||
         (c >= 'a' && c <= 'z') || c == '_';
}

std::string normalize_identifier(std::string_view name) {
  while (!name.empty() && (name.front() == ' ' || name.front() == '\t'))
    name.remove_prefix(1);
  while (!name.empty() && (name.back() == ' ' || name.back() == '\t'))
    name.remove_suffix(1);

  std::string out;
  out.reserve(name.size() + 1);
  for (char c : name) {
    if (c == ' ')
      out += '_';
    else if (is_ident_char(c))
      out += c;
  }
  if (out.empty() || (out[0] >= '0' && out[0] <= '9'))
    out.insert(out.begin(), '_');
  return out;
}

void render_schema_json(const std::vector<ColumnSchema> &schema) {
  std::cout << "{\"columns\":[";
  for (size_t i = 0; i < schema.size(); ++i) {
    if (i)
      std::cout << ",";
    std::cout << "\"" << json_escape(schema[i].name) << "\"";
  }
  std::cout << "],\"types\":[";
  for (size_t i = 0; i < schema.size(); ++i) {
    if (i)
      std::cout << ",";
    std::cout << "\"" << type_name(schema[i].type) << "\"";
  }
  std::cout << "]}\n";
}

void render_create_table(const std::vector<ColumnSchema> &schema,
                         std::string_view table) {
  std::cout << "CREATE TABLE IF NOT EXISTS \"" << normalize_identifier(table)
            << "\" (";
  for (size_t i = 0; i < schema.size(); ++i) {
    if (i)
      std::cout << ", ";
    std::cout << "\"" << normalize_identifier(schema[i].name) << "\" "
              << type_name(schema[i].type);
  }
  std::cout << ");\n";
}
