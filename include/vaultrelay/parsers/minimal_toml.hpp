// Copyright (c) 2025 Joegen Baclor
// SPDX-License-Identifier: MPL-2.0
//
// This file is part of VaultRelay, which is licensed under the Mozilla Public
// License 2.0. See the LICENSE file or <https://www.mozilla.org/MPL/2.0/> for
// details.

#pragma once

#include <cctype>
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace vaultrelay
{
namespace parsers
{
namespace toml
{

/// The subset of TOML read by VaultRelay: bare and quoted keys, dotted
/// keys, [tables], [[arrays.of.tables]], basic and literal strings,
/// integers (with '_' separators), floats, booleans, arrays, and '#'
/// comments. Dates, inline tables and multi-line strings are not supported.

class table;
class array;

using value_type = std::variant<std::monostate, std::int64_t, double, bool, std::string,
                                std::shared_ptr<table>, std::shared_ptr<array>>;

/// \brief Raised for malformed documents; carries the 1-based position.
class parse_error : public std::runtime_error
{
public:
  parse_error(const std::string &what, std::size_t line, std::size_t column)
      : std::runtime_error(what + " at line " + std::to_string(line) + ", column " +
                           std::to_string(column)),
        _line(line), _column(column)
  {
  }

  std::size_t line() const { return _line; }
  std::size_t column() const { return _column; }

private:
  std::size_t _line;
  std::size_t _column;
};

/// \brief Read-only view over one value; empty when a lookup misses.
class node
{
public:
  node() = default;
  node(value_type value) : _value(std::move(value)) {}

  explicit operator bool() const { return !std::holds_alternative<std::monostate>(_value); }

  bool is_string() const { return std::holds_alternative<std::string>(_value); }
  bool is_integer() const { return std::holds_alternative<std::int64_t>(_value); }
  bool is_floating_point() const { return std::holds_alternative<double>(_value); }
  bool is_boolean() const { return std::holds_alternative<bool>(_value); }
  bool is_array() const { return std::holds_alternative<std::shared_ptr<array>>(_value); }
  bool is_table() const { return std::holds_alternative<std::shared_ptr<table>>(_value); }
  bool is_value() const { return *this && !is_array() && !is_table(); }

  /// \brief Typed access. Integers convert to double on request; nothing
  /// else converts.
  template <typename T> std::optional<T> as() const
  {
    if constexpr (std::is_same_v<T, double>)
    {
      if (auto *d = std::get_if<double>(&_value))
        return *d;
      if (auto *i = std::get_if<std::int64_t>(&_value))
        return static_cast<double>(*i);
      return std::nullopt;
    }
    else
    {
      if (auto *v = std::get_if<T>(&_value))
        return *v;
      return std::nullopt;
    }
  }

  const array *as_array() const
  {
    auto *p = std::get_if<std::shared_ptr<array>>(&_value);
    return p ? p->get() : nullptr;
  }

  const table *as_table() const
  {
    auto *p = std::get_if<std::shared_ptr<table>>(&_value);
    return p ? p->get() : nullptr;
  }

  const value_type &raw() const { return _value; }

private:
  value_type _value;
};

class array
{
public:
  using container_type = std::vector<node>;

  void push_back(node value) { _items.push_back(std::move(value)); }

  std::size_t size() const { return _items.size(); }
  bool empty() const { return _items.empty(); }
  const node &operator[](std::size_t idx) const { return _items[idx]; }

  container_type::const_iterator begin() const { return _items.begin(); }
  container_type::const_iterator end() const { return _items.end(); }

  /// \brief Last element, which must be a table (array of tables).
  table *back_table() const
  {
    if (_items.empty())
      return nullptr;
    auto *p = std::get_if<std::shared_ptr<table>>(&_items.back().raw());
    return p ? p->get() : nullptr;
  }

private:
  container_type _items;
};

class table
{
public:
  using container_type = std::unordered_map<std::string, node>;

  bool contains(const std::string &key) const { return _entries.count(key) != 0; }
  bool empty() const { return _entries.empty(); }
  std::size_t size() const { return _entries.size(); }

  node get(const std::string &key) const
  {
    auto it = _entries.find(key);
    return it == _entries.end() ? node() : it->second;
  }

  /// \brief Resolve "a.b.c" through nested tables.
  node at_path(const std::string &dottedPath) const
  {
    const table *current = this;
    std::size_t start = 0;
    for (;;)
    {
      std::size_t dot = dottedPath.find('.', start);
      node found = current->get(dottedPath.substr(start, dot - start));
      if (dot == std::string::npos || !found)
        return found;
      current = found.as_table();
      if (!current)
        return node();
      start = dot + 1;
    }
  }

  /// \brief Insert a new key; returns false if the key already exists.
  bool insert(const std::string &key, node value)
  {
    return _entries.emplace(key, std::move(value)).second;
  }

  container_type::const_iterator begin() const { return _entries.begin(); }
  container_type::const_iterator end() const { return _entries.end(); }

private:
  container_type _entries;
};

class parser
{
public:
  explicit parser(std::string input) : _in(std::move(input)) {}

  table parse()
  {
    table root;
    table *current = &root;
    for (;;)
    {
      skipBlank();
      if (atEnd())
        break;
      if (peek() == '[')
      {
        current = parseHeader(root);
      }
      else
      {
        parseKeyValue(*current);
      }
      endOfLine();
    }
    return root;
  }

private:
  std::string _in;
  std::size_t _pos = 0;
  std::size_t _line = 1;
  std::size_t _lineStart = 0;

  bool atEnd() const { return _pos >= _in.size(); }
  char peek(std::size_t ahead = 0) const
  {
    return _pos + ahead < _in.size() ? _in[_pos + ahead] : '\0';
  }

  char next()
  {
    char c = _in[_pos++];
    if (c == '\n')
    {
      ++_line;
      _lineStart = _pos;
    }
    return c;
  }

  [[noreturn]] void fail(const std::string &what) const
  {
    throw parse_error(what, _line, _pos - _lineStart + 1);
  }

  void skipSpaces()
  {
    while (!atEnd() && (peek() == ' ' || peek() == '\t'))
      next();
  }

  void skipComment()
  {
    if (peek() == '#')
      while (!atEnd() && peek() != '\n')
        next();
  }

  /// \brief Skip whitespace, newlines and comments.
  void skipBlank()
  {
    while (!atEnd())
    {
      char c = peek();
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n')
        next();
      else if (c == '#')
        skipComment();
      else
        break;
    }
  }

  /// \brief Only spaces and an optional comment may follow a statement.
  void endOfLine()
  {
    skipSpaces();
    skipComment();
    if (peek() == '\r')
      next();
    if (!atEnd() && peek() != '\n')
      fail(std::string("unexpected character '") + peek() + "'");
  }

  static bool isBareKeyChar(char c)
  {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
  }

  std::vector<std::string> parseKeyPath()
  {
    std::vector<std::string> parts;
    for (;;)
    {
      skipSpaces();
      std::string part;
      if (peek() == '"' || peek() == '\'')
      {
        part = parseString();
      }
      else
      {
        while (!atEnd() && isBareKeyChar(peek()))
          part += next();
        if (part.empty())
          fail("expected a key");
      }
      parts.push_back(part);
      skipSpaces();
      if (peek() != '.')
        return parts;
      next();
    }
  }

  table *descend(table &from, const std::vector<std::string> &path, std::size_t count)
  {
    table *current = &from;
    for (std::size_t i = 0; i < count; ++i)
    {
      node child = current->get(path[i]);
      if (!child)
      {
        auto created = std::make_shared<table>();
        current->insert(path[i], node(created));
        current = created.get();
        continue;
      }
      if (auto *t = child.as_table())
      {
        current = const_cast<table *>(t);
      }
      else if (auto *a = child.as_array(); a && a->back_table())
      {
        current = a->back_table();
      }
      else
      {
        fail("key '" + path[i] + "' is not a table");
      }
    }
    return current;
  }

  table *parseHeader(table &root)
  {
    next();
    bool arrayOfTables = peek() == '[';
    if (arrayOfTables)
      next();
    auto path = parseKeyPath();
    if (peek() != ']')
      fail("expected ']'");
    next();
    if (arrayOfTables)
    {
      if (peek() != ']')
        fail("expected ']]'");
      next();
    }

    table *parent = descend(root, path, path.size() - 1);
    const std::string &leaf = path.back();
    node existing = parent->get(leaf);

    if (!arrayOfTables)
    {
      if (!existing)
      {
        auto created = std::make_shared<table>();
        parent->insert(leaf, node(created));
        return created.get();
      }
      if (auto *t = existing.as_table())
        return const_cast<table *>(t);
      fail("key '" + leaf + "' is already defined as a value");
    }

    if (!existing)
    {
      parent->insert(leaf, node(std::make_shared<array>()));
      existing = parent->get(leaf);
    }
    auto *items = existing.as_array();
    if (!items)
      fail("key '" + leaf + "' is not an array of tables");
    auto created = std::make_shared<table>();
    const_cast<array *>(items)->push_back(node(created));
    return created.get();
  }

  void parseKeyValue(table &into)
  {
    auto path = parseKeyPath();
    if (peek() != '=')
      fail("expected '=' after key");
    next();
    skipSpaces();
    node value = parseValue();
    table *target = descend(into, path, path.size() - 1);
    if (!target->insert(path.back(), std::move(value)))
      fail("duplicate key '" + path.back() + "'");
  }

  node parseValue()
  {
    char c = peek();
    if (c == '"' || c == '\'')
      return node(parseString());
    if (c == '[')
      return parseArray();
    if (c == 't' || c == 'f')
      return node(parseBool());
    if (c == '+' || c == '-' || std::isdigit(static_cast<unsigned char>(c)))
      return parseNumber();
    fail("invalid value");
  }

  std::string parseString()
  {
    char quote = next();
    std::string out;
    while (!atEnd() && peek() != quote)
    {
      char c = next();
      if (c == '\n')
        fail("newline in string");
      if (c != '\\' || quote == '\'')
      {
        out += c;
        continue;
      }
      if (atEnd())
        break;
      switch (char esc = next())
      {
      case 'n':
        out += '\n';
        break;
      case 't':
        out += '\t';
        break;
      case 'r':
        out += '\r';
        break;
      case '\\':
      case '"':
        out += esc;
        break;
      default:
        fail(std::string("unknown escape '\\") + esc + "'");
      }
    }
    if (atEnd())
      fail("unterminated string");
    next();
    return out;
  }

  node parseArray()
  {
    next();
    auto items = std::make_shared<array>();
    for (;;)
    {
      skipBlank();
      if (peek() == ']')
        break;
      items->push_back(parseValue());
      skipBlank();
      if (peek() == ',')
      {
        next();
        continue;
      }
      if (peek() != ']')
        fail("expected ',' or ']' in array");
    }
    next();
    return node(items);
  }

  bool parseBool()
  {
    if (_in.compare(_pos, 4, "true") == 0)
    {
      _pos += 4;
      return true;
    }
    if (_in.compare(_pos, 5, "false") == 0)
    {
      _pos += 5;
      return false;
    }
    fail("invalid boolean");
  }

  node parseNumber()
  {
    std::string digits;
    bool isFloat = false;
    if (peek() == '+' || peek() == '-')
      digits += next();
    while (!atEnd())
    {
      char c = peek();
      if (std::isdigit(static_cast<unsigned char>(c)))
      {
        digits += next();
      }
      else if (c == '_')
      {
        next();
      }
      else if (c == '.' || c == 'e' || c == 'E' ||
               ((c == '+' || c == '-') && (digits.back() == 'e' || digits.back() == 'E')))
      {
        isFloat = true;
        digits += next();
      }
      else
      {
        break;
      }
    }
    try
    {
      std::size_t used = 0;
      node result = isFloat ? node(std::stod(digits, &used))
                            : node(static_cast<std::int64_t>(std::stoll(digits, &used)));
      if (used != digits.size())
        fail("invalid number '" + digits + "'");
      return result;
    }
    catch (const std::logic_error &)
    {
      fail("invalid number '" + digits + "'");
    }
  }
};

inline table parse(const std::string &document) { return parser(document).parse(); }

/// \throws std::runtime_error if the file cannot be read, parse_error if
/// it is malformed
inline table parse_file(const std::string &path)
{
  std::ifstream in(path);
  if (!in)
    throw std::runtime_error("cannot open " + path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parse(buffer.str());
}

} // namespace toml
} // namespace parsers
} // namespace vaultrelay
