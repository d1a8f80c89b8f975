#pragma once
#include "horbital/Errors.hpp"
#include "qip/String.hpp" //for case insensitive
#include <algorithm>
#include <chrono>
#include <ctime>
#include <iostream>
#include <istream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace IO {

//==============================================================================
//! Removes all white space (space, tab, newline), except for those in quotes
inline std::string removeSpaces(std::string str);

//! Removes all quote marks
inline std::string removeQuoteMarks(std::string str);

//! Removes all comments from a string: '//', '#', '!' line comments, and c++
//! style block comments
inline std::string removeComments(const std::string &input);

//! Parses a string to type T by stringstream. Throws
//! horbital::InvalidOptionError if the whole string is not a valid T
template <typename T>
inline T parse_str_to_T(const std::string &value_as_str);

//! Parses entire stream into string
inline std::string file_to_string(const std::istream &file);

//! Class to determine if a class template in vector
template <typename T>
struct IsVector {
  constexpr static bool v = false;
  using t = T;
};
template <typename T>
struct IsVector<std::vector<T>> {
  constexpr static bool v = true;
  // nb: returns conatined type of vector
  using t = T;
};

//! Prints a line of 'c' characters (dflt '*'), num chars long (dflt 80) to
//! cout
inline void print_line(const char c = '*', const int num = 80) {
  std::cout << std::string(std::size_t(num), c) << '\n';
}

//! Current local date and time, "%F %T" format
inline std::string time_date() {
  const auto now =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  char buffer[30];
  std::strftime(buffer, 30, "%F %T", std::localtime(&now));
  return buffer;
}

//==============================================================================
//! Simple struct; holds key-value pair, both strings. == compares key
struct Option {
  std::string key;
  std::string value_str;

  friend bool operator==(const Option &option, std::string_view tkey) {
    return qip::ci_wc_compare(tkey, option.key);
  }
  friend bool operator==(std::string_view tkey, const Option &option) {
    return option == tkey;
  }
  friend bool operator!=(const Option &option, std::string_view tkey) {
    return !(option == tkey);
  }
  friend bool operator!=(std::string_view tkey, const Option &option) {
    return !(option == tkey);
  }
};

//==============================================================================
//! Holds list of Options, and a list of other InputBlocks. Can be initialised
//! with a list of options, with a string, or from a file (ifstream).
//! Format for input is, e.g.,:
/*!
 Orbital{
   n = 3;
   l = 2;
 }
 Slice{
   mode = real;
   range = -20, 20;
 }

 Note: comparison for block/option names is case insensitive!
*/
class InputBlock {
private:
  std::string m_name{};
  std::vector<Option> m_options{};
  std::vector<InputBlock> m_blocks{};

public:
  //! Default constructor: name will be blank
  InputBlock() = default;

  //! Construct from literal list of 'Options' (see Option struct)
  InputBlock(std::string_view name, std::initializer_list<Option> options = {})
      : m_name(name), m_options(options) {}

  //! Construct from a string with the correct Block{option=value;} format
  InputBlock(std::string_view name, const std::string &string_input)
      : m_name(name) {
    add(string_input);
  }

  //! Construct from plain text file, in Block{option=value;} format
  InputBlock(std::string_view name, const std::istream &file) : m_name(name) {
    add(file_to_string(file));
  }

  //! Add a new InputBlock (merge: will be merged with existing if names
  //! match)
  inline void add(InputBlock block, bool merge = false);
  //! Adds a new option to end of list
  inline void add(Option option);
  //! Adds options/inputBlocks by parsing a string
  inline void add(const std::string &string, bool merge = false);

  std::string_view name() const { return m_name; }

  //! Comparison of blocks compares the 'name'
  friend bool operator==(const InputBlock &block, std::string_view name) {
    return qip::ci_wc_compare(name, block.m_name);
  }
  friend bool operator==(std::string_view name, const InputBlock &block) {
    return block == name;
  }
  friend bool operator!=(const InputBlock &block, std::string_view name) {
    return !(block == name);
  }
  friend bool operator!=(std::string_view name, const InputBlock &block) {
    return !(block == name);
  }

  //! If 'key' exists in the options, returns value. Else, returns
  //! default_value. Note: If two keys with same name, will use the later
  template <typename T>
  T get(std::string_view key, T default_value) const;

  //! Returns optional value. Contains value if key exists; empty otherwise.
  //! Note: If two keys with same name, will use the later
  template <typename T = std::string>
  std::optional<T> get(std::string_view key) const;

  //! Get value from set of nested blocks. .get({block1,block2},option)
  template <typename T>
  T get(std::initializer_list<std::string> blocks, std::string_view key,
        T default_value) const;
  //! As above, but without default value
  template <typename T>
  std::optional<T> get(std::initializer_list<std::string> blocks,
                       std::string_view key) const;

  //! Returns optional InputBlock. Contains InputBlock if block of given name
  //! exists; empty otherwise.
  inline std::optional<InputBlock> getBlock(std::string_view name) const;

  //! Prints options to screen in user-friendly form. Same form as input
  //! string. By default prints to cout, but can be given any ostream
  inline void print(std::ostream &os = std::cout, int indent_depth = 0) const;

  //! Check all the options and blocks in this; if any of them are not present
  //! in 'list', then there is likely a spelling error in the input => returns
  //! false, warns user, and prints all options to screen. list is a pair:
  //! {option, description}. Blocks are listed as "Name{}".
  //! If print=true - will print all options+descriptions even if all good.
  inline bool
  check(const std::vector<std::pair<std::string, std::string>> &list,
        bool print = false) const;

  //! As above, for a nested block. A missing block is not an error
  inline bool
  check(std::initializer_list<std::string> blocks,
        const std::vector<std::pair<std::string, std::string>> &list,
        bool print = false) const;

private:
  // Allows returning std::vector: comma-separated list input
  template <typename T>
  std::optional<std::vector<T>> get_vector(std::string_view key) const;

  inline InputBlock *getBlock_ptr(std::string_view name);
  inline const InputBlock *getBlock_cptr(std::string_view name) const;

  inline void add_option(std::string_view in_string);
  inline void add_blocks_from_string(std::string_view string, bool merge);
  inline void consolidate();
};

//==============================================================================
//==============================================================================
void InputBlock::add(InputBlock block, bool merge) {
  auto existing_block = getBlock_ptr(block.m_name);
  if (merge && existing_block) {
    existing_block->m_options.insert(existing_block->m_options.end(),
                                     block.m_options.cbegin(),
                                     block.m_options.cend());
  } else {
    m_blocks.push_back(std::move(block));
  }
}

void InputBlock::add(Option option) { m_options.push_back(std::move(option)); }

void InputBlock::add(const std::string &string, bool merge) {
  add_blocks_from_string(removeQuoteMarks(removeSpaces(removeComments(string))),
                         merge);
}

//==============================================================================
template <typename T>
std::optional<T> InputBlock::get(std::string_view key) const {
  if constexpr (IsVector<T>::v) {
    return get_vector<typename IsVector<T>::t>(key);
  } else {
    // Use reverse iterators so that we find _last_ option that matches key
    // i.e., assume later options override earlier ones.
    const auto option = std::find(m_options.crbegin(), m_options.crend(), key);
    if (option == m_options.crend())
      return std::nullopt;
    if (qip::ci_compare("default", option->value_str) ||
        option->value_str.empty()) {
      // a bare flag ("line_mode;") switches a bool option on
      if constexpr (std::is_same_v<T, bool>) {
        return option->value_str.empty() ? std::optional<bool>{true} :
                                           std::nullopt;
      } else {
        return std::nullopt;
      }
    }
    if constexpr (std::is_same_v<T, bool>) {
      const auto &str = option->value_str;
      if (qip::ci_compare("true", str) || qip::ci_compare("yes", str) ||
          qip::ci_compare("y", str) || qip::ci_compare("1", str))
        return true;
      if (qip::ci_compare("false", str) || qip::ci_compare("no", str) ||
          qip::ci_compare("n", str) || qip::ci_compare("0", str))
        return false;
      throw horbital::InvalidOptionError("Option " + option->key + " = " +
                                         str + ": expected true or false");
    } else {
      return parse_str_to_T<T>(option->value_str);
    }
  }
}

// special function; allows return of std::vector (for comma-separated list
// input).
template <typename T>
std::optional<std::vector<T>>
InputBlock::get_vector(std::string_view key) const {
  const auto option = std::find(m_options.crbegin(), m_options.crend(), key);
  if (option == m_options.crend() || option->value_str.empty())
    return std::nullopt;
  std::vector<T> out;
  for (const auto &entry : qip::split(option->value_str, ',')) {
    out.push_back(parse_str_to_T<T>(entry));
  }
  return out;
}

template <typename T>
T InputBlock::get(std::string_view key, T default_value) const {
  static_assert(!std::is_same_v<T, const char *>,
                "Cannot use get with const char* - use std::string");
  return get<T>(key).value_or(default_value);
}

template <typename T>
T InputBlock::get(std::initializer_list<std::string> blocks,
                  std::string_view key, T default_value) const {
  return get<T>(blocks, key).value_or(default_value);
}

template <typename T>
std::optional<T> InputBlock::get(std::initializer_list<std::string> blocks,
                                 std::string_view key) const {
  // Find key in nested blocks
  const InputBlock *pB = this;
  for (const auto &block : blocks) {
    pB = pB->getBlock_cptr(block);
    if (pB == nullptr)
      return std::nullopt;
  }
  return pB->get<T>(key);
}

//==============================================================================
std::optional<InputBlock> InputBlock::getBlock(std::string_view name) const {
  // note: by copy!
  const auto block = std::find(m_blocks.crbegin(), m_blocks.crend(), name);
  if (block == m_blocks.crend())
    return {};
  return *block;
}

//==============================================================================
void InputBlock::print(std::ostream &os, int depth) const {

  std::string indent = "";
  for (int i = 1; i < depth; ++i)
    indent += "  ";

  // Don't print outer-most name
  if (depth != 0)
    os << indent << m_name << " { ";

  const auto multi_entry = (!m_blocks.empty() || (m_options.size() > 1));

  if (depth != 0 && multi_entry)
    os << "\n";

  for (const auto &[key, value] : m_options) {
    os << (depth != 0 && multi_entry ? indent + "  " : "");
    if (value.empty())
      os << key << ';';
    else
      os << key << " = " << value << ';';
    os << (multi_entry ? '\n' : ' ');
  }

  for (const auto &block : m_blocks)
    block.print(os, depth + 1);

  if (depth != 0 && multi_entry)
    os << indent;

  if (depth != 0)
    os << "}\n";
}

//==============================================================================
bool InputBlock::check(
    const std::vector<std::pair<std::string, std::string>> &list,
    bool print) const {
  // "allowed" means appears in list
  bool all_ok = true;
  for (const auto &option : m_options) {
    const auto is_optionQ = [&](const auto &l) {
      return qip::ci_wc_compare(option.key, l.first);
    };
    const auto bad_option =
        !std::any_of(list.cbegin(), list.cend(), is_optionQ);
    const auto help = qip::ci_compare("help", option.key);
    if (help)
      print = true;
    if (bad_option && !help) {
      all_ok = false;
      std::cout << "\nWARNING: Unclear input option in " << m_name << ": "
                << option.key << " = " << option.value_str << ";\n"
                << "Option may be ignored!\n"
                << "Check spelling (or update list of options)\n";
    }
  }

  for (const auto &block : m_blocks) {
    const auto is_blockQ = [&](const auto &b) {
      return qip::ci_wc_compare(std::string(block.name()) + "{}", b.first);
    };
    const auto bad_block = !std::any_of(list.cbegin(), list.cend(), is_blockQ);
    if (bad_block) {
      all_ok = false;
      std::cout << "\nWARNING: Unclear input block within " << m_name << ": "
                << block.name() << "{}\n"
                << "Block and containing options may be ignored!\n"
                << "Check spelling (or update list of options)\n";
    }
  }

  if (!all_ok || print) {
    std::cout << "\nAvailable " << m_name << " options/blocks are:\n"
              << m_name << "{\n";
    for (const auto &[option, description] : list) {
      std::cout << "  " << option << ";  // " << description << "\n";
    }
    std::cout << "}\n\n";
  }
  return all_ok;
}

bool InputBlock::check(
    std::initializer_list<std::string> blocks,
    const std::vector<std::pair<std::string, std::string>> &list,
    bool print) const {
  const InputBlock *pB = this;
  for (const auto &block : blocks) {
    pB = pB->getBlock_cptr(block);
    if (pB == nullptr) {
      // We are checking for blocks that shouldn't exist, not missing ones
      return true;
    }
  }
  return pB->check(list, print);
}

//==============================================================================
void InputBlock::add_blocks_from_string(std::string_view string, bool merge) {

  // Expects that string has comments and spaces removed already

  std::size_t start = 0;
  while (start < string.length()) {

    // Find the first of either next ';' or open '{'
    // This is the end of the next input option, or start of block
    auto end = std::min(string.find(';', start), string.find('{', start));
    if (end >= string.length()) {
      throw horbital::InvalidOptionError(
          "Option '" + std::string(string.substr(start)) + "' in block " +
          m_name + " is missing its ';'");
    }

    if (start == end) {
      if (string.at(end) == '{') {
        throw horbital::InvalidOptionError("Unnamed input block in " +
                                           m_name);
      }
      // empty option: ";;"
      start = end + 1;
      continue;
    }

    if (string.at(end) == ';') {
      add_option(string.substr(start, end - start));
    } else {
      // 'name' directly preceeds "{"
      const auto block_name = string.substr(start, end - start);
      start = end + 1;

      // Now, find *matching* close '}' - ensure balanced
      int depth_count = 1;
      auto next_start = start;
      while (depth_count != 0) {
        const auto next_end = std::min(string.find('{', next_start),
                                       string.find('}', next_start));
        if (next_end >= string.length()) {
          throw horbital::InvalidOptionError(
              "Unbalanced {} in input block " + std::string(block_name));
        }
        if (string.at(next_end) == '{')
          ++depth_count;
        else
          --depth_count;
        if (depth_count == 0) {
          end = next_end;
          break;
        }
        next_start = next_end + 1;
      }

      // Recursive, since blocks may contain blocks
      auto &block = m_blocks.emplace_back(block_name);
      if (end > start)
        block.add_blocks_from_string(string.substr(start, end - start), merge);
    }

    start = end + 1;
  }

  if (merge)
    consolidate();
}

//==============================================================================
void InputBlock::add_option(std::string_view in_string) {
  const auto pos = in_string.find('=');
  const auto option = in_string.substr(0, pos);
  const auto value = pos < in_string.length() ? in_string.substr(pos + 1) : "";
  m_options.push_back({std::string(option), std::string(value)});
}

//==============================================================================
InputBlock *InputBlock::getBlock_ptr(std::string_view name) {
  auto block = std::find(m_blocks.rbegin(), m_blocks.rend(), name);
  if (block == m_blocks.rend())
    return nullptr;
  return &(*block);
}

const InputBlock *InputBlock::getBlock_cptr(std::string_view name) const {
  auto block = std::find(m_blocks.crbegin(), m_blocks.crend(), name);
  if (block == m_blocks.crend())
    return nullptr;
  return &(*block);
}

//==============================================================================
void InputBlock::consolidate() {
  // Merges blocks of the same name into the first one
  for (auto i = m_blocks.size(); i-- > 0;) {
    m_blocks[i].consolidate();
    const auto first =
        std::find(m_blocks.begin(), m_blocks.begin() + long(i),
                  m_blocks[i].name());
    if (first != m_blocks.begin() + long(i)) {
      first->m_options.insert(first->m_options.end(),
                              m_blocks[i].m_options.cbegin(),
                              m_blocks[i].m_options.cend());
      m_blocks.erase(m_blocks.begin() + long(i));
    }
  }
}

//==============================================================================
//==============================================================================
inline std::string removeSpaces(std::string str) {
  bool inside = false;
  auto lambda = [&inside](unsigned char x) {
    if (x == '\"' || x == '\'')
      inside = !inside;
    return ((x == ' ' || x == '\t' || x == '\n' || x == '\r') && !inside);
  };
  str.erase(std::remove_if(str.begin(), str.end(), lambda), str.end());
  return str;
}

inline std::string removeQuoteMarks(std::string str) {
  str.erase(std::remove_if(str.begin(), str.end(),
                           [](unsigned char x) {
                             return x == '\'' || x == '\"';
                           }),
            str.end());
  return str;
}

//==============================================================================
inline std::string removeComments(const std::string &input) {
  std::string str = "";
  {
    std::string line;
    std::stringstream stream1(input);
    while (std::getline(stream1, line, '\n')) {
      auto comm1 = line.find('!'); // nb: char, NOT string literal!
      auto comm2 = line.find('#');
      auto comm3 = line.find("//"); // str literal here
      auto comm = std::min(comm1, std::min(comm2, comm3));
      str += line.substr(0, comm);
      str += '\n';
    }
  }
  // block comments
  for (auto posi = str.find("/*"); posi != std::string::npos;
       posi = str.find("/*")) {
    const auto posf = str.find("*/", posi);
    str = (posf != std::string::npos) ?
              str.substr(0, posi) + str.substr(posf + 2) :
              str.substr(0, posi);
  }
  return str;
}

//==============================================================================
template <typename T>
T inline parse_str_to_T(const std::string &value_as_str) {
  if constexpr (std::is_same_v<T, std::string>) {
    // already a string, just return value
    return value_as_str;
  } else {
    // T is not a string: convert using stringstream; whole string must parse
    T value_T{};
    std::stringstream ss(value_as_str);
    ss >> value_T;
    if (ss.fail() || !(ss >> std::ws).eof()) {
      throw horbital::InvalidOptionError("Could not parse '" + value_as_str +
                                         "' as a number");
    }
    return value_T;
  }
}

//==============================================================================
inline std::string file_to_string(const std::istream &file) {
  if (!file)
    return "";
  std::ostringstream ss;
  ss << file.rdbuf();
  return ss.str();
}

} // namespace IO
