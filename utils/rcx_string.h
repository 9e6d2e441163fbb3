#ifndef rcx_STRING_H
#define rcx_STRING_H

#include <stdexcept>
#include <string>
#include <vector>
#include <algorithm>
#include <iterator>
#include <cctype>
#include <cstdint>
#include <utf8cpp/utf8.h>

// Wrapper around std::string for OCR text. Content is expected to be UTF-8;
// call sanitize_utf8() on untrusted input before using the code point helpers.
class rcx_string
{
  std::string str;

  static bool is_space_code_point(uint32_t cp)
  {
    if (cp < 0x80) return std::isspace(static_cast<int>(cp)) != 0;
    // no-break, figure, thin, narrow no-break, ideographic space
    return cp == 0x00A0 || cp == 0x2007 || cp == 0x2009 || cp == 0x202F || cp == 0x3000;
  }

public:
  static constexpr size_t npos = std::string::npos;
  rcx_string() : str() {}
  rcx_string(const char* s) : str(s) {}
  rcx_string(const char* s, size_t len) : str(s, len) {}
  rcx_string(const std::string& s) : str(s) {}
  rcx_string(char c) : str(1, c) {}

  std::string& to_std() { return str; }
  const std::string& to_std_const() const { return str; }
  const char* c_str() const { return str.c_str(); }

  rcx_string operator+(const rcx_string& s) const { return str + s.str; }
  rcx_string operator+(const char* s) const { return str + s; }
  rcx_string& operator+=(const rcx_string& s) { str += s.str; return *this; }
  bool operator==(const rcx_string& s) const { return str == s.str; }
  bool operator!=(const rcx_string& s) const { return str != s.str; }
  bool operator<(const rcx_string& s) const { return str < s.str; }

  bool empty() const { return str.empty(); }
  size_t size() const { return str.size(); }
  char operator[](size_t i) const { return str[i]; }

  rcx_string substr(size_t pos, size_t len = npos) const { return str.substr(pos, len); }

  size_t find(const rcx_string& s, size_t pos = 0) const { return str.find(s.str, pos); }
  bool contains(const rcx_string& s) const { return str.find(s.str) != std::string::npos; }

  bool starts_with(const rcx_string& prefix) const
  {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix.str) == 0;
  }

  bool is_numeric() const
  {
    if (str.empty()) return false;
    size_t start = 0;
    if (str[0] == '-' || str[0] == '+') start = 1;
    if (start >= str.size()) return false;

    bool has_dot = false;
    bool has_digit = false;
    for (size_t i = start; i < str.size(); ++i) {
      if (str[i] == '.') {
        if (has_dot) return false;
        has_dot = true;
      } else if (std::isdigit(static_cast<unsigned char>(str[i]))) {
        has_digit = true;
      } else {
        return false;
      }
    }
    return has_digit;
  }

  double to_double(double def = 0) const
  {
    try
    {
      return std::stod(str);
    }
    catch (const std::invalid_argument&)
    {
      return def;
    }
    catch (const std::out_of_range&)
    {
      return def;
    }
  }

  size_t count(char ch) const
  {
    return std::count(str.begin(), str.end(), ch);
  }

  rcx_string& replace(const rcx_string& from, const rcx_string& to)
  {
    if (from.empty()) return *this;
    for (size_t pos = 0; (pos = str.find(from.str, pos)) != std::string::npos; pos += to.size())
      str.replace(pos, from.size(), to.str);
    return *this;
  }

  rcx_string remove(const rcx_string& substring) const
  {
    rcx_string result = *this;
    result.replace(substring, "");
    return result;
  }

  size_t split(const rcx_string& delim, std::vector<rcx_string>& out) const
  {
    size_t pos = 0;
    size_t last_pos = 0;
    while ((pos = str.find(delim.str, last_pos)) != std::string::npos)
    {
      out.push_back(str.substr(last_pos, pos - last_pos));
      last_pos = pos + delim.size();
    }
    out.push_back(str.substr(last_pos));
    return out.size();
  }

  std::vector<rcx_string> split(const rcx_string& delim) const
  {
    std::vector<rcx_string> out;
    split(delim, out);
    return out;
  }

  rcx_string join(const std::vector<rcx_string>& parts) const
  {
    if (parts.empty()) return rcx_string();
    rcx_string result = parts[0];
    for (size_t i = 1; i < parts.size(); ++i) {
      result += *this + parts[i];
    }
    return result;
  }

  rcx_string trim() const
  {
    size_t start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return rcx_string();
    size_t end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
  }

  // Replaces malformed byte sequences with U+FFFD.
  rcx_string sanitize_utf8() const
  {
    if (utf8::is_valid(str.begin(), str.end())) return *this;
    std::string res;
    utf8::replace_invalid(str.begin(), str.end(), std::back_inserter(res));
    return res;
  }

  // Folds ASCII letters only; multi-byte sequences are copied through, so byte
  // offsets of valid UTF-8 input are preserved.
  rcx_string to_lower() const
  {
    rcx_string res = *this;
    for (size_t i = 0; i < res.str.size(); ++i)
    {
      unsigned char c = static_cast<unsigned char>(res.str[i]);
      if (c < 0x80) res.str[i] = static_cast<char>(std::tolower(c));
    }
    return res;
  }

  // Collapses runs of ASCII and Unicode spaces into one ASCII space and trims.
  rcx_string normalize_whitespace() const
  {
    std::string valid = sanitize_utf8().str;
    std::string result;
    result.reserve(valid.size());
    bool in_whitespace = false;

    auto it = valid.begin();
    while (it != valid.end()) {
      auto start = it;
      uint32_t cp = utf8::next(it, valid.end());
      if (is_space_code_point(cp)) {
        if (!in_whitespace) {
          result += ' ';
          in_whitespace = true;
        }
      } else {
        result.append(start, it);
        in_whitespace = false;
      }
    }

    return rcx_string(result).trim();
  }

  // Drops every ASCII or Unicode space code point.
  rcx_string remove_whitespace() const
  {
    std::string valid = sanitize_utf8().str;
    std::string result;
    auto it = valid.begin();
    while (it != valid.end()) {
      auto start = it;
      uint32_t cp = utf8::next(it, valid.end());
      if (!is_space_code_point(cp)) result.append(start, it);
    }
    return result;
  }
};

inline rcx_string operator+(const char* lhs, const rcx_string& rhs) {
    return rcx_string(lhs) + rhs;
}

#endif // rcx_STRING_H
