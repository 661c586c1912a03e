// refiner/basic/js_format.cpp - JavaScript-compatible number and string text
//
#include "refiner/basic/js_format.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <string>

namespace refiner
{

namespace
{

/// Shortest round-trip decimal digits and the exponent n such that
/// value == 0.<digits> * 10^n.
struct DecimalDigits
{
  std::string digits;
  int point = 0;
};

DecimalDigits shortest_digits(double positive)
{
  std::array<char, 64> buf{};
  const auto res =
    std::to_chars(buf.data(), buf.data() + buf.size(), positive, std::chars_format::scientific);
  const std::string_view text(buf.data(), static_cast<size_t>(res.ptr - buf.data()));

  // Layout: d[.ddd]e[+-]XX
  const size_t e_pos = text.find('e');
  DecimalDigits out;
  for (size_t i = 0; i < e_pos; ++i) {
    if (text[i] != '.') out.digits.push_back(text[i]);
  }
  while (out.digits.size() > 1 && out.digits.back() == '0') {
    out.digits.pop_back();
  }

  int exponent = 0;
  const char * exp_begin = text.data() + e_pos + 1;
  if (*exp_begin == '+') ++exp_begin;
  std::from_chars(exp_begin, text.data() + text.size(), exponent);
  out.point = exponent + 1;
  return out;
}

}  // namespace

std::string format_js_number(double value)
{
  if (std::isnan(value)) return "NaN";
  if (value == 0.0) return "0";
  if (std::isinf(value)) return value < 0 ? "-Infinity" : "Infinity";
  if (value < 0) return "-" + format_js_number(-value);

  const DecimalDigits d = shortest_digits(value);
  const int k = static_cast<int>(d.digits.size());
  const int n = d.point;

  if (k <= n && n <= 21) {
    return d.digits + std::string(static_cast<size_t>(n - k), '0');
  }
  if (0 < n && n <= 21) {
    return d.digits.substr(0, static_cast<size_t>(n)) + "." +
           d.digits.substr(static_cast<size_t>(n));
  }
  if (-6 < n && n <= 0) {
    return "0." + std::string(static_cast<size_t>(-n), '0') + d.digits;
  }

  const int e = n - 1;
  std::string out = d.digits.substr(0, 1);
  if (k > 1) {
    out += ".";
    out += d.digits.substr(1);
  }
  out += e < 0 ? "e-" : "e+";
  out += std::to_string(std::abs(e));
  return out;
}

std::string quote_js_string(std::string_view text)
{
  std::string out = "\"";
  size_t run_begin = 0;

  // Valid stretches go through the JSON escaper without their quotes
  auto flush = [&](size_t end) {
    if (end == run_begin) return;
    const std::string quoted =
      nlohmann::json(std::string(text.substr(run_begin, end - run_begin)))
        .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    out.append(quoted, 1, quoted.size() - 2);
  };

  for (size_t i = 0; i + 2 < text.size();) {
    const auto b0 = static_cast<unsigned char>(text[i]);
    const auto b1 = static_cast<unsigned char>(text[i + 1]);
    const auto b2 = static_cast<unsigned char>(text[i + 2]);
    // ED A0..BF xx is a lone surrogate U+D800..U+DFFF
    if (b0 == 0xED && b1 >= 0xA0 && b1 <= 0xBF && (b2 & 0xC0) == 0x80) {
      flush(i);
      const unsigned code_unit = 0xD000u | ((b1 & 0x3Fu) << 6) | (b2 & 0x3Fu);
      out += fmt::format("\\u{:04x}", code_unit);
      i += 3;
      run_begin = i;
    } else {
      ++i;
    }
  }
  flush(text.size());

  out += '"';
  return out;
}

bool is_array_index_key(std::string_view text) noexcept
{
  if (text.empty() || text.size() > 10) return false;
  if (text.size() > 1 && text.front() == '0') return false;
  uint64_t value = 0;
  for (const char c : text) {
    if (c < '0' || c > '9') return false;
    value = value * 10 + static_cast<uint64_t>(c - '0');
  }
  // 2^32 - 1 is not a valid index
  return value < 4294967295ULL;
}

}  // namespace refiner
