// refiner/basic/js_format.hpp - JavaScript-compatible number and string text
//
#pragma once

#include <string>
#include <string_view>

namespace refiner
{

/**
 * Format a double exactly as ECMAScript Number::toString(10) does.
 *
 * Shortest round-trip digits; plain notation for decimal exponents in
 * [-6, 21), exponential (`1e+21`, `1.5e-7`) otherwise. `-0` formats as "0".
 */
[[nodiscard]] std::string format_js_number(double value);

/**
 * Quote a UTF-8 string as a double-quoted JSON string literal.
 *
 * The result is also a valid JavaScript string literal. Lone surrogates
 * (the bytes ED A0..BF xx a surrogate escape decodes to) are written back
 * as lowercase `\u` escapes; other invalid UTF-8 is replaced with U+FFFD.
 */
[[nodiscard]] std::string quote_js_string(std::string_view text);

/// True if `text` is an array index in canonical form ("0", "17", not "01").
[[nodiscard]] bool is_array_index_key(std::string_view text) noexcept;

}  // namespace refiner
