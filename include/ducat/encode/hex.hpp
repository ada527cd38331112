#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <system_error>

namespace ducat::encode {

enum class hex_errc : int // NOLINT(performance-enum-size)
{
  ok = 0,
  missing_prefix,
  invalid_digit,
  length_mismatch
};

const std::error_category& hex_category() noexcept;

std::error_code make_error_code( hex_errc e );

/**
 * Formats bytes as a 0x prefixed, lower case hex string.
 */
std::string to_hex( std::span< const std::byte > bytes );

/**
 * Decodes a 0x prefixed hex string into out, which must be exactly filled.
 * Upper and lower case digits are accepted. Nothing is written on failure.
 */
std::error_code from_hex( std::string_view str, std::span< std::byte > out ) noexcept;

} // namespace ducat::encode

template<>
struct std::is_error_code_enum< ducat::encode::hex_errc >: public std::true_type
{};
