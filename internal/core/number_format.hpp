#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace prefixid::core {

/*
  NumberFormat

  printf-style rendering of counter values: exactly one %[0][width]d
  conversion with optional literal text around it ("%%" is a literal
  percent). The width is a minimum; wider values are never truncated.

    %05d:  1 -> "00001", 123456 -> "123456"
*/
class NumberFormat {
 public:
  static constexpr std::string_view kDefaultPattern = "%05d";

  NumberFormat();

  // Throws util::ConfigurationError for malformed patterns.
  static NumberFormat Parse(std::string_view pattern);

  std::string Format(int64_t value) const;

  // "<prefix>-<Format(value)>"
  std::string Render(std::string_view prefix, int64_t value) const;

  const std::string& Pattern() const {
    return pattern_;
  }

 private:
  std::string pattern_;
  std::string leading_text_;
  std::string trailing_text_;
  bool        zero_pad_ = true;
  uint32_t    width_    = 5;
};

} // namespace prefixid::core
