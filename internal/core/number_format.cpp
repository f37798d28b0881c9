#include "internal/core/number_format.hpp"

#include <spdlog/fmt/fmt.h>

#include "internal/util/errors.hpp"

namespace prefixid::core {

namespace {

constexpr uint32_t kMaxWidth = 64;

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

[[noreturn]] void Reject(std::string_view pattern, const std::string& reason) {
  throw util::ConfigurationError("number format '" + std::string(pattern) + "': " + reason);
}

} // namespace

NumberFormat::NumberFormat() : pattern_(kDefaultPattern) {
}

NumberFormat NumberFormat::Parse(std::string_view pattern) {
  NumberFormat format;
  format.pattern_ = std::string(pattern);
  format.zero_pad_ = false;
  format.width_    = 0;

  bool        seen_conversion = false;
  std::string literal;

  for (size_t i = 0; i < pattern.size(); ++i) {
    const char c = pattern[i];
    if (c != '%') {
      literal.push_back(c);
      continue;
    }

    if (i + 1 < pattern.size() && pattern[i + 1] == '%') {
      literal.push_back('%');
      ++i;
      continue;
    }

    if (seen_conversion) {
      Reject(pattern, "more than one conversion");
    }

    size_t pos = i + 1;
    if (pos < pattern.size() && pattern[pos] == '0') {
      format.zero_pad_ = true;
      ++pos;
    }

    uint32_t width = 0;
    while (pos < pattern.size() && IsDigit(pattern[pos])) {
      width = width * 10 + static_cast<uint32_t>(pattern[pos] - '0');
      if (width > kMaxWidth) {
        Reject(pattern, "width exceeds " + std::to_string(kMaxWidth));
      }
      ++pos;
    }

    if (pos >= pattern.size() || pattern[pos] != 'd') {
      Reject(pattern, "only %[0][width]d conversions are supported");
    }

    format.width_         = width;
    format.leading_text_  = literal;
    seen_conversion       = true;
    literal.clear();
    i = pos;
  }

  if (!seen_conversion) {
    Reject(pattern, "missing %d conversion");
  }
  format.trailing_text_ = literal;
  return format;
}

std::string NumberFormat::Format(int64_t value) const {
  std::string digits;
  if (width_ == 0) {
    digits = fmt::format("{}", value);
  } else if (zero_pad_) {
    digits = fmt::format("{:0{}}", value, width_);
  } else {
    digits = fmt::format("{:>{}}", value, width_);
  }
  return leading_text_ + digits + trailing_text_;
}

std::string NumberFormat::Render(std::string_view prefix, int64_t value) const {
  std::string out(prefix);
  out += '-';
  out += Format(value);
  return out;
}

} // namespace prefixid::core
