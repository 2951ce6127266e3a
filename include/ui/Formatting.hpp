#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace hostscope::ui {

// UTF-8 text width utilities (ANSI escapes occupy no columns)
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);

// Text formatting and alignment
std::string trunc_pad(const std::string& s, int w);
std::string rpad_trunc(const std::string& s, int w);
std::string lr_align(int iw, const std::string& left, const std::string& right);

// Decimal units: "1 Byte", "532 Bytes", "1.5 kB", "8.0 GB"
std::string human_bytes(uint64_t bytes);

// One decimal with a percent sign: "42.0%"
std::string format_percent(double pct);

// "2.40 GHz" from MHz, or "1800 MHz" below 1 GHz
std::string format_mhz(double mhz);

// Local wall clock: "2024-05-01 13:45:09"
std::string format_datetime(std::chrono::system_clock::time_point tp);

// Text bar: [#####.....] with width cells inside the brackets
std::string usage_bar(double pct, int width);

} // namespace hostscope::ui
