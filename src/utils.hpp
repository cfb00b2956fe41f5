#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

std::string hex_from_bytes(const std::vector<unsigned char>&);
std::optional<std::vector<unsigned char>> bytes_from_hex(const std::string& hex);
std::string sha256_hex(const std::string &data);

// "64K" -> 65536, "1G" -> 1073741824, "4096" -> 4096 (IEC, like numfmt --from=iec).
std::optional<std::uint64_t> parse_iec_size(const std::string& text);

inline std::uint64_t align_down(std::uint64_t value, std::uint64_t alignment) {
  return alignment == 0 ? value : value - (value % alignment);
}

// POSIX single-quote quoting, safe to paste into a remote shell command.
std::string shell_quote(const std::string& value);
std::string join_command(const std::vector<std::string>& argv);
// Inverse of join_command for words produced by shell_quote.
std::vector<std::string> split_command_line(const std::string& line);
