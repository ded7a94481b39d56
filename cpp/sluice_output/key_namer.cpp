// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "key_namer.hpp"

#include <cstdio>
#include <cstring>
#include <utility>

#include "output_errors.hpp"

namespace sluice {
namespace output {

namespace {

bool is_flag(char c) {
  return std::strchr("-+ #0", c) != nullptr;
}

bool is_digit(char c) {
  return c >= '0' && c <= '9';
}

bool is_integer_conversion(char c) {
  return std::strchr("diouxX", c) != nullptr;
}

// Only ever called with a template that passed validateSequenceFormat()
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wformat-nonliteral"
std::string format_sequence(const std::string& sequence_format, int task_index, int file_index) {
  int length = std::snprintf(nullptr, 0, sequence_format.c_str(), task_index, file_index);
  if (length < 0) {
    throw ConfigurationError(
      "Invalid sequence_format: '" + sequence_format + "' cannot be formatted"
    );
  }

  std::string sequence(static_cast<size_t>(length) + 1, '\0');
  std::snprintf(&sequence[0], sequence.size(), sequence_format.c_str(), task_index, file_index);
  sequence.resize(static_cast<size_t>(length));
  return sequence;
}
#pragma GCC diagnostic pop

}  // namespace

KeyNamer::KeyNamer(std::string path_prefix, std::string sequence_format, std::string file_ext)
    : path_prefix_(std::move(path_prefix))
    , sequence_format_(std::move(sequence_format))
    , file_ext_(std::move(file_ext)) {
  validateSequenceFormat(sequence_format_);
}

KeyNamer::KeyNamer(const OutputConfig& config)
    : KeyNamer(config.path_prefix, config.sequence_format, config.file_ext) {}

std::string KeyNamer::buildKey(int task_index, int file_index) const {
  return path_prefix_ + format_sequence(sequence_format_, task_index, file_index) + file_ext_;
}

void KeyNamer::validateSequenceFormat(const std::string& sequence_format) {
  const std::string prefix = "Invalid sequence_format '" + sequence_format + "': ";
  const size_t n = sequence_format.size();
  int conversions = 0;

  for (size_t i = 0; i < n; ++i) {
    if (sequence_format[i] != '%') {
      continue;
    }
    size_t start = i++;
    if (i < n && sequence_format[i] == '%') {
      continue;
    }

    while (i < n && is_flag(sequence_format[i])) {
      ++i;
    }
    while (i < n && is_digit(sequence_format[i])) {
      ++i;
    }
    if (i < n && sequence_format[i] == '.') {
      ++i;
      while (i < n && is_digit(sequence_format[i])) {
        ++i;
      }
    }

    if (i >= n) {
      throw ConfigurationError(prefix + "incomplete conversion at offset " + std::to_string(start));
    }
    if (!is_integer_conversion(sequence_format[i])) {
      throw ConfigurationError(
        prefix + "conversion '" + sequence_format.substr(start, i - start + 1) +
        "' does not format an integer"
      );
    }
    ++conversions;
  }

  if (conversions != 2) {
    throw ConfigurationError(
      prefix + "expected exactly 2 integer conversions (task index, file index), found " +
      std::to_string(conversions)
    );
  }

  // Prove the template by formatting the first key of the first task
  format_sequence(sequence_format, 0, 0);
}

}  // namespace output
}  // namespace sluice
