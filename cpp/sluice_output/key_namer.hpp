// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_KEY_NAMER_HPP
#define SLUICE_KEY_NAMER_HPP

#include <string>

#include "output_config.hpp"

namespace sluice {
namespace output {

/**
 * Derives object keys for uploaded chunks.
 *
 *   key = path_prefix + sprintf(sequence_format, task_index, file_index) + file_ext
 *
 * The key for a given (task_index, file_index) pair never changes, which is
 * what makes re-uploading a chunk on resume overwrite instead of duplicate.
 *
 * Example: path_prefix "logs/out", sequence_format ".%03d.%02d", file_ext
 * ".csv", task 2, file 5 -> "logs/out.002.05.csv"
 */
class KeyNamer {
public:
  /**
   * @throws ConfigurationError if sequence_format is not a valid two-integer template
   */
  KeyNamer(std::string path_prefix, std::string sequence_format, std::string file_ext);

  explicit KeyNamer(const OutputConfig& config);

  std::string buildKey(int task_index, int file_index) const;

  /**
   * Check that a sequence format formats exactly two int arguments.
   *
   * Accepted conversions are d, i, u, o, x and X with optional flags
   * ("-+ #0"), width and precision. "%%" is a literal percent sign. Length
   * modifiers, '*' widths and positional arguments are rejected.
   *
   * @throws ConfigurationError describing the first problem found
   */
  static void validateSequenceFormat(const std::string& sequence_format);

  const std::string& pathPrefix() const {
    return path_prefix_;
  }

  const std::string& sequenceFormat() const {
    return sequence_format_;
  }

  const std::string& fileExtension() const {
    return file_ext_;
  }

private:
  std::string path_prefix_;
  std::string sequence_format_;
  std::string file_ext_;
};

}  // namespace output
}  // namespace sluice

#endif  // SLUICE_KEY_NAMER_HPP
