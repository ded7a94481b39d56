// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_OUTPUT_IMPL_HPP
#define SLUICE_OUTPUT_IMPL_HPP

#include <filesystem>

#include "output_interfaces.hpp"

namespace sluice {
namespace output {

/**
 * Default implementation of IFileSystem using std::filesystem
 */
class FileSystemImpl : public IFileSystem {
public:
  bool exists(const std::string& path) const override {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
  }

  uint64_t file_size(const std::string& path) const override {
    return static_cast<uint64_t>(std::filesystem::file_size(path));
  }

  bool remove(const std::string& path) const override {
    std::error_code ec;
    return std::filesystem::remove(path, ec);
  }
};

}  // namespace output
}  // namespace sluice

#endif  // SLUICE_OUTPUT_IMPL_HPP
