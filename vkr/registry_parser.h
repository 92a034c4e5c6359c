#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "vkr/registry.h"

namespace vkr {

struct ParseOptions {
  // Elements whose api attribute does not list this API are ignored.
  std::string api = "vulkan";
  // When set, the document's VK_HEADER_VERSION must match.
  std::optional<uint32_t> expected_header_version;
};

// Both throw vbg::malformed_registry on schema violations.
Registry parse_registry_file(const std::filesystem::path& path,
                             const ParseOptions& options);

Registry parse_registry_string(const std::string& xml,
                               const std::string& source,
                               const ParseOptions& options);

// Parses a C integer literal as found in enum values: decimal, hex,
// negative, U/UL/ULL suffixes, optionally parenthesized.
std::optional<int64_t> parse_c_integer(const std::string& text);

}  // namespace vkr
