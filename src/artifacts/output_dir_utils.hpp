#ifndef HOPMAP_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_
#define HOPMAP_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_

#include <cctype>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace hopmap::artifacts {

// Centralized output-dir creation guard used by report writers.
// Shared error text keeps CLI and tests consistent across export types.
inline bool EnsureOutputDir(const std::filesystem::path& output_dir, std::string& error) {
  if (output_dir.empty()) {
    error = "output directory cannot be empty";
    return false;
  }

  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  if (ec) {
    error = "failed to create output directory '" + output_dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

// Targets become part of export file names; anything outside [A-Za-z0-9._-]
// is replaced so a target like `a/b` cannot escape the output directory.
inline std::string SanitizeFileComponent(std::string_view raw) {
  std::string sanitized;
  sanitized.reserve(raw.size());
  for (const char c : raw) {
    const bool keep = std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '.' || c == '-' ||
                      c == '_';
    sanitized.push_back(keep ? c : '_');
  }
  if (sanitized.empty() || sanitized == "." || sanitized == "..") {
    sanitized = "_" + sanitized;
  }
  return sanitized;
}

} // namespace hopmap::artifacts

#endif // HOPMAP_ARTIFACTS_OUTPUT_DIR_UTILS_HPP_
