#include "PdfRenamerLogic.h"

#include <cctype>
#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <system_error>

namespace fs = std::filesystem;

namespace // Anonymous namespace for internal linkage helper functions
{
// Characters rejected by common filesystems; removed, not substituted
constexpr std::string_view kIllegalChars = R"(\/:*?"<>|)";

std::string strip_chars(const std::string &s, std::string_view chars) {
  const std::size_t first = s.find_first_not_of(chars);
  if (first == std::string::npos) {
    return std::string();
  }
  const std::size_t last = s.find_last_not_of(chars);
  return s.substr(first, last - first + 1);
}

std::string rstrip_whitespace(std::string s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
    s.pop_back();
  }
  return s;
}

std::string candidate_name(const std::string &baseName, int counter) {
  if (counter == 0) {
    return baseName + PdfRenamerLogic::PdfExtension;
  }
  return baseName + " (" + std::to_string(counter) + ")" +
         PdfRenamerLogic::PdfExtension;
}
} // namespace

// Turns a raw title into a base filename (no extension). Never returns an empty
// string; falls back to DefaultTitle.
std::string PdfRenamerLogic::SanitizeFilename(const std::string &rawTitle,
                                              int maxLength) {
  if (rawTitle.empty()) {
    return DefaultTitle;
  }

  std::string sanitized;
  sanitized.reserve(rawTitle.size());
  for (char c : rawTitle) {
    if (kIllegalChars.find(c) == std::string_view::npos) {
      sanitized.push_back(c);
    }
  }

  sanitized = strip_chars(sanitized, " .");

  const std::size_t limit =
      static_cast<std::size_t>(maxLength < 1 ? 1 : maxLength);
  if (Utf8Length(sanitized) > limit) {
    sanitized = rstrip_whitespace(TruncateUtf8(sanitized, limit));
  }

  return sanitized.empty() ? DefaultTitle : sanitized;
}

// Picks "<base>.pdf", then "<base> (1).pdf", "<base> (2).pdf", ... and returns
// the first name that neither exists in 'targetDir' nor was handed out earlier
// in this run. 'selfPath' (the file being renamed in place) is not treated as
// an obstacle.
std::string PdfRenamerLogic::ResolveOutputName(
    const std::string &baseName, const fs::path &targetDir,
    const std::set<std::string> &assignedInRun, const fs::path &selfPath) {
  const fs::path selfNormal =
      selfPath.empty() ? fs::path() : selfPath.lexically_normal();

  for (int counter = 0;; ++counter) {
    std::string name = candidate_name(baseName, counter);
    if (assignedInRun.count(name) != 0) {
      continue;
    }

    const fs::path candidate = targetDir / fs::u8path(name);
    if (!selfNormal.empty() && candidate.lexically_normal() == selfNormal) {
      return name;
    }

    std::error_code ec;
    const bool exists = fs::exists(candidate, ec);
    // A slot that cannot be checked is returned as-is; the move/copy step
    // re-checks the target and reports the error for this file
    if (!exists || ec) {
      return name;
    }
  }
}
