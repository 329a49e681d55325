#include "PdfRenamerLogic.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

// Case-insensitive string comparison
bool PdfRenamerLogic::iequals(const std::string &a, const std::string &b) {
  if (a.length() != b.length()) {
    return false;
  }
  return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                    [](char char_a, char char_b) {
                      return std::tolower(static_cast<unsigned char>(char_a)) ==
                             std::tolower(static_cast<unsigned char>(char_b));
                    });
}

// Converts string to lowercase
std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

namespace {
// UTF-8 encodings of U+0085, U+00A0, U+1680, U+2000-U+200A, U+2028, U+2029,
// U+202F, U+205F, U+3000 and U+FEFF
const char *const kUnicodeSpaces[] = {
    "\xC2\x85",     "\xC2\xA0",     "\xE1\x9A\x80", "\xE2\x80\x80",
    "\xE2\x80\x81", "\xE2\x80\x82", "\xE2\x80\x83", "\xE2\x80\x84",
    "\xE2\x80\x85", "\xE2\x80\x86", "\xE2\x80\x87", "\xE2\x80\x88",
    "\xE2\x80\x89", "\xE2\x80\x8A", "\xE2\x80\xA8", "\xE2\x80\xA9",
    "\xE2\x80\xAF", "\xE2\x81\x9F", "\xE3\x80\x80", "\xEF\xBB\xBF"};

bool is_ascii_space(unsigned char c) {
  // isspace plus the information separators \x1C-\x1F
  return std::isspace(c) || (c >= 0x1C && c <= 0x1F);
}

// Byte length of the space starting at 'pos', 0 when there is none
std::size_t space_at(const std::string &s, std::size_t pos) {
  if (is_ascii_space(static_cast<unsigned char>(s[pos]))) {
    return 1;
  }
  for (const char *space : kUnicodeSpaces) {
    const std::size_t len = std::char_traits<char>::length(space);
    if (s.compare(pos, len, space) == 0) {
      return len;
    }
  }
  return 0;
}

// Byte length of the space ending just before 'end', 0 when there is none
std::size_t space_before(const std::string &s, std::size_t end) {
  if (is_ascii_space(static_cast<unsigned char>(s[end - 1]))) {
    return 1;
  }
  for (const char *space : kUnicodeSpaces) {
    const std::size_t len = std::char_traits<char>::length(space);
    if (len <= end && s.compare(end - len, len, space) == 0) {
      return len;
    }
  }
  return 0;
}
} // namespace

// Strips leading and trailing whitespace, including non-breaking and other
// Unicode spaces
std::string PdfRenamerLogic::Trim(const std::string &s) {
  size_t start = 0;
  while (start < s.size()) {
    const std::size_t len = space_at(s, start);
    if (len == 0)
      break;
    start += len;
  }
  size_t end = s.size();
  while (end > start) {
    const std::size_t len = space_before(s, end);
    if (len == 0 || end - len < start)
      break;
    end -= len;
  }
  return s.substr(start, end - start);
}

// Splits on '\n'. A trailing newline does not produce an extra empty line.
std::vector<std::string> PdfRenamerLogic::SplitLines(const std::string &text) {
  std::vector<std::string> lines;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t next = text.find('\n', pos);
    if (next == std::string::npos) {
      lines.push_back(text.substr(pos));
      break;
    }
    lines.push_back(text.substr(pos, next - pos));
    pos = next + 1;
  }
  return lines;
}

namespace {
inline bool is_utf8_continuation(unsigned char c) noexcept {
  return (c & 0xC0) == 0x80;
}
} // namespace

// Number of code points in a UTF-8 string (continuation bytes not counted)
std::size_t PdfRenamerLogic::Utf8Length(const std::string &s) {
  return static_cast<std::size_t>(
      std::count_if(s.begin(), s.end(), [](char c) {
        return !is_utf8_continuation(static_cast<unsigned char>(c));
      }));
}

// Keeps the first 'maxCodePoints' code points without splitting a multi-byte
// sequence
std::string PdfRenamerLogic::TruncateUtf8(const std::string &s,
                                          std::size_t maxCodePoints) {
  std::size_t seen = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (!is_utf8_continuation(static_cast<unsigned char>(s[i]))) {
      if (seen == maxCodePoints) {
        return s.substr(0, i);
      }
      ++seen;
    }
  }
  return s;
}

bool PdfRenamerLogic::HasPdfExtension(const fs::path &path) {
  return ToLower(path.extension().u8string()) == PdfExtension;
}

// Immediate regular files of 'directory' with a .pdf extension (any case),
// sorted by file name so the processing order is stable across platforms
std::vector<fs::path> PdfRenamerLogic::CollectPdfFiles(const fs::path &directory,
                                                       std::error_code &ec) {
  std::vector<fs::path> files;
  ec.clear();

  fs::directory_iterator it(directory,
                            fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    return files;
  }

  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) {
      return files;
    }
    std::error_code typeEc;
    const fs::path &entryPath = it->path();
    if (it->is_regular_file(typeEc) && !typeEc && HasPdfExtension(entryPath)) {
      files.push_back(entryPath);
    }
  }

  std::sort(files.begin(), files.end(),
            [](const fs::path &a, const fs::path &b) {
              return a.filename().u8string() < b.filename().u8string();
            });
  return files;
}

// Used by the shells for the "N PDF file(s) found" display; errors count as 0
int PdfRenamerLogic::CountPdfFiles(const fs::path &directory) {
  std::error_code ec;
  if (directory.empty() || !fs::is_directory(directory, ec) || ec) {
    return 0;
  }
  std::vector<fs::path> files = CollectPdfFiles(directory, ec);
  return ec ? 0 : static_cast<int>(files.size());
}
