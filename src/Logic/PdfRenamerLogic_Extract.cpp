#include "PdfRenamerLogic.h"

#include <wx/log.h>
#include <wx/string.h>

#include <poppler-document.h>
#include <poppler-global.h>
#include <poppler-page.h>
#include <poppler-rectangle.h>

#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace
{
	// Poppler prints parser diagnostics to stderr by default; send them to the
	// debug log instead so corrupt inputs do not spam the console
	void PopplerDebugToWxLog(const std::string &message, void * /*closure*/)
	{
		wxLogDebug("poppler: %s", wxString::FromUTF8(message.c_str()));
	}

	void InstallPopplerLogHook()
	{
		static std::once_flag once;
		std::call_once(once, []()
					   { poppler::set_debug_error_function(&PopplerDebugToWxLog, nullptr); });
	}
}

// Finds the first line equal to "title" (case-insensitive, trimmed) and returns
// the first non-empty line after it
std::optional<std::string> PdfRenamerLogic::ExtractTitle(const std::string &pageText)
{
	if (pageText.empty())
	{
		return std::nullopt;
	}

	std::vector<std::string> lines = SplitLines(pageText);
	for (auto &line : lines)
	{
		line = Trim(line);
	}

	for (std::size_t i = 0; i < lines.size(); ++i)
	{
		if (!iequals(lines[i], "title"))
		{
			continue;
		}
		for (std::size_t j = i + 1; j < lines.size(); ++j)
		{
			if (!lines[j].empty())
			{
				return lines[j];
			}
		}
		// Only the first label line counts
		break;
	}
	return std::nullopt;
}

// Plain text of page 1 as UTF-8, empty for a document without pages. Throws
// PdfParseError when the document cannot be opened or is locked.
std::string PdfRenamerLogic::ReadFirstPageText(const fs::path &pdfPath)
{
	InstallPopplerLogHook();

	std::unique_ptr<poppler::document> doc(poppler::document::load_from_file(pdfPath.u8string()));
	if (!doc)
	{
		throw PdfParseError("Failed to load PDF file: " + pdfPath.filename().u8string());
	}
	if (doc->is_locked())
	{
		throw PdfParseError("PDF file is password protected: " + pdfPath.filename().u8string());
	}
	if (doc->pages() < 1)
	{
		wxLogDebug("'%s' has no pages", wxString::FromUTF8(pdfPath.filename().u8string().c_str()));
		return std::string();
	}

	std::unique_ptr<poppler::page> page(doc->create_page(0));
	if (!page)
	{
		throw PdfParseError("Failed to read first page of: " + pdfPath.filename().u8string());
	}

	// Reading order, as pdftotext prints it without -layout: one space between words
	poppler::byte_array textBytes = page->text(poppler::rectf(), poppler::page::non_raw_non_physical_layout).to_utf8();
	return std::string(textBytes.begin(), textBytes.end());
}

// Reads page 1 through 'reader' (or poppler when empty) and extracts the title.
// PdfParseError propagates to the caller; it is not the same as "no title".
std::optional<std::string> PdfRenamerLogic::ExtractTitleFromPdf(const fs::path &pdfPath, const FirstPageTextReader &reader)
{
	std::string pageText = reader ? reader(pdfPath) : ReadFirstPageText(pdfPath);
	return ExtractTitle(pageText);
}
