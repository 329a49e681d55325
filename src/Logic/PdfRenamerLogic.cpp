#include "PdfRenamerLogic.h"

// Fallback base name used whenever a title sanitizes to nothing
const std::string PdfRenamerLogic::DefaultTitle = "Untitled Manual";

const std::string PdfRenamerLogic::PdfExtension = ".pdf";

const int PdfRenamerLogic::DefaultMaxFilenameLength = 255;

const char *PdfRenamerLogic::OutcomeLabel(OutcomeKind kind)
{
	switch (kind)
	{
	case OutcomeKind::Renamed:
		return "Renamed";
	case OutcomeKind::Copied:
		return "Copied";
	case OutcomeKind::SkippedNoTitle:
		return "SkippedNoTitle";
	case OutcomeKind::SkippedAlreadyCorrect:
		return "SkippedAlreadyCorrect";
	case OutcomeKind::Error:
		return "Error";
	}
	return "Unknown";
}
