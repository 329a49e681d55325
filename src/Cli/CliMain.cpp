#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/app.h>
#include <wx/cmdline.h>
#include <wx/config.h>
#include <wx/crt.h>
#include <wx/init.h>
#include <wx/log.h>

#include "AppSettings.h"
#include "PdfRenamerLogic.h"

#include <climits>
#include <filesystem>
#include <string>

namespace fs = std::filesystem;

namespace
{
	const int ExitOk = 0;
	const int ExitFileErrors = 1;
	const int ExitFatal = 2;

	const wxCmdLineEntryDesc CmdLineDesc[] = {
		{wxCMD_LINE_SWITCH, "h", "help", "show this help message", wxCMD_LINE_VAL_NONE, wxCMD_LINE_OPTION_HELP},
		{wxCMD_LINE_OPTION, "i", "input", "folder containing the PDF files", wxCMD_LINE_VAL_STRING, wxCMD_LINE_OPTION_MANDATORY},
		{wxCMD_LINE_OPTION, "o", "output", "folder receiving the renamed copies", wxCMD_LINE_VAL_STRING, 0},
		{wxCMD_LINE_SWITCH, "p", "in-place", "rename the original files instead of copying", wxCMD_LINE_VAL_NONE, 0},
		{wxCMD_LINE_OPTION, "m", "max-length", "maximum length of the new name, without extension", wxCMD_LINE_VAL_NUMBER, 0},
		{wxCMD_LINE_SWITCH, "v", "verbose", "log debug messages", wxCMD_LINE_VAL_NONE, 0},
		wxCMD_LINE_DESC_END};

	wxString U8(const std::string &s) { return wxString::FromUTF8(s.c_str()); }

	void PrintOutcome(const FileOutcome &outcome)
	{
		const wxString name = U8(outcome.FileName);
		switch (outcome.Kind)
		{
		case OutcomeKind::Renamed:
		case OutcomeKind::Copied:
			wxPrintf("%-8s %s -> %s\n", PdfRenamerLogic::OutcomeLabel(outcome.Kind), name, U8(outcome.Detail));
			break;
		case OutcomeKind::SkippedNoTitle:
		case OutcomeKind::SkippedAlreadyCorrect:
			wxPrintf("%-8s %s: %s\n", "SKIPPED", name, U8(outcome.Detail));
			break;
		case OutcomeKind::Error:
			wxFprintf(stderr, "%-8s %s: %s\n", "ERROR", name, U8(outcome.Detail));
			break;
		}
	}
}

int main(int argc, char **argv)
{
	wxInitializer initializer(argc, argv);
	if (!initializer.IsOk())
	{
		fprintf(stderr, "Failed to initialize the wxWidgets library.\n");
		return ExitFatal;
	}

	wxAppConsole::GetInstance()->SetAppName("PdfTitleRenamer");
	wxLog::SetTimestamp("%Y-%m-%d %H:%M:%S");

	wxCmdLineParser parser(CmdLineDesc, argc, argv);
	parser.SetLogo("pdftitlerename-cli: rename PDF files after the 'Title' line on their first page");
	switch (parser.Parse())
	{
	case -1:
		return ExitOk; // Help was shown
	case 0:
		break;
	default:
		return ExitFatal; // The parser already reported the problem
	}

	// Shares the /Settings group with the GUI, read-only
	wxConfig config("PdfTitleRenamer");
	AppSettings settings = AppSettings::Load(&config);

	wxLog::SetLogLevel(parser.Found("v") ? wxLOG_Debug : AppSettings::ParseLogLevel(settings.logLevel));
	if (parser.Found("v"))
		wxLog::SetVerbose(true);

	wxString input;
	wxString output;
	parser.Found("i", &input);
	const bool hasOutput = parser.Found("o", &output);
	const bool inPlace = parser.Found("p");

	if (hasOutput && inPlace)
	{
		wxLogError("--output and --in-place cannot be combined.");
		parser.Usage();
		return ExitFatal;
	}
	if (!hasOutput && !inPlace)
	{
		wxLogError("Either --output or --in-place is required.");
		parser.Usage();
		return ExitFatal;
	}

	long maxLength = settings.maxFilenameLength;
	if (parser.Found("m", &maxLength) && !AppSettings::IsValidMaxFilenameLength(maxLength))
	{
		wxLogError("--max-length must be between 1 and %d.", INT_MAX);
		return ExitFatal;
	}

	RunParams params;
	params.inputDirectory = fs::path(input.ToStdWstring());
	if (hasOutput)
		params.outputDirectory = fs::path(output.ToStdWstring());
	params.inPlace = inPlace;
	params.maxFilenameLength = static_cast<int>(maxLength);

	RunCallbacks callbacks;
	callbacks.onFileEvent = PrintOutcome;

	RunResult result;
	try
	{
		result = PdfRenamerLogic::performRun(params, callbacks);
	}
	catch (const std::exception &e)
	{
		wxLogError("Unexpected error: %s", e.what());
		return ExitFatal;
	}

	if (!result.success)
	{
		// performRun has already logged the reason
		return ExitFatal;
	}

	const RunSummary &summary = result.summary;
	if (summary.totalFiles == 0)
	{
		wxPrintf("No PDF files found in the input folder.\n");
		return ExitOk;
	}
	wxPrintf("Done! Processed: %d, Skipped: %d, Errors: %d\n",
			 summary.processedCount, summary.skippedCount, summary.errorCount);
	return summary.errorCount > 0 ? ExitFileErrors : ExitOk;
}
