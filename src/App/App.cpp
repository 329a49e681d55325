#include <wx/wxprec.h>
#ifdef __WXMSW__
#include <windows.h>
#endif
#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif
#include "App.h"
#include "AppSettings.h"
#include "MainFrame.h"
#include <wx/config.h>
#include <wx/filename.h>
#include <wx/log.h>

wxIMPLEMENT_APP(App);

bool App::OnInit()
{
#ifdef __WXMSW__
	// Enable per-monitor DPI awareness (V2) on Windows for sharp UI rendering on high-DPI displays
	SetProcessDpiAwarenessContext(DPI_AWARENESS_CONTEXT_PER_MONITOR_AWARE_V2);
#endif

	SetAppName("PdfTitleRenamer");

	// Initialize the configuration system for storing/retrieving application settings
	wxConfigBase::Set(new wxConfig(GetAppName()));

	if (!wxApp::OnInit())
	{
		wxConfigBase::Set(nullptr);
		return false;
	}

	// First start writes the defaults so they can be edited
	AppSettings settings = AppSettings::Load(wxConfigBase::Get(), true);
	SetupLogging(settings.logLevel, settings.logToFile);
	wxLogMessage("PDF Title Renamer started (log level %s).", settings.logLevel);

	MainFrame *frame = new MainFrame(
		"PDF Title Renamer",
		wxPoint(50, 50),
		wxSize(750, 700),
		settings);
	frame->Show(true);
	return true;
}

int App::OnExit()
{
	wxLogMessage("PDF Title Renamer closed.");
	delete wxLog::SetActiveTarget(nullptr);
	if (m_logFile)
	{
		fclose(m_logFile);
		m_logFile = nullptr;
	}
	delete wxConfigBase::Set(nullptr);
	return wxApp::OnExit();
}

// Diagnostics go to the log file (or stderr); the activity log is the on-screen channel
void App::SetupLogging(const wxString &logLevel, bool logToFile)
{
	wxLog::SetLogLevel(AppSettings::ParseLogLevel(logLevel));
	wxLog::SetTimestamp("%Y-%m-%d %H:%M:%S");
	if (wxLog::GetLogLevel() >= wxLOG_Debug)
		wxLog::SetVerbose(true);

	FILE *target = stderr;
	wxFileName logPath(AppSettings::LogFilePath());
	if (logToFile)
	{
		if (!logPath.DirExists() && !logPath.Mkdir(wxS_DIR_DEFAULT, wxPATH_MKDIR_FULL))
		{
			fprintf(stderr, "Could not create log folder '%s'; logging to stderr.\n", (const char *)logPath.GetPath().utf8_str());
		}
		else if (!(m_logFile = wxFopen(logPath.GetFullPath(), "a")))
		{
			fprintf(stderr, "Could not open log file '%s'; logging to stderr.\n", (const char *)logPath.GetFullPath().utf8_str());
		}
		else
		{
			target = m_logFile;
		}
	}

	// Replaces the default GUI target, which would turn every message into a dialog
	delete wxLog::SetActiveTarget(new wxLogStderr(target));
	if (m_logFile)
		wxLogVerbose("Logging to %s", logPath.GetFullPath());
}
