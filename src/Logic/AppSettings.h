#ifndef APPSETTINGS_H
#define APPSETTINGS_H

#include <wx/string.h>
#include <wx/log.h>

class wxConfigBase;

// Application-wide settings persisted through wxConfig under /Settings
struct AppSettings
{
	int maxFilenameLength = 255;
	wxString logLevel = "INFO";
	bool logToFile = true;

	// Reads the settings from 'cfg', falling back to defaults for missing keys.
	// When 'writeDefaults' is set, missing keys are written back so the user can
	// find and edit them.
	static AppSettings Load(wxConfigBase *cfg, bool writeDefaults = false);
	void Save(wxConfigBase *cfg) const;

	// A usable maximum name length: 1 to INT_MAX characters
	static bool IsValidMaxFilenameLength(long value);

	// Maps DEBUG / INFO / WARNING / ERROR (any case) to a wxLog level; unknown -> INFO
	static wxLogLevel ParseLogLevel(const wxString &name);

	// <user data dir>/pdf_renamer.log
	static wxString LogFilePath();
};

#endif // APPSETTINGS_H
