#include "AppSettings.h"

#include <wx/config.h>
#include <wx/confbase.h>
#include <wx/filename.h>
#include <wx/stdpaths.h>

#include <climits>

namespace
{
	const char *const KeyMaxFilenameLength = "/Settings/MaxFilenameLength";
	const char *const KeyLogLevel = "/Settings/LogLevel";
	const char *const KeyLogToFile = "/Settings/LogToFile";
}

AppSettings AppSettings::Load(wxConfigBase *cfg, bool writeDefaults)
{
	AppSettings settings;
	if (!cfg)
		return settings; // Config system unavailable, use defaults

	const bool hadAllKeys = cfg->Exists(KeyMaxFilenameLength) && cfg->Exists(KeyLogLevel) && cfg->Exists(KeyLogToFile);

	const long maxLength = cfg->ReadLong(KeyMaxFilenameLength, settings.maxFilenameLength);
	if (maxLength < 1)
	{
		wxLogWarning("Invalid max filename length %ld in settings; using 1.", maxLength);
		settings.maxFilenameLength = 1;
	}
	else if (!IsValidMaxFilenameLength(maxLength))
	{
		wxLogWarning("Invalid max filename length %ld in settings; using %d.", maxLength, INT_MAX);
		settings.maxFilenameLength = INT_MAX;
	}
	else
	{
		settings.maxFilenameLength = static_cast<int>(maxLength);
	}
	settings.logLevel = cfg->Read(KeyLogLevel, settings.logLevel);
	settings.logToFile = cfg->ReadBool(KeyLogToFile, settings.logToFile);

	if (writeDefaults && !hadAllKeys)
	{
		settings.Save(cfg);
	}
	return settings;
}

void AppSettings::Save(wxConfigBase *cfg) const
{
	if (!cfg)
		return;
	cfg->Write(KeyMaxFilenameLength, (long)maxFilenameLength);
	cfg->Write(KeyLogLevel, logLevel);
	cfg->Write(KeyLogToFile, logToFile);
	cfg->Flush();
}

bool AppSettings::IsValidMaxFilenameLength(long value)
{
	return value >= 1 && value <= INT_MAX;
}

wxLogLevel AppSettings::ParseLogLevel(const wxString &name)
{
	wxString upper = name.Upper();
	upper.Trim(true).Trim(false);
	if (upper == "DEBUG")
		return wxLOG_Debug;
	if (upper == "WARNING" || upper == "WARN")
		return wxLOG_Warning;
	if (upper == "ERROR")
		return wxLOG_Error;
	return wxLOG_Info;
}

wxString AppSettings::LogFilePath()
{
	wxFileName logFile(wxStandardPaths::Get().GetUserDataDir(), "pdf_renamer.log");
	return logFile.GetFullPath();
}
