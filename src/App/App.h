#ifndef APP_H
#define APP_H

#include <wx/wx.h>

#include <cstdio>

class App : public wxApp
{
public:
	virtual bool OnInit() override;
	virtual int OnExit() override;

private:
	void SetupLogging(const wxString &logLevel, bool logToFile);

	FILE *m_logFile = nullptr; // Open while file logging is active
};

wxDECLARE_APP(App);

#endif // APP_H
