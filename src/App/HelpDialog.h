#ifndef HELPDIALOG_H
#define HELPDIALOG_H

#include <wx/wxprec.h>
#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/dialog.h>

#include "AppSettings.h"

class wxTextCtrl;
class wxButton;

// Read-only usage notes, including the active naming limit and the log file location
class HelpDialog : public wxDialog
{
public:
	HelpDialog(wxWindow *parent,
			   const AppSettings &settings,
			   const wxSize &size = wxSize(650, 520),
			   long style = wxDEFAULT_DIALOG_STYLE | wxRESIZE_BORDER);

	static wxString BuildHelpText(const AppSettings &settings);

private:
	wxTextCtrl *helpTextCtrl;
	wxButton *okButton;

	void OnOk(wxCommandEvent &event);
};

#endif
