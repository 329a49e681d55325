#include "HelpDialog.h"
#include <wx/sizer.h>
#include <wx/textctrl.h>
#include <wx/button.h>

HelpDialog::HelpDialog(wxWindow *parent,
					   const AppSettings &settings,
					   const wxSize &size,
					   long style)
	: wxDialog(parent, wxID_ANY, "Help Topics", wxDefaultPosition, size, style)
{
	wxBoxSizer *mainSizer = new wxBoxSizer(wxVERTICAL);

	helpTextCtrl = new wxTextCtrl(
		this,
		wxID_ANY,
		BuildHelpText(settings),
		wxDefaultPosition,
		wxDefaultSize,
		wxTE_MULTILINE | wxTE_READONLY | wxTE_RICH2);
	mainSizer->Add(helpTextCtrl, 1, wxEXPAND | wxALL, 10);

	wxStdDialogButtonSizer *buttonSizer = new wxStdDialogButtonSizer();
	okButton = new wxButton(this, wxID_OK);
	buttonSizer->AddButton(okButton);
	buttonSizer->Realize();
	mainSizer->Add(buttonSizer, 0, wxALIGN_CENTER_HORIZONTAL | wxBOTTOM, 10);

	SetSizer(mainSizer);
	mainSizer->SetSizeHints(this);
	SetInitialSize(size);
	Centre(wxBOTH);

	Bind(wxEVT_BUTTON, &HelpDialog::OnOk, this, wxID_OK);
}

wxString HelpDialog::BuildHelpText(const AppSettings &settings)
{
	wxString text =
		"----------------------------------\n"
		" PDF Title Renamer - Help\n"
		"----------------------------------\n\n"
		"Each PDF in the input folder is opened and the text of its first page is read. "
		"The tool looks for a line that reads exactly 'Title' (any case) and uses the next "
		"non-empty line as the new file name.\n\n"

		"======================\n"
		" Folders\n"
		"======================\n"
		"  - Input Folder: The folder containing the PDFs. Only files directly inside it with a .pdf extension are processed; subfolders are ignored. You can also drag and drop a folder onto the window.\n"
		"  - Output Folder: Renamed copies are written here. The folder is created if it does not exist. The original files are never modified.\n"
		"  - Save in the same folder: Renames the original files in place instead of copying them.\n\n"

		"======================\n"
		" Naming Rules\n"
		"======================\n"
		"  - Characters invalid in file names (\\ / : * ? \" < > |) are removed.\n"
		"  - Leading and trailing spaces and dots are removed.\n";
	text += wxString::Format("  - Titles longer than %d characters are cut.\n", settings.maxFilenameLength);
	text +=
		"  - A title that ends up empty becomes 'Untitled Manual'.\n"
		"  - If the name is taken, ' (1)', ' (2)', ... is added before .pdf.\n\n"

		"======================\n"
		" Results\n"
		"======================\n"
		"  - Processed: files renamed or copied.\n"
		"  - Skipped: files without a 'Title' line, or already named correctly.\n"
		"  - Errors: unreadable or protected PDFs, and files that could not be renamed or copied.\n\n"
		"A file that fails never stops the rest of the run. Use Cancel to stop after the current file.\n\n"

		"======================\n"
		" Settings\n"
		"======================\n";
	text += wxString::Format("  - Log level: %s\n", settings.logLevel);
	if (settings.logToFile)
		text += "  - Log file: " + AppSettings::LogFilePath() + "\n";
	else
		text += "  - Log file: disabled\n";
	return text;
}

// Closes the modal dialog and returns wxID_OK
void HelpDialog::OnOk(wxCommandEvent &WXUNUSED(event))
{
	EndModal(wxID_OK);
}
