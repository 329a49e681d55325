#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/panel.h>
#include <wx/stattext.h>
#include <wx/textctrl.h>
#include <wx/button.h>
#include <wx/checkbox.h>
#include <wx/filepicker.h>
#include <wx/statusbr.h>
#include <wx/datetime.h>
#include <wx/menu.h> // For disabling menu items in SetUIBusy

#include "MainFrame.h"
#include "PdfRenamerLogic.h"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Updates the text displayed in the status bar
void MainFrame::UpdateStatusBar(const wxString &text)
{
	if (m_statusBar)
	{
		m_statusBar->SetStatusText(text);
	}
}

// Shows how many PDFs the current input folder holds
void MainFrame::UpdateFileCount()
{
	wxString folder = inputDirPicker->GetPath();
	folder.Trim(true).Trim(false);
	if (folder.IsEmpty())
	{
		fileCountLabel->SetLabel("0 PDF files found");
		return;
	}

	const int count = PdfRenamerLogic::CountPdfFiles(fs::path(folder.ToStdWstring()));
	fileCountLabel->SetLabel(wxString::Format("%d PDF file(s) found in input folder", count));
	mainPanel->Layout();
}

// In "same folder" mode the output picker mirrors the input folder and is locked
void MainFrame::UpdateOutputForInPlace()
{
	const bool inPlace = inPlaceCheck->IsChecked();
	if (inPlace)
	{
		outputDirPicker->SetPath(inputDirPicker->GetPath());
	}
	outputDirPicker->Enable(!inPlace && !m_isProcessing);
}

// Appends a timestamped, coloured line to the activity log
void MainFrame::AppendLog(const wxString &message, const wxColour &colour)
{
	const wxString timestamp = wxDateTime::Now().Format("[%H:%M:%S] ");

	logTextCtrl->SetDefaultStyle(wxTextAttr(wxColour(128, 128, 128)));
	logTextCtrl->AppendText(timestamp);
	logTextCtrl->SetDefaultStyle(wxTextAttr(colour));
	logTextCtrl->AppendText(message + "\n");
	logTextCtrl->SetDefaultStyle(wxTextAttr(*wxBLACK));
	logTextCtrl->ShowPosition(logTextCtrl->GetLastPosition());
}

// Enables or disables UI elements to indicate a busy state (e.g., during thread operations)
void MainFrame::SetUIBusy(bool busy)
{
	m_isProcessing = busy;
	bool enable = !busy; // Controls should be enabled if not busy

	inputDirPicker->Enable(enable);
	inPlaceCheck->Enable(enable);
	outputDirPicker->Enable(enable && !inPlaceCheck->IsChecked());
	startButton->Enable(enable);
	cancelButton->Enable(busy); // Cancel is only meaningful while a run is active
	startButton->SetLabel(busy ? "Processing..." : "Start Renaming");

	// Menu Items
	wxMenuBar *menuBar = GetMenuBar();
	if (menuBar)
	{
		menuBar->Enable(ID_HelpTopics, enable);
		menuBar->Enable(wxID_ABOUT, enable);
	}

	// Update status bar and cursor to reflect busy state
	if (busy)
	{
		UpdateStatusBar("Processing...");
		wxBeginBusyCursor();
	}
	else
	{
		// Status bar will be updated by the calling function with a more specific message
		wxEndBusyCursor();
	}
}
