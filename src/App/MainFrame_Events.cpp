#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/msgdlg.h>
#include <wx/aboutdlg.h>
#include <wx/textctrl.h>
#include <wx/filepicker.h>
#include <wx/gauge.h>
#include <wx/button.h>
#include <wx/checkbox.h>

#include "MainFrame.h"
#include "HelpDialog.h"
#include "WorkerThread.h"

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Handles a new input folder chosen through the picker
void MainFrame::OnInputDirChanged(wxFileDirPickerEvent &event)
{
	if (inPlaceCheck->IsChecked())
	{
		outputDirPicker->SetPath(inputDirPicker->GetPath());
	}
	UpdateFileCount();
	wxLogMessage("Input folder selected: %s", inputDirPicker->GetPath());
}

// Handles the "Save in the same folder" checkbox
void MainFrame::OnInPlaceToggled(wxCommandEvent &event)
{
	if (inPlaceCheck->IsChecked())
	{
		m_outputBeforeInPlace = outputDirPicker->GetPath();
	}
	else if (outputDirPicker->GetPath() == inputDirPicker->GetPath())
	{
		outputDirPicker->SetPath(m_outputBeforeInPlace);
	}
	UpdateOutputForInPlace();
}

// Handles the "Start Renaming" button click
void MainFrame::OnStartClick(wxCommandEvent &event)
{
	if (m_isProcessing)
	{
		wxMessageBox("Processing is already in progress.", "Warning", wxOK | wxICON_WARNING, this);
		return;
	}

	wxString inputFolder = inputDirPicker->GetPath();
	inputFolder.Trim(true).Trim(false);
	const bool inPlace = inPlaceCheck->IsChecked();
	wxString outputFolder = inPlace ? inputFolder : outputDirPicker->GetPath();
	outputFolder.Trim(true).Trim(false);

	// Validation
	if (inputFolder.IsEmpty())
	{
		wxMessageBox("Please select an input folder.", "Input Error", wxOK | wxICON_ERROR, this);
		return;
	}
	if (outputFolder.IsEmpty())
	{
		wxMessageBox("Please select an output folder or check the 'same folder' option.", "Input Error", wxOK | wxICON_ERROR, this);
		return;
	}
	fs::path inputPath(inputFolder.ToStdWstring());
	std::error_code ec;
	if (!fs::exists(inputPath, ec))
	{
		wxMessageBox("Input folder does not exist: " + inputFolder, "Input Error", wxOK | wxICON_ERROR, this);
		return;
	}
	if (!fs::is_directory(inputPath, ec))
	{
		wxMessageBox("Input path is not a directory: " + inputFolder, "Input Error", wxOK | wxICON_ERROR, this);
		return;
	}

	RunParams params;
	params.inputDirectory = inputPath;
	params.outputDirectory = fs::path(outputFolder.ToStdWstring());
	params.inPlace = inPlace;
	params.maxFilenameLength = m_settings.maxFilenameLength;

	logTextCtrl->Clear();
	progressBar->SetValue(0);
	progressLabel->SetLabel("Initializing...");
	AppendLog("Scanning folder: " + inputFolder, wxColour(74, 144, 226));
	AppendLog("Output folder: " + outputFolder, wxColour(74, 144, 226));
	AppendLog(wxString("Mode: ") + (inPlace ? "In-place Rename" : "Copy and Rename"), wxColour(74, 144, 226));

	WorkerThread *thread = new WorkerThread(this, params);
	if (thread->Create() != wxTHREAD_NO_ERROR)
	{
		wxLogError("Failed to create rename worker thread resource.");
		delete thread;
		UpdateStatusBar("Error: Failed to create thread resource.");
		return;
	}
	if (thread->Run() != wxTHREAD_NO_ERROR)
	{
		wxLogError("Failed to run rename worker thread!");
		delete thread;
		UpdateStatusBar("Error: Failed to run worker thread.");
		return;
	}
	m_workerThread = thread;
	SetUIBusy(true);
	wxLogMessage("Renaming process started: %s -> %s", inputFolder, outputFolder);
	// Results arrive through EVT_FILE_PROCESSED / EVT_PROGRESS_UPDATE / EVT_RUN_COMPLETE
}

// Stops the run after the file currently being processed
void MainFrame::OnCancelClick(wxCommandEvent &event)
{
	if (m_isProcessing && m_workerThread)
	{
		m_workerThread->RequestCancel();
		cancelButton->Enable(false);
		UpdateStatusBar("Cancelling after the current file...");
	}
}

// Handles the "File -> Exit" menu item
void MainFrame::OnExit(wxCommandEvent &event)
{
	Close(true); // Trigger OnClose handler for graceful shutdown
}

// Handles the "Help -> About" menu item
void MainFrame::OnAbout(wxCommandEvent &event)
{
	wxAboutDialogInfo i;
	i.SetName("PDF Title Renamer");
	i.SetVersion("1.0.0");
	i.SetDescription("Renames PDF files based on the visible text 'Title'\nfound on the first page.");
	i.SetLicence("GNU General Public License v3.0");

	wxAboutBox(i, this);
}

// Handles the "Help -> Help..." menu item
void MainFrame::OnHelpTopics(wxCommandEvent &event)
{
	HelpDialog helpDlg(this, m_settings);
	helpDlg.ShowModal();
}

// Handles the window close event
void MainFrame::OnClose(wxCloseEvent &event)
{
	SaveSettings();

	// Finish the current file, then stop; already written outputs are kept
	if (m_workerThread)
	{
		m_workerThread->RequestCancel();
		JoinWorkerThread();
		SetUIBusy(false);
	}

	event.Skip(); // Allow the window to close after performing cleanup
}
