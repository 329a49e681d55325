#ifndef MAINFRAME_H
#define MAINFRAME_H

#include <wx/wx.h>
#include <wx/statusbr.h>
#include <wx/settings.h>
#include <wx/dnd.h>
#include <wx/checkbox.h>

#include "PdfRenamerLogic.h"
#include "AppSettings.h"
#include <filesystem>

wxDECLARE_EVENT(EVT_FILE_PROCESSED, wxThreadEvent);
wxDECLARE_EVENT(EVT_PROGRESS_UPDATE, wxThreadEvent);
wxDECLARE_EVENT(EVT_RUN_COMPLETE, wxThreadEvent);

// Forward declarations
class wxPanel;
class wxDirPickerCtrl;
class wxFileDirPickerEvent;
class wxGauge;
class wxButton;
class wxTextCtrl;
class wxStaticText;
class FolderDropTarget;
class wxCloseEvent;
class WorkerThread;

namespace fs = std::filesystem;

// Control IDs Enum
enum ControlIDs
{
	ID_InputDirPicker = wxID_HIGHEST + 1,
	ID_OutputDirPicker,
	ID_InPlaceCheck,
	ID_StartButton,
	ID_CancelButton,
	ID_HelpTopics
};

class MainFrame : public wxFrame
{
	friend class FolderDropTarget;

public:
	MainFrame(const wxString &title, const wxPoint &pos, const wxSize &size, const AppSettings &settings);

private:
	// UI Elements
	wxPanel *mainPanel;
	wxDirPickerCtrl *inputDirPicker;
	wxDirPickerCtrl *outputDirPicker;
	wxCheckBox *inPlaceCheck;
	wxStaticText *fileCountLabel;
	wxStaticText *progressLabel;
	wxGauge *progressBar;
	wxButton *startButton;
	wxButton *cancelButton;
	wxTextCtrl *logTextCtrl;
	wxStatusBar *m_statusBar;

	// State Variables
	AppSettings m_settings;
	WorkerThread *m_workerThread;
	bool m_isProcessing;
	wxString m_outputBeforeInPlace; // Restored when "same folder" is unticked

	// Initialization & Layout
	void SetupLayout();
	void BindEvents();

	// Event Handlers
	void OnInputDirChanged(wxFileDirPickerEvent &event);
	void OnInPlaceToggled(wxCommandEvent &event);
	void OnStartClick(wxCommandEvent &event);
	void OnCancelClick(wxCommandEvent &event);
	void OnExit(wxCommandEvent &event);
	void OnAbout(wxCommandEvent &event);
	void OnHelpTopics(wxCommandEvent &event);
	void OnClose(wxCloseEvent &event);
	void OnFileProcessed(wxThreadEvent &event);
	void OnProgressUpdate(wxThreadEvent &event);
	void OnRunComplete(wxThreadEvent &event);

	// Helper Functions
	void SetUIBusy(bool busy);
	void UpdateStatusBar(const wxString &text);
	void UpdateFileCount();
	void UpdateOutputForInPlace();
	void AppendLog(const wxString &message, const wxColour &colour);
	void JoinWorkerThread();

	// Drag & Drop Handler
	void SetDroppedDirectory(const wxString &path);

	// Settings Persistence
	void LoadSettings(); // Loads last used folders and window geometry
	void SaveSettings(); // Saves last used folders and window geometry
};

// Accepts a single folder dropped onto the window as the input folder
class FolderDropTarget : public wxFileDropTarget
{
public:
	FolderDropTarget(MainFrame *owner);
	virtual bool OnDropFiles(wxCoord x, wxCoord y, const wxArrayString &filenames) override;

private:
	MainFrame *m_owner;
};

#endif // MAINFRAME_H
