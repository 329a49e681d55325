#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/accel.h> // Required for accelerator table
#include <wx/button.h>
#include <wx/checkbox.h>
#include <wx/config.h>
#include <wx/dnd.h>
#include <wx/event.h>
#include <wx/filepicker.h>
#include <wx/gauge.h>
#include <wx/menu.h>
#include <wx/panel.h>
#include <wx/sizer.h>
#include <wx/statbox.h>
#include <wx/stattext.h>
#include <wx/statusbr.h>
#include <wx/textctrl.h>

#include "MainFrame.h"
#include "PdfRenamerLogic.h"
#include "WorkerThread.h"

// MainFrame constructor: Initializes UI elements, menus, status bar, and loads
// settings
MainFrame::MainFrame(const wxString &title, const wxPoint &pos,
                     const wxSize &size, const AppSettings &settings)
    : wxFrame(NULL, wxID_ANY, title, pos, size), m_settings(settings),
      m_workerThread(nullptr), m_isProcessing(false) {
  // Create the menu bar
  wxMenu *menuFile = new wxMenu;
  menuFile->Append(wxID_EXIT, "E&xit", "Exit this program");

  wxMenu *menuHelp = new wxMenu;
  menuHelp->Append(ID_HelpTopics, "&Help...\tF1");
  menuHelp->AppendSeparator();
  menuHelp->Append(wxID_ABOUT);

  wxMenuBar *menuBar = new wxMenuBar;
  menuBar->Append(menuFile, "&File");
  menuBar->Append(menuHelp, "&Help");
  SetMenuBar(menuBar);

  // Create the status bar
  CreateStatusBar(1);
  m_statusBar = GetStatusBar();
  UpdateStatusBar("Ready");

  mainPanel = new wxPanel(this, wxID_ANY);

  inputDirPicker = new wxDirPickerCtrl(
      mainPanel, ID_InputDirPicker, wxEmptyString, "Select Input Folder",
      wxDefaultPosition, wxDefaultSize,
      wxDIRP_DEFAULT_STYLE | wxDIRP_DIR_MUST_EXIST);
  outputDirPicker = new wxDirPickerCtrl(
      mainPanel, ID_OutputDirPicker, wxEmptyString, "Select Output Folder",
      wxDefaultPosition, wxDefaultSize, wxDIRP_DEFAULT_STYLE);
  inPlaceCheck =
      new wxCheckBox(mainPanel, ID_InPlaceCheck,
                     "Save in the same folder (renames original files)");
  fileCountLabel = new wxStaticText(mainPanel, wxID_ANY, "0 PDF files found");
  progressLabel = new wxStaticText(mainPanel, wxID_ANY, "Ready");
  progressBar = new wxGauge(mainPanel, wxID_ANY, 100, wxDefaultPosition,
                            wxSize(-1, 16), wxGA_HORIZONTAL | wxGA_SMOOTH);
  progressBar->SetValue(0);
  startButton = new wxButton(mainPanel, ID_StartButton, "Start Renaming");
  cancelButton = new wxButton(mainPanel, ID_CancelButton, "Cancel");
  cancelButton->Enable(false); // Only meaningful while a run is active
  logTextCtrl = new wxTextCtrl(mainPanel, wxID_ANY, "", wxDefaultPosition,
                               wxSize(-1, 220),
                               wxTE_MULTILINE | wxTE_READONLY | wxTE_RICH2);

  SetupLayout();

  // Dropping a folder anywhere on the panel sets it as the input folder
  mainPanel->SetDropTarget(new FolderDropTarget(this));

  LoadSettings();
  UpdateOutputForInPlace();
  UpdateFileCount();

  // Finalize window sizing, respecting minimum requirements and saved
  // dimensions
  this->Fit();
  wxSize minReqSize = this->GetSize();
  wxConfigBase *config = wxConfigBase::Get();
  int savedW = 750;
  int savedH = 700;
  if (config) {
    savedW = config->ReadLong("/Window/Width", savedW);
    savedH = config->ReadLong("/Window/Height", savedH);
  }
  if (savedW < minReqSize.GetWidth())
    savedW = minReqSize.GetWidth();
  if (savedH < minReqSize.GetHeight())
    savedH = minReqSize.GetHeight();
  if (savedW < 700)
    savedW = 700;
  if (savedH < 600)
    savedH = 600;
  this->SetSize(savedW, savedH);
  this->SetMinSize(wxSize(700, 600));

  BindEvents();
}

// Arranges UI elements within the MainFrame using sizers
void MainFrame::SetupLayout() {
  wxBoxSizer *mainSizer = new wxBoxSizer(wxVERTICAL);

  // Step 1: input folder
  wxStaticBoxSizer *inputSizer =
      new wxStaticBoxSizer(wxVERTICAL, mainPanel, "Step 1: Select Input Folder");
  inputSizer->Add(inputDirPicker, 0, wxEXPAND | wxALL, 5);
  mainSizer->Add(inputSizer, 0, wxEXPAND | wxALL, 5);

  // Step 2: output folder
  wxStaticBoxSizer *outputSizer = new wxStaticBoxSizer(
      wxVERTICAL, mainPanel, "Step 2: Select Output Folder");
  outputSizer->Add(outputDirPicker, 0, wxEXPAND | wxALL, 5);
  outputSizer->Add(inPlaceCheck, 0, wxALIGN_LEFT | wxALL, 5);
  mainSizer->Add(outputSizer, 0, wxEXPAND | wxLEFT | wxRIGHT | wxBOTTOM, 5);

  mainSizer->Add(fileCountLabel, 0, wxLEFT | wxRIGHT | wxBOTTOM, 10);

  // Progress status above the gauge
  mainSizer->Add(progressLabel, 0, wxLEFT | wxRIGHT, 10);
  mainSizer->Add(progressBar, 0, wxEXPAND | wxALL, 10);

  wxBoxSizer *actionButtonSizer = new wxBoxSizer(wxHORIZONTAL);
  actionButtonSizer->Add(startButton, 1, wxEXPAND | wxALL, 5);
  actionButtonSizer->Add(cancelButton, 0, wxALL, 5);
  mainSizer->Add(actionButtonSizer, 0, wxEXPAND | wxLEFT | wxRIGHT, 5);

  wxStaticBoxSizer *logSizer =
      new wxStaticBoxSizer(wxVERTICAL, mainPanel, "Activity Log");
  logSizer->Add(logTextCtrl, 1, wxEXPAND | wxALL, 5);
  mainSizer->Add(logSizer, 1, wxEXPAND | wxALL, 5);

  mainPanel->SetSizer(mainSizer);
}

// Binds UI events to their respective handler functions
void MainFrame::BindEvents() {
  Bind(wxEVT_MENU, &MainFrame::OnExit, this, wxID_EXIT);
  Bind(wxEVT_MENU, &MainFrame::OnAbout, this, wxID_ABOUT);
  Bind(wxEVT_MENU, &MainFrame::OnHelpTopics, this, ID_HelpTopics);
  Bind(wxEVT_CLOSE_WINDOW, &MainFrame::OnClose, this);
  inputDirPicker->Bind(wxEVT_DIRPICKER_CHANGED, &MainFrame::OnInputDirChanged,
                       this);
  inPlaceCheck->Bind(wxEVT_CHECKBOX, &MainFrame::OnInPlaceToggled, this);
  startButton->Bind(wxEVT_BUTTON, &MainFrame::OnStartClick, this,
                    ID_StartButton);
  cancelButton->Bind(wxEVT_BUTTON, &MainFrame::OnCancelClick, this,
                     ID_CancelButton);
  // Worker thread events
  this->Bind(EVT_FILE_PROCESSED, &MainFrame::OnFileProcessed, this);
  this->Bind(EVT_PROGRESS_UPDATE, &MainFrame::OnProgressUpdate, this);
  this->Bind(EVT_RUN_COMPLETE, &MainFrame::OnRunComplete, this);
  // Keyboard accelerators
  wxAcceleratorEntry entries[2];
  entries[0].Set(wxACCEL_NORMAL, WXK_F1, ID_HelpTopics);
  entries[1].Set(wxACCEL_CTRL, (int)'R', ID_StartButton);
  wxAcceleratorTable accel(2, entries);
  this->SetAcceleratorTable(accel);
  // Accelerators arrive as menu events
  Bind(wxEVT_MENU, &MainFrame::OnStartClick, this, ID_StartButton);
}
