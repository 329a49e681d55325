#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/config.h>
#include <wx/filepicker.h>
#include <wx/checkbox.h>

#include "MainFrame.h"

// Loads window position and the last used folders from config
void MainFrame::LoadSettings()
{
	wxConfigBase *cfg = wxConfigBase::Get();
	if (!cfg)
		return; // Cannot load settings if config system is unavailable

	// Load window position. Size is handled in MainFrame constructor after initial Fit()
	int x = cfg->ReadLong("/Window/X", 50); // Default X position if not found
	int y = cfg->ReadLong("/Window/Y", 50); // Default Y position if not found
	SetPosition(wxPoint(x, y));

	inputDirPicker->SetPath(cfg->Read("/Inputs/InputDir", wxEmptyString));
	outputDirPicker->SetPath(cfg->Read("/Inputs/OutputDir", wxEmptyString));
	m_outputBeforeInPlace = outputDirPicker->GetPath();
	inPlaceCheck->SetValue(cfg->ReadBool("/Inputs/InPlace", false)); // Default to copy mode
}

// Saves window geometry, the last used folders and the run settings to config
void MainFrame::SaveSettings()
{
	wxConfigBase *cfg = wxConfigBase::Get();
	if (!cfg)
		return; // Cannot save settings if config system is unavailable

	// Save window position and size
	int x, y, w, h;
	GetPosition(&x, &y);
	GetSize(&w, &h);
	cfg->Write("/Window/X", (long)x);
	cfg->Write("/Window/Y", (long)y);
	cfg->Write("/Window/Width", (long)w);
	cfg->Write("/Window/Height", (long)h);

	cfg->Write("/Inputs/InputDir", inputDirPicker->GetPath());
	// Keep the separate output folder even while "same folder" mirrors the input
	cfg->Write("/Inputs/OutputDir", inPlaceCheck->IsChecked() ? m_outputBeforeInPlace : outputDirPicker->GetPath());
	cfg->Write("/Inputs/InPlace", inPlaceCheck->IsChecked());

	m_settings.Save(cfg);

	// Explicitly flush changes to ensure they are written to persistent storage
	cfg->Flush();
}
