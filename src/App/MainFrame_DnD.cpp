#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/dnd.h>
#include <wx/filefn.h>	   // For wxDirExists
#include <wx/filepicker.h> // For inputDirPicker
#include <wx/checkbox.h>

#include "MainFrame.h" // Needs access to MainFrame members and methods

// Constructor for the folder drop target, associating it with the MainFrame
FolderDropTarget::FolderDropTarget(MainFrame *owner) : m_owner(owner) {}

// Called when files/directories are dropped onto the target
bool FolderDropTarget::OnDropFiles(wxCoord x, wxCoord y, const wxArrayString &filenames)
{
	if (!m_owner)
		return false;

	if (m_owner->m_isProcessing)
	{
		m_owner->UpdateStatusBar("Drop Ignored: A run is in progress.");
		return false;
	}

	if (filenames.GetCount() != 1)
	{
		m_owner->UpdateStatusBar("Drop Error: Please drop a single folder.");
		return false;
	}

	wxString droppedPath = filenames[0];
	if (!wxDirExists(droppedPath))
	{
		m_owner->UpdateStatusBar("Drop Error: The dropped item is not a folder.");
		return false;
	}

	m_owner->SetDroppedDirectory(droppedPath); // Delegate to MainFrame to handle the dropped directory
	return true;
}

// Uses a dropped folder as the new input folder
void MainFrame::SetDroppedDirectory(const wxString &path)
{
	if (!wxDirExists(path))
	{
		UpdateStatusBar("Drop Error: Invalid directory path received.");
		return;
	}

	inputDirPicker->SetPath(path);
	UpdateOutputForInPlace();
	UpdateFileCount();
	UpdateStatusBar("Input folder set via drag and drop: " + path);
	AppendLog("Input folder set: " + path, wxColour(74, 144, 226));
}
