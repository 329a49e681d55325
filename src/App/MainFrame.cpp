#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

// Custom events posted by WorkerThread to report per-file outcomes, progress
// and run completion back to the UI thread
#include "MainFrame.h"

wxDEFINE_EVENT(EVT_FILE_PROCESSED, wxThreadEvent);
wxDEFINE_EVENT(EVT_PROGRESS_UPDATE, wxThreadEvent);
wxDEFINE_EVENT(EVT_RUN_COMPLETE, wxThreadEvent);
