#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include <wx/button.h>
#include <wx/gauge.h>
#include <wx/log.h>
#include <wx/msgdlg.h>
#include <wx/stattext.h>
#include <wx/textctrl.h>

#include "MainFrame.h"
#include "PdfRenamerLogic.h"
#include "WorkerThread.h"

#include <string>

namespace {
const wxColour kSuccessColour(40, 167, 69);
const wxColour kErrorColour(220, 53, 69);
const wxColour kWarningColour(200, 140, 0);
const wxColour kInfoColour(74, 144, 226);

wxString U8(const std::string &s) { return wxString::FromUTF8(s.c_str()); }
} // namespace

// Writes one line per processed file to the activity log
void MainFrame::OnFileProcessed(wxThreadEvent &event) {
  const FileOutcome outcome = event.GetPayload<FileOutcome>();
  const wxString name = U8(outcome.FileName);

  switch (outcome.Kind) {
  case OutcomeKind::Renamed:
    AppendLog("Renamed '" + name + "' -> '" + U8(outcome.Detail) + "'",
              kSuccessColour);
    break;
  case OutcomeKind::Copied:
    AppendLog("Copied '" + name + "' -> '" + U8(outcome.Detail) + "'",
              kSuccessColour);
    break;
  case OutcomeKind::SkippedNoTitle:
    AppendLog("Skipping '" + name + "': " + U8(outcome.Detail),
              kWarningColour);
    break;
  case OutcomeKind::SkippedAlreadyCorrect:
    AppendLog("Skipping '" + name + "': " + U8(outcome.Detail), kInfoColour);
    break;
  case OutcomeKind::Error:
    AppendLog("Error processing '" + name + "': " + U8(outcome.Detail),
              kErrorColour);
    break;
  }
}

// Updates the gauge and the "Processing: x/y files" label
void MainFrame::OnProgressUpdate(wxThreadEvent &event) {
  const int current = event.GetInt();
  const int total = static_cast<int>(event.GetExtraLong());
  if (total > 0) {
    const int percentage = (current * 100) / total;
    progressBar->SetValue(percentage);
    progressLabel->SetLabel(wxString::Format(
        "Processing: %d/%d files (%d%%)", current, total, percentage));
  } else {
    progressBar->SetValue(0);
    progressLabel->SetLabel("Ready");
  }
}

// Handles the end of a run: summary, fatal error report, UI reset
void MainFrame::OnRunComplete(wxThreadEvent &event) {
  // A run cut short by closing the window has already been cleaned up
  if (!m_isProcessing)
    return;
  const RunResult result = event.GetPayload<RunResult>();
  JoinWorkerThread();
  SetUIBusy(false);
  progressLabel->SetLabel("Ready");
  UpdateFileCount();

  if (!result.success) {
    AppendLog("FATAL ERROR", kErrorColour);
    AppendLog(U8(result.errorMessage), kErrorColour);
    UpdateStatusBar("Run failed.");
    wxMessageBox("The run could not be started:\n" + U8(result.errorMessage),
                 "Error", wxOK | wxICON_ERROR, this);
    return;
  }

  const RunSummary &summary = result.summary;
  if (summary.totalFiles == 0) {
    AppendLog("No PDF files found in the input folder.", kWarningColour);
    UpdateStatusBar("No PDF files found.");
    wxMessageBox("No PDF files found in the input folder.", "Info",
                 wxOK | wxICON_INFORMATION, this);
    return;
  }

  progressBar->SetValue(100);
  AppendLog(wxString('=', 50), kInfoColour);
  AppendLog(summary.cancelled ? "Cancelled. Summary:" : "Done! Summary:",
            kSuccessColour);
  AppendLog(wxString::Format("  Processed: %d file(s)", summary.processedCount),
            kSuccessColour);
  AppendLog(wxString::Format("  Skipped: %d file(s)", summary.skippedCount),
            kInfoColour);
  if (summary.errorCount > 0) {
    AppendLog(wxString::Format("  Errors: %d file(s)", summary.errorCount),
              kErrorColour);
  }
  AppendLog(wxString('=', 50), kInfoColour);

  UpdateStatusBar(wxString::Format("Finished: %d processed, %d skipped, %d errors.",
                                   summary.processedCount, summary.skippedCount,
                                   summary.errorCount));

  wxString message = wxString::Format("Process complete!\n\nProcessed: %d\nSkipped: %d",
                                      summary.processedCount, summary.skippedCount);
  if (summary.errorCount > 0) {
    message += wxString::Format("\nErrors: %d", summary.errorCount);
  }
  wxMessageBox(message, summary.cancelled ? "Cancelled" : "Success",
               wxOK | (summary.errorCount > 0 ? wxICON_WARNING : wxICON_INFORMATION),
               this);
}

// Waits for a finished (or cancelled) worker thread and releases it
void MainFrame::JoinWorkerThread() {
  if (!m_workerThread)
    return;
  m_workerThread->Wait();
  delete m_workerThread;
  m_workerThread = nullptr;
}
