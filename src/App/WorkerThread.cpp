#include <wx/wxprec.h>

#ifndef WX_PRECOMP
#include <wx/wx.h>
#endif

#include "WorkerThread.h"
#include "PdfRenamerLogic.h"
#include "MainFrame.h" // Needed for the event types

WorkerThread::WorkerThread(wxEvtHandler *handler, const RunParams &params)
    : wxThread(wxTHREAD_JOINABLE),
      m_handler(handler),
      m_params(params),
      m_cancelRequested(false)
{
}

// Hands the event to the UI thread, which takes ownership
void WorkerThread::PostEvent(wxThreadEvent *event)
{
    if (m_handler)
    {
        wxQueueEvent(m_handler, event);
    }
    else
    {
        wxLogDebug("WorkerThread::PostEvent: Handler is null, dropping event.");
        delete event;
    }
}

wxThread::ExitCode WorkerThread::Entry()
{
    RunCallbacks callbacks;
    callbacks.onFileEvent = [this](const FileOutcome &outcome)
    {
        wxThreadEvent *event = new wxThreadEvent(EVT_FILE_PROCESSED);
        event->SetPayload(outcome);
        PostEvent(event);
    };
    callbacks.onProgress = [this](int current, int total)
    {
        wxThreadEvent *event = new wxThreadEvent(EVT_PROGRESS_UPDATE);
        event->SetInt(current);
        event->SetExtraLong(total);
        PostEvent(event);
    };
    // The summary travels inside the RunResult posted below
    callbacks.isCancelled = [this]()
    {
        return m_cancelRequested.load() || TestDestroy();
    };

    RunResult result;
    try
    {
        result = PdfRenamerLogic::performRun(m_params, callbacks);
    }
    catch (const std::exception &e)
    {
        wxLogError("Unhandled std::exception in worker thread: %s", e.what());
        result.success = false;
        result.errorMessage = "FATAL EXCEPTION: " + std::string(e.what());
    }

    wxThreadEvent *done = new wxThreadEvent(EVT_RUN_COMPLETE);
    done->SetPayload(result);
    PostEvent(done);
    return (ExitCode)0;
}
