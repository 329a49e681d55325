#ifndef WORKERTHREAD_H
#define WORKERTHREAD_H

#include <wx/thread.h>
#include <wx/event.h>
#include "PdfRenamerLogic.h" // RunParams, RunResult, FileOutcome

#include <atomic>

// Runs PdfRenamerLogic::performRun off the UI thread and forwards its
// callbacks to 'handler' as wxThreadEvents
class WorkerThread : public wxThread
{
public:
	WorkerThread(wxEvtHandler *handler, const RunParams &params);

	virtual ~WorkerThread() {};

	// Stops scheduling further files; the file in progress completes
	void RequestCancel() { m_cancelRequested = true; }

protected:
	virtual ExitCode Entry() override;

private:
	wxEvtHandler *m_handler;
	RunParams m_params;
	std::atomic<bool> m_cancelRequested;

	// Helper to post results back to the main thread
	void PostEvent(wxThreadEvent *event);
};

#endif // WORKERTHREAD_H
