#include "PdfRenamerLogic.h"

#include <wx/log.h>
#include <wx/string.h>

#include <vector>
#include <string>
#include <filesystem>
#include <optional>
#include <set>
#include <system_error> // For std::error_code
#include <stdexcept>	// For std::exception safety

namespace fs = std::filesystem;

namespace
{
	wxString U8(const std::string &s)
	{
		return wxString::FromUTF8(s.c_str());
	}

	bool SamePath(const fs::path &a, const fs::path &b)
	{
		std::error_code ec;
		if (fs::exists(a, ec) && fs::exists(b, ec))
		{
			bool same = fs::equivalent(a, b, ec);
			if (!ec)
				return same;
		}
		std::error_code ecA, ecB;
		fs::path ca = fs::weakly_canonical(a, ecA);
		fs::path cb = fs::weakly_canonical(b, ecB);
		if (ecA || ecB)
			return a.lexically_normal() == b.lexically_normal();
		return ca == cb;
	}

	// Moves the source to its new name inside the same directory
	bool RenameInPlace(const fs::path &source, const fs::path &target, std::string &error)
	{
		std::error_code targetExistEc, renameEc;
		bool targetExists = fs::exists(target, targetExistEc);
		if (targetExistEc)
		{
			error = "Filesystem error checking target path (" + target.u8string() + "): " + targetExistEc.message();
			return false;
		}
		if (targetExists)
		{
			// Resolution picked a free slot; something else created it since
			error = "Target path already exists (" + target.u8string() + ").";
			return false;
		}

		fs::rename(source, target, renameEc);
		if (renameEc)
		{
			error = "Rename failed: " + renameEc.message();
			return false;
		}
		return true;
	}

	// Copies bytes, then permissions and modification time. The source is never touched.
	bool CopyToOutput(const fs::path &source, const fs::path &target, std::string &error)
	{
		std::error_code copyEc;
		// copy_options::none fails instead of overwriting an existing target
		if (!fs::copy_file(source, target, fs::copy_options::none, copyEc) || copyEc)
		{
			error = "Copy failed: " + (copyEc ? copyEc.message() : std::string("unknown error"));
			return false;
		}

		std::error_code statusEc, permEc, timeEc;
		fs::file_status status = fs::status(source, statusEc);
		if (!statusEc)
		{
			fs::permissions(target, status.permissions(), fs::perm_options::replace, permEc);
		}
		fs::file_time_type writeTime = fs::last_write_time(source, timeEc);
		if (!timeEc)
		{
			fs::last_write_time(target, writeTime, timeEc);
		}
		if (statusEc || permEc || timeEc)
		{
			const std::error_code &ec = statusEc ? statusEc : (permEc ? permEc : timeEc);
			wxLogWarning("Copied '%s' but could not preserve its metadata: %s",
						 U8(source.filename().u8string()), U8(ec.message()));
		}
		return true;
	}
}

// Runs the whole batch: validate, scan a snapshot of the input folder, then
// extract, resolve and move/copy each file in order. Per-file failures become
// Error outcomes; only an invalid input folder or an output folder that cannot
// be created stop the run.
RunResult PdfRenamerLogic::performRun(const RunParams &params, const RunCallbacks &callbacks)
{
	RunResult results;

	// Input folder must exist and be a directory before anything else happens
	std::error_code ec;
	if (params.inputDirectory.empty() || !fs::exists(params.inputDirectory, ec) || ec ||
		!fs::is_directory(params.inputDirectory, ec) || ec)
	{
		results.fatalError = RunFailure::InputDirectoryInvalid;
		results.errorMessage = "Input folder is invalid or inaccessible: " + params.inputDirectory.u8string() + (ec ? " (" + ec.message() + ")" : "");
		wxLogError("%s", U8(results.errorMessage));
		return results;
	}

	const fs::path inputDir = params.inputDirectory;
	bool inPlace = params.inPlace || params.outputDirectory.empty() ||
				   SamePath(params.inputDirectory, params.outputDirectory);
	const fs::path outputDir = inPlace ? inputDir : params.outputDirectory;
	results.inPlace = inPlace;

	if (!inPlace)
	{
		std::error_code mkdirEc;
		fs::create_directories(outputDir, mkdirEc);
		if (mkdirEc || !fs::is_directory(outputDir, ec))
		{
			results.fatalError = RunFailure::OutputDirectoryCreationError;
			results.errorMessage = "Cannot create output folder: " + outputDir.u8string() + (mkdirEc ? " (" + mkdirEc.message() + ")" : "");
			wxLogError("%s", U8(results.errorMessage));
			return results;
		}
	}

	wxLogMessage("Scanning folder: %s", U8(inputDir.u8string()));
	wxLogMessage("Output folder: %s", U8(outputDir.u8string()));
	wxLogMessage("Mode: %s", inPlace ? "In-place Rename" : "Copy and Rename");

	// Snapshot of the work list; files added later in the run are not seen
	std::error_code scanEc;
	std::vector<fs::path> pdfFiles = CollectPdfFiles(inputDir, scanEc);
	if (scanEc)
	{
		results.fatalError = RunFailure::InputDirectoryInvalid;
		results.errorMessage = "Cannot read input folder: " + inputDir.u8string() + " (" + scanEc.message() + ")";
		wxLogError("%s", U8(results.errorMessage));
		return results;
	}

	const int total = static_cast<int>(pdfFiles.size());
	results.summary.totalFiles = total;
	if (total == 0)
	{
		wxLogMessage("No PDF files found in the input folder.");
	}
	else
	{
		wxLogMessage("Found %d PDF file(s)", total);
	}

	const int maxLength = params.maxFilenameLength;
	std::set<std::string> assignedNames;
	int current = 0;

	for (const auto &sourcePath : pdfFiles)
	{
		if (callbacks.isCancelled && callbacks.isCancelled())
		{
			results.summary.cancelled = true;
			wxLogMessage("Run cancelled after %d of %d file(s).", current, total);
			break;
		}

		FileOutcome outcome;
		outcome.SourcePath = sourcePath;

		try
		{
			// Names are UTF-8 throughout; the native path encoding is only used by std::filesystem
			outcome.FileName = sourcePath.filename().u8string();

			std::optional<std::string> title;
			bool parsed = true;
			try
			{
				title = ExtractTitleFromPdf(sourcePath, params.reader);
			}
			catch (const PdfParseError &ex)
			{
				parsed = false;
				outcome.Kind = OutcomeKind::Error;
				outcome.ErrorType = ErrorKind::ParseError;
				outcome.Detail = ex.what();
			}

			// A parse failure is an error outcome, never a missing title
			if (parsed && !title)
			{
				outcome.Kind = OutcomeKind::SkippedNoTitle;
				outcome.Detail = "Could not find 'Title' line on page 1.";
			}
			else if (parsed)
			{
				const std::string baseName = SanitizeFilename(*title, maxLength);
				const std::string newName = ResolveOutputName(baseName, outputDir, assignedNames,
															  inPlace ? sourcePath : fs::path());
				assignedNames.insert(newName);
				outcome.TargetPath = outputDir / fs::u8path(newName);

				if (inPlace && outcome.TargetPath.lexically_normal() == sourcePath.lexically_normal())
				{
					outcome.Kind = OutcomeKind::SkippedAlreadyCorrect;
					outcome.Detail = "Already correctly named.";
				}
				else
				{
					std::string error;
					bool ok = inPlace ? RenameInPlace(sourcePath, outcome.TargetPath, error)
									  : CopyToOutput(sourcePath, outcome.TargetPath, error);
					if (ok)
					{
						outcome.Kind = inPlace ? OutcomeKind::Renamed : OutcomeKind::Copied;
						outcome.Detail = newName;
					}
					else
					{
						outcome.Kind = OutcomeKind::Error;
						outcome.ErrorType = ErrorKind::FilesystemError;
						outcome.Detail = error;
					}
				}
			}
		}
		catch (const fs::filesystem_error &ex)
		{
			std::string errMsg = "Filesystem Exception: " + std::string(ex.what());
			if (!ex.path1().empty())
				errMsg += " (Path1: " + ex.path1().u8string() + ")";
			if (!ex.path2().empty())
				errMsg += " (Path2: " + ex.path2().u8string() + ")";
			outcome.Kind = OutcomeKind::Error;
			outcome.ErrorType = ErrorKind::FilesystemError;
			outcome.Detail = errMsg;
		}
		catch (const std::exception &ex)
		{
			// Anything else thrown while reading the document is a parse failure
			outcome.Kind = OutcomeKind::Error;
			outcome.ErrorType = ErrorKind::ParseError;
			outcome.Detail = "General Exception: " + std::string(ex.what());
		}

		switch (outcome.Kind)
		{
		case OutcomeKind::Renamed:
		case OutcomeKind::Copied:
			results.summary.processedCount++;
			wxLogMessage("%s '%s' -> '%s'", PdfRenamerLogic::OutcomeLabel(outcome.Kind),
						 U8(outcome.FileName), U8(outcome.Detail));
			break;
		case OutcomeKind::SkippedNoTitle:
		case OutcomeKind::SkippedAlreadyCorrect:
			results.summary.skippedCount++;
			wxLogMessage("Skipping '%s': %s", U8(outcome.FileName), U8(outcome.Detail));
			break;
		case OutcomeKind::Error:
			results.summary.errorCount++;
			wxLogWarning("Error processing '%s' (%s): %s", U8(outcome.FileName),
						 outcome.ErrorType == ErrorKind::ParseError ? "parse error" : "filesystem error",
						 U8(outcome.Detail));
			break;
		}

		results.outcomes.push_back(outcome);
		if (callbacks.onFileEvent)
			callbacks.onFileEvent(outcome);

		++current;
		if (callbacks.onProgress)
			callbacks.onProgress(current, total);
	}

	wxLogMessage("Process complete: %d processed, %d skipped, %d errors",
				 results.summary.processedCount, results.summary.skippedCount, results.summary.errorCount);

	results.success = true;
	if (callbacks.onSummary)
		callbacks.onSummary(results.summary);
	return results;
}
