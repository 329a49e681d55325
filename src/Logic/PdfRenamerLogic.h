#ifndef PDFRENAMERLOGIC_H
#define PDFRENAMERLOGIC_H

#include <vector>
#include <string>
#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;

// Per-file result tag reported for every file in the work list
enum class OutcomeKind
{
	Renamed,
	Copied,
	SkippedNoTitle,
	SkippedAlreadyCorrect,
	Error
};

// Sub-category of OutcomeKind::Error
enum class ErrorKind
{
	None,
	ParseError,
	FilesystemError
};

// Conditions that abort a whole run before any file is processed
enum class RunFailure
{
	None,
	InputDirectoryInvalid,
	OutputDirectoryCreationError
};

// Raised by the first-page text reader when a document cannot be parsed
// (corrupt, encrypted, no pages)
class PdfParseError : public std::runtime_error
{
public:
	explicit PdfParseError(const std::string &message) : std::runtime_error(message) {}
};

using FirstPageTextReader = std::function<std::string(const fs::path &)>;

struct FileOutcome
{
	std::string FileName;
	fs::path SourcePath;
	fs::path TargetPath; // Empty when no target was resolved
	OutcomeKind Kind = OutcomeKind::Error;
	ErrorKind ErrorType = ErrorKind::None;
	std::string Detail;
};

struct RunSummary
{
	int processedCount = 0; // Renamed + Copied
	int skippedCount = 0;	// SkippedNoTitle + SkippedAlreadyCorrect
	int errorCount = 0;
	int totalFiles = 0;
	bool cancelled = false;
};

// Event sinks the shell provides. Any member may be left empty.
struct RunCallbacks
{
	std::function<void(const FileOutcome &)> onFileEvent;
	std::function<void(int current, int total)> onProgress;
	std::function<void(const RunSummary &)> onSummary;
	std::function<bool()> isCancelled; // Polled between files only
};

struct RunParams
{
	fs::path inputDirectory;
	fs::path outputDirectory; // Empty or equal to inputDirectory means in-place
	bool inPlace = false;
	int maxFilenameLength = 255;
	FirstPageTextReader reader; // Defaults to ReadFirstPageText when empty
};

struct RunResult
{
	bool success = false;
	bool inPlace = false;
	RunFailure fatalError = RunFailure::None;
	std::string errorMessage;
	RunSummary summary;
	std::vector<FileOutcome> outcomes;
};

std::string ToLower(std::string s);

class PdfRenamerLogic
{
public:
	// Title extraction
	static std::optional<std::string> ExtractTitle(const std::string &pageText);
	static std::string ReadFirstPageText(const fs::path &pdfPath);
	static std::optional<std::string> ExtractTitleFromPdf(const fs::path &pdfPath, const FirstPageTextReader &reader);

	// Filename derivation
	static std::string SanitizeFilename(const std::string &rawTitle, int maxLength);
	static std::string ResolveOutputName(const std::string &baseName,
										 const fs::path &targetDir,
										 const std::set<std::string> &assignedInRun,
										 const fs::path &selfPath = fs::path());

	// Scanning
	static bool HasPdfExtension(const fs::path &path);
	static std::vector<fs::path> CollectPdfFiles(const fs::path &directory, std::error_code &ec);
	static int CountPdfFiles(const fs::path &directory);

	// Orchestration
	static RunResult performRun(const RunParams &params, const RunCallbacks &callbacks = RunCallbacks());

	// String helpers
	static bool iequals(const std::string &a, const std::string &b);
	static std::string Trim(const std::string &s);
	static std::vector<std::string> SplitLines(const std::string &text);
	static std::string TruncateUtf8(const std::string &s, std::size_t maxCodePoints);
	static std::size_t Utf8Length(const std::string &s);

	static const char *OutcomeLabel(OutcomeKind kind);

	static const std::string DefaultTitle;
	static const std::string PdfExtension;
	static const int DefaultMaxFilenameLength;
};

#endif // PDFRENAMERLOGIC_H
