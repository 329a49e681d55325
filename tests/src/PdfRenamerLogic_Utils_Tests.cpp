#include "pch.h"
#include "TestFixtures.h"
#include "../../src/Logic/PdfRenamerLogic.h"
#include <string>
#include <vector>

TEST(PdfRenamerUtils, ToLowerFunction)
{
    EXPECT_EQ(ToLower("HELLO WORLD"), "hello world");
    EXPECT_EQ(ToLower(".PDF"), ".pdf");
    EXPECT_EQ(ToLower(""), "");
}

TEST(PdfRenamerUtils, IEquals)
{
    EXPECT_TRUE(PdfRenamerLogic::iequals("Title", "title"));
    EXPECT_TRUE(PdfRenamerLogic::iequals("TITLE", "tItLe"));
    EXPECT_FALSE(PdfRenamerLogic::iequals("Title", "Titles"));
    EXPECT_FALSE(PdfRenamerLogic::iequals("Title", ""));
    EXPECT_TRUE(PdfRenamerLogic::iequals("", ""));
}

TEST(PdfRenamerUtils, Trim)
{
    EXPECT_EQ(PdfRenamerLogic::Trim("  abc  "), "abc");
    EXPECT_EQ(PdfRenamerLogic::Trim("\t\r abc def \r\n"), "abc def");
    EXPECT_EQ(PdfRenamerLogic::Trim("   "), "");
    EXPECT_EQ(PdfRenamerLogic::Trim(""), "");
}

TEST(PdfRenamerUtils, TrimUnicodeSpaces)
{
    // U+00A0 no-break space
    EXPECT_EQ(PdfRenamerLogic::Trim("Title\xC2\xA0"), "Title");
    EXPECT_EQ(PdfRenamerLogic::Trim("\xC2\xA0 Pump Manual\xC2\xA0"), "Pump Manual");
    // U+2003 em space, U+3000 ideographic space, U+FEFF byte order mark
    EXPECT_EQ(PdfRenamerLogic::Trim("\xE2\x80\x83" "abc" "\xE3\x80\x80"), "abc");
    EXPECT_EQ(PdfRenamerLogic::Trim("\xEF\xBB\xBF" "Title"), "Title");
    // Spaces inside the text are kept
    EXPECT_EQ(PdfRenamerLogic::Trim("a\xC2\xA0" "b"), "a\xC2\xA0" "b");
    EXPECT_EQ(PdfRenamerLogic::Trim("\xC2\xA0\xE2\x80\x8A"), "");
    // Other multi-byte characters are not spaces
    EXPECT_EQ(PdfRenamerLogic::Trim("\xC3\x9C" "berblick"), "\xC3\x9C" "berblick");
}

TEST(PdfRenamerUtils, SplitLines)
{
    std::vector<std::string> expected = {"a", "", "b"};
    EXPECT_EQ(PdfRenamerLogic::SplitLines("a\n\nb"), expected);
    EXPECT_EQ(PdfRenamerLogic::SplitLines("a\n\nb\n"), expected);
    EXPECT_TRUE(PdfRenamerLogic::SplitLines("").empty());
    EXPECT_EQ(PdfRenamerLogic::SplitLines("single").size(), 1u);
}

TEST(PdfRenamerUtils, Utf8LengthAndTruncate)
{
    const std::string ascii = "Manual";
    const std::string accented = "Caf\xC3\xA9 Men\xC3\xBC"; // "Café Menü"

    EXPECT_EQ(PdfRenamerLogic::Utf8Length(ascii), 6u);
    EXPECT_EQ(PdfRenamerLogic::Utf8Length(accented), 9u);
    EXPECT_EQ(PdfRenamerLogic::TruncateUtf8(accented, 4), "Caf\xC3\xA9");
    EXPECT_EQ(PdfRenamerLogic::TruncateUtf8(accented, 100), accented);
    EXPECT_EQ(PdfRenamerLogic::TruncateUtf8(ascii, 0), "");
}

TEST(PdfRenamerUtils, HasPdfExtension)
{
    EXPECT_TRUE(PdfRenamerLogic::HasPdfExtension("manual.pdf"));
    EXPECT_TRUE(PdfRenamerLogic::HasPdfExtension("MANUAL.PDF"));
    EXPECT_TRUE(PdfRenamerLogic::HasPdfExtension("Mixed.Pdf"));
    EXPECT_FALSE(PdfRenamerLogic::HasPdfExtension("notes.txt"));
    EXPECT_FALSE(PdfRenamerLogic::HasPdfExtension("archive.pdf.zip"));
    EXPECT_FALSE(PdfRenamerLogic::HasPdfExtension("pdf"));
}

TEST(PdfRenamerUtils, OutcomeLabels)
{
    EXPECT_STREQ(PdfRenamerLogic::OutcomeLabel(OutcomeKind::Renamed), "Renamed");
    EXPECT_STREQ(PdfRenamerLogic::OutcomeLabel(OutcomeKind::Copied), "Copied");
    EXPECT_STREQ(PdfRenamerLogic::OutcomeLabel(OutcomeKind::Error), "Error");
}

TEST_F(PdfRenamerFilesystemTest, CollectPdfFilesIsFlatFilteredAndSorted)
{
    CreateDummyFile(tempTestDir / "b.pdf");
    CreateDummyFile(tempTestDir / "A.PDF");
    CreateDummyFile(tempTestDir / "c.txt");
    CreateDummyFile(tempTestDir / "nested" / "d.pdf");
    fs::create_directories(tempTestDir / "folder.pdf");

    std::error_code ec;
    std::vector<fs::path> files = PdfRenamerLogic::CollectPdfFiles(tempTestDir, ec);
    ASSERT_FALSE(ec);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].filename(), fs::path("A.PDF"));
    EXPECT_EQ(files[1].filename(), fs::path("b.pdf"));
}

TEST_F(PdfRenamerFilesystemTest, CollectPdfFilesReportsMissingDirectory)
{
    std::error_code ec;
    std::vector<fs::path> files = PdfRenamerLogic::CollectPdfFiles(tempTestDir / "missing", ec);
    EXPECT_TRUE(ec);
    EXPECT_TRUE(files.empty());
}

TEST_F(PdfRenamerFilesystemTest, CountPdfFiles)
{
    EXPECT_EQ(PdfRenamerLogic::CountPdfFiles(tempTestDir), 0);
    CreateDummyFile(tempTestDir / "one.pdf");
    CreateDummyFile(tempTestDir / "two.pdf");
    CreateDummyFile(tempTestDir / "skip.doc");
    EXPECT_EQ(PdfRenamerLogic::CountPdfFiles(tempTestDir), 2);
    EXPECT_EQ(PdfRenamerLogic::CountPdfFiles(tempTestDir / "missing"), 0);
    EXPECT_EQ(PdfRenamerLogic::CountPdfFiles(fs::path()), 0);
}
