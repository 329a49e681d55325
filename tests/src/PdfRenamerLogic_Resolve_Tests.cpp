#include "pch.h"
#include "TestFixtures.h"
#include "../../src/Logic/PdfRenamerLogic.h"
#include <set>
#include <string>

TEST(PdfRenamerSanitize, RemovesIllegalCharacters)
{
    EXPECT_EQ(PdfRenamerLogic::SanitizeFilename("a\\b/c:d*e?f\"g<h>i|j", 255), "abcdefghij");
    EXPECT_EQ(PdfRenamerLogic::SanitizeFilename("Model: X/Y <Rev?>", 255), "Model XY Rev");
}

TEST(PdfRenamerSanitize, StripsSpacesAndDotsAtBothEnds)
{
    EXPECT_EQ(PdfRenamerLogic::SanitizeFilename("  ..Report..  ", 255), "Report");
    EXPECT_EQ(PdfRenamerLogic::SanitizeFilename("v1.2 Guide.", 255), "v1.2 Guide");
    EXPECT_EQ(PdfRenamerLogic::SanitizeFilename(". Inner . Dots .", 255), "Inner . Dots");
}

TEST(PdfRenamerSanitize, FallsBackToDefaultTitle)
{
    EXPECT_EQ(PdfRenamerLogic::SanitizeFilename("", 255), "Untitled Manual");
    EXPECT_EQ(PdfRenamerLogic::SanitizeFilename("???", 255), "Untitled Manual");
    EXPECT_EQ(PdfRenamerLogic::SanitizeFilename(" . . ", 255), "Untitled Manual");
    EXPECT_EQ(PdfRenamerLogic::SanitizeFilename("/:*", 255), PdfRenamerLogic::DefaultTitle);
}

TEST(PdfRenamerSanitize, TruncatesToMaxLength)
{
    std::string longTitle(300, 'a');
    std::string result = PdfRenamerLogic::SanitizeFilename(longTitle, 255);
    EXPECT_EQ(result.size(), 255u);

    EXPECT_EQ(PdfRenamerLogic::SanitizeFilename("Hello World", 5), "Hello");
}

TEST(PdfRenamerSanitize, TrailingWhitespaceRemovedAfterTruncation)
{
    EXPECT_EQ(PdfRenamerLogic::SanitizeFilename("abc def", 4), "abc");
}

TEST(PdfRenamerSanitize, NonPositiveLengthClampsToOne)
{
    EXPECT_EQ(PdfRenamerLogic::SanitizeFilename("abc", 0), "a");
    EXPECT_EQ(PdfRenamerLogic::SanitizeFilename("abc", -7), "a");
}

TEST(PdfRenamerSanitize, LengthCountsCodePoints)
{
    // "Ünïcödé" is 7 code points in 11 bytes
    const std::string title = "\xC3\x9Cn\xC3\xAF" "c\xC3\xB6" "d\xC3\xA9";
    EXPECT_EQ(PdfRenamerLogic::SanitizeFilename(title, 7), title);
    EXPECT_EQ(PdfRenamerLogic::SanitizeFilename(title, 3), "\xC3\x9Cn\xC3\xAF");
}

TEST(PdfRenamerSanitize, ResultNeverContainsIllegalCharacters)
{
    const std::string inputs[] = {"a|b", "  <x>  ", "\"quoted\"", "path\\to/file", "...", "ok"};
    for (const auto &input : inputs)
    {
        std::string out = PdfRenamerLogic::SanitizeFilename(input, 255);
        EXPECT_FALSE(out.empty()) << input;
        EXPECT_EQ(out.find_first_of("\\/:*?\"<>|"), std::string::npos) << input;
        EXPECT_NE(out.front(), ' ') << input;
        EXPECT_NE(out.front(), '.') << input;
        EXPECT_NE(out.back(), ' ') << input;
        EXPECT_NE(out.back(), '.') << input;
    }
}

TEST_F(PdfRenamerFilesystemTest, ResolveReturnsBaseNameWhenFree)
{
    std::set<std::string> assigned;
    EXPECT_EQ(PdfRenamerLogic::ResolveOutputName("Manual", tempTestDir, assigned), "Manual.pdf");
}

TEST_F(PdfRenamerFilesystemTest, ResolveAppendsCounterForExistingFiles)
{
    std::set<std::string> assigned;
    CreateDummyFile(tempTestDir / "Manual.pdf", "x");
    EXPECT_EQ(PdfRenamerLogic::ResolveOutputName("Manual", tempTestDir, assigned), "Manual (1).pdf");

    CreateDummyFile(tempTestDir / "Manual (1).pdf", "x");
    EXPECT_EQ(PdfRenamerLogic::ResolveOutputName("Manual", tempTestDir, assigned), "Manual (2).pdf");
}

TEST_F(PdfRenamerFilesystemTest, ResolveSkipsNamesAssignedInRun)
{
    std::set<std::string> assigned = {"Manual.pdf", "Manual (1).pdf"};
    EXPECT_EQ(PdfRenamerLogic::ResolveOutputName("Manual", tempTestDir, assigned), "Manual (2).pdf");
}

TEST_F(PdfRenamerFilesystemTest, ResolveCounterSkipsGaps)
{
    std::set<std::string> assigned = {"Guide (1).pdf"};
    CreateDummyFile(tempTestDir / "Guide.pdf", "x");
    CreateDummyFile(tempTestDir / "Guide (2).pdf", "x");
    EXPECT_EQ(PdfRenamerLogic::ResolveOutputName("Guide", tempTestDir, assigned), "Guide (3).pdf");
}

TEST_F(PdfRenamerFilesystemTest, ResolveTreatsOwnPathAsFree)
{
    std::set<std::string> assigned;
    fs::path self = tempTestDir / "Manual.pdf";
    CreateDummyFile(self, "x");
    EXPECT_EQ(PdfRenamerLogic::ResolveOutputName("Manual", tempTestDir, assigned, self), "Manual.pdf");

    // Another file's path does not free the slot
    EXPECT_EQ(PdfRenamerLogic::ResolveOutputName("Manual", tempTestDir, assigned, tempTestDir / "other.pdf"), "Manual (1).pdf");
}

TEST_F(PdfRenamerFilesystemTest, ResolveDoesNotModifyDirectory)
{
    std::set<std::string> assigned;
    PdfRenamerLogic::ResolveOutputName("Manual", tempTestDir, assigned);
    EXPECT_TRUE(fs::is_empty(tempTestDir));
}
