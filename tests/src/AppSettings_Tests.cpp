#include "pch.h"
#include "../../src/Logic/AppSettings.h"
#include <wx/fileconf.h>
#include <wx/sstream.h>
#include <climits>

TEST(AppSettings, DefaultsWhenConfigIsEmpty)
{
    wxStringInputStream is("");
    wxFileConfig cfg(is);

    AppSettings settings = AppSettings::Load(&cfg);
    EXPECT_EQ(settings.maxFilenameLength, 255);
    EXPECT_EQ(settings.logLevel, "INFO");
    EXPECT_TRUE(settings.logToFile);
    EXPECT_FALSE(cfg.Exists("/Settings/MaxFilenameLength"));
}

TEST(AppSettings, DefaultsWrittenBackOnFirstRun)
{
    wxStringInputStream is("");
    wxFileConfig cfg(is);

    AppSettings::Load(&cfg, true);
    EXPECT_TRUE(cfg.Exists("/Settings/MaxFilenameLength"));
    EXPECT_TRUE(cfg.Exists("/Settings/LogLevel"));
    EXPECT_TRUE(cfg.Exists("/Settings/LogToFile"));
    EXPECT_EQ(cfg.ReadLong("/Settings/MaxFilenameLength", 0), 255);
}

TEST(AppSettings, ReadsStoredValues)
{
    wxStringInputStream is("[Settings]\nMaxFilenameLength=80\nLogLevel=debug\nLogToFile=0\n");
    wxFileConfig cfg(is);

    AppSettings settings = AppSettings::Load(&cfg);
    EXPECT_EQ(settings.maxFilenameLength, 80);
    EXPECT_EQ(settings.logLevel, "debug");
    EXPECT_FALSE(settings.logToFile);
}

TEST(AppSettings, NonPositiveLengthClampedToOne)
{
    wxStringInputStream is("[Settings]\nMaxFilenameLength=-4\n");
    wxFileConfig cfg(is);

    AppSettings settings = AppSettings::Load(&cfg);
    EXPECT_EQ(settings.maxFilenameLength, 1);
}

TEST(AppSettings, MaxLengthRange)
{
    EXPECT_FALSE(AppSettings::IsValidMaxFilenameLength(0));
    EXPECT_FALSE(AppSettings::IsValidMaxFilenameLength(-1));
    EXPECT_TRUE(AppSettings::IsValidMaxFilenameLength(1));
    EXPECT_TRUE(AppSettings::IsValidMaxFilenameLength(255));
    EXPECT_TRUE(AppSettings::IsValidMaxFilenameLength(INT_MAX));
#if LONG_MAX > INT_MAX
    // Would wrap to a negative int
    EXPECT_FALSE(AppSettings::IsValidMaxFilenameLength(3000000000L));
    EXPECT_FALSE(AppSettings::IsValidMaxFilenameLength(static_cast<long>(INT_MAX) + 1));
#endif
}

#if LONG_MAX > INT_MAX
TEST(AppSettings, OversizedLengthClampedToIntMax)
{
    wxStringInputStream is("[Settings]\nMaxFilenameLength=3000000000\n");
    wxFileConfig cfg(is);

    AppSettings settings = AppSettings::Load(&cfg);
    EXPECT_EQ(settings.maxFilenameLength, INT_MAX);
}
#endif

TEST(AppSettings, SaveThenLoad)
{
    wxStringInputStream is("");
    wxFileConfig cfg(is);

    AppSettings original;
    original.maxFilenameLength = 120;
    original.logLevel = "WARNING";
    original.logToFile = false;
    original.Save(&cfg);

    AppSettings loaded = AppSettings::Load(&cfg);
    EXPECT_EQ(loaded.maxFilenameLength, 120);
    EXPECT_EQ(loaded.logLevel, "WARNING");
    EXPECT_FALSE(loaded.logToFile);
}

TEST(AppSettings, NullConfigGivesDefaults)
{
    AppSettings settings = AppSettings::Load(nullptr, true);
    EXPECT_EQ(settings.maxFilenameLength, 255);
    EXPECT_TRUE(settings.logToFile);
}

TEST(AppSettings, ParseLogLevel)
{
    EXPECT_EQ(AppSettings::ParseLogLevel("DEBUG"), wxLOG_Debug);
    EXPECT_EQ(AppSettings::ParseLogLevel("debug"), wxLOG_Debug);
    EXPECT_EQ(AppSettings::ParseLogLevel("INFO"), wxLOG_Info);
    EXPECT_EQ(AppSettings::ParseLogLevel(" Warning "), wxLOG_Warning);
    EXPECT_EQ(AppSettings::ParseLogLevel("ERROR"), wxLOG_Error);
    EXPECT_EQ(AppSettings::ParseLogLevel("verbose"), wxLOG_Info);
    EXPECT_EQ(AppSettings::ParseLogLevel(""), wxLOG_Info);
}

TEST(AppSettings, LogFileNamedAfterTool)
{
    wxString path = AppSettings::LogFilePath();
    EXPECT_TRUE(path.EndsWith("pdf_renamer.log"));
}
