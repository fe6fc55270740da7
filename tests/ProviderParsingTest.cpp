#include "GnomeMcp/Providers/Desktop.hpp"
#include "GnomeMcp/Utils/Error.hpp"
#include "GnomeMcp/Utils/Types.hpp"

#include "Providers/Linux/Factories.hpp"

#include "gtest/gtest.h"

using namespace gnome_mcp::utils::types;
using namespace gnome_mcp::providers;
using namespace gnome_mcp::providers::gnome;
using enum gnome_mcp::utils::error::GmcpErrorCode;

TEST(DesktopEntryTest, ParsesApplication) {
  const Option<ApplicationInfo> app = ParseDesktopEntry(
    "[Desktop Entry]\n"
    "Type=Application\n"
    "Name=Files\n"
    "Name[de]=Dateien\n"
    "Comment=Access and organize files\n"
    "Exec=nautilus --new-window %U\n"
    "Icon=org.gnome.Nautilus\n"
    "Categories=GNOME;GTK;Utility;Core;\n"
    "\n"
    "[Desktop Action new-window]\n"
    "Name=New Window\n",
    "org.gnome.Nautilus"
  );

  ASSERT_TRUE(app.has_value());
  EXPECT_EQ(app->id, "org.gnome.Nautilus");
  EXPECT_EQ(app->name, "Files");
  EXPECT_EQ(app->description, "Access and organize files");
  EXPECT_EQ(app->exec, "nautilus --new-window %U");
  EXPECT_EQ(app->categories, (Vec<String> { "GNOME", "GTK", "Utility", "Core" }));
}

TEST(DesktopEntryTest, SkipsHiddenAndNonApplications) {
  EXPECT_FALSE(ParseDesktopEntry("[Desktop Entry]\nType=Application\nName=Hidden\nNoDisplay=true\n", "hidden").has_value());
  EXPECT_FALSE(ParseDesktopEntry("[Desktop Entry]\nType=Link\nName=Website\nURL=https://example.com\n", "link").has_value());
  EXPECT_FALSE(ParseDesktopEntry("[Desktop Entry]\nType=Application\n", "nameless").has_value());
  EXPECT_FALSE(ParseDesktopEntry("", "empty").has_value());
}

TEST(WpctlVolumeTest, ParsesLevelAndMute) {
  Result<VolumeState> state = ParseWpctlVolume("Volume: 0.45\n");

  ASSERT_TRUE(state);
  EXPECT_EQ(state->level, 45);
  EXPECT_FALSE(state->muted);

  Result<VolumeState> muted = ParseWpctlVolume("Volume: 1.20 [MUTED]\n");

  ASSERT_TRUE(muted);
  EXPECT_EQ(muted->level, 120);
  EXPECT_TRUE(muted->muted);
}

TEST(WpctlVolumeTest, RejectsUnexpectedOutput) {
  Result<VolumeState> state = ParseWpctlVolume("Translate ID error: '@DEFAULT_AUDIO_SINK@' is not a valid ID");

  ASSERT_FALSE(state);
  EXPECT_EQ(state.error().code, ParseError);
}

TEST(ShellEvalTest, EmptyFailureMeansUnsafeModeOff) {
  Result<String> reply = InterpretEvalReply(false, "");

  ASSERT_FALSE(reply);
  EXPECT_EQ(reply.error().code, PermissionDenied);
}

TEST(ShellEvalTest, MissingWindowIsNotFound) {
  Result<String> reply = InterpretEvalReply(false, "Error: Window 42 not found");

  ASSERT_FALSE(reply);
  EXPECT_EQ(reply.error().code, NotFound);
}

TEST(ShellEvalTest, SuccessPassesResultThrough) {
  Result<String> reply = InterpretEvalReply(true, "true");

  ASSERT_TRUE(reply);
  EXPECT_EQ(*reply, "true");
}

TEST(WindowListTest, DecodesShellJson) {
  Result<Vec<WindowInfo>> windows = DecodeWindowList(
    R"([{"id":123,"title":"Terminal","wm_class":"gnome-terminal-server","workspace":1,)"
    R"("minimized":false,"maximized":true,"focused":true,"pid":4242}])"
  );

  ASSERT_TRUE(windows);
  ASSERT_EQ(windows->size(), 1u);
  EXPECT_EQ(windows->front().id, 123u);
  EXPECT_EQ(windows->front().wmClass, "gnome-terminal-server");
  EXPECT_EQ(windows->front().workspace, 1);
  EXPECT_TRUE(windows->front().focused);
}

TEST(WindowListTest, MalformedJsonIsParseError) {
  Result<Vec<WindowInfo>> windows = DecodeWindowList("[{\"id\":");

  ASSERT_FALSE(windows);
  EXPECT_EQ(windows.error().code, ParseError);
}

TEST(SourceDataTest, ClassifiesBackends) {
  EXPECT_EQ(ParseSourceData("[Data Source]\nDisplayName=Personal\nEnabled=true\n\n[Calendar]\nBackendName=local\n"), SourceKind::Calendar);
  EXPECT_EQ(ParseSourceData("[Data Source]\nDisplayName=Work\n\n[Task List]\nBackendName=caldav\n"), SourceKind::TaskList);
  EXPECT_EQ(ParseSourceData("[Data Source]\nDisplayName=Contacts\n\n[Address Book]\nBackendName=local\n"), SourceKind::AddressBook);
}

TEST(SourceDataTest, SkipsDisabledAndCollectionSources) {
  EXPECT_FALSE(ParseSourceData("[Data Source]\nEnabled=false\n\n[Calendar]\nBackendName=local\n").has_value());
  EXPECT_FALSE(ParseSourceData("[Data Source]\nDisplayName=Google\n\n[Collection]\nBackendName=google\n").has_value());
}
