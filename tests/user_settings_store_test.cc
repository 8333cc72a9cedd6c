#include "test_support.h"
#include <core/storage/user_settings_store.h>
#include <fstream>

using namespace fileferry::core;
using namespace fileferry::test;

TEST(UserSettingsStoreTest, MissingValuesFallBackToDefaults) {
    TempDir dir;
    UserSettingsStore store(dir.path());
    EXPECT_EQ(store.GetPrefix("42"), "");
    EXPECT_EQ(store.GetUploadMode("42"), UploadMode::kAuto);
    EXPECT_FALSE(store.GetCaption("42").has_value());
    EXPECT_FALSE(store.GetThumbnail("42").has_value());
}

TEST(UserSettingsStoreTest, ValuesPersistAcrossInstances) {
    TempDir dir;
    {
        UserSettingsStore store(dir.path());
        EXPECT_TRUE(store.SetPrefix("42", "[HD] "));
        EXPECT_TRUE(store.SetCaption("42", "Uploaded by 42"));
        EXPECT_TRUE(store.SetUploadMode("42", UploadMode::kVideo));
        EXPECT_TRUE(store.SetPrefix("7", "@seven "));
    }
    UserSettingsStore store(dir.path());
    EXPECT_EQ(store.GetPrefix("42"), "[HD] ");
    EXPECT_EQ(store.GetPrefix("7"), "@seven ");
    EXPECT_EQ(store.GetCaption("42"), "Uploaded by 42");
    EXPECT_EQ(store.GetUploadMode("42"), UploadMode::kVideo);

    std::ifstream ifs(dir.path() / "preferences.json");
    auto preferences = nlohmann::json::parse(ifs);
    EXPECT_EQ(preferences["42"], "video");
}

TEST(UserSettingsStoreTest, CorruptFileReadsAsEmpty) {
    TempDir dir;
    std::ofstream(dir.path() / "prefixes.json") << "{not json";
    UserSettingsStore store(dir.path());
    EXPECT_EQ(store.GetPrefix("42"), "");

    EXPECT_TRUE(store.SetPrefix("42", "x"));
    EXPECT_EQ(store.GetPrefix("42"), "x");
}

TEST(UserSettingsStoreTest, UnknownUploadModeMeansAuto) {
    TempDir dir;
    std::ofstream(dir.path() / "preferences.json") << R"({"42": "hologram"})";
    UserSettingsStore store(dir.path());
    EXPECT_EQ(store.GetUploadMode("42"), UploadMode::kAuto);
}

TEST(UserSettingsStoreTest, ThumbnailIsStoredAsAPrivateCopy) {
    TempDir dir;
    UserSettingsStore store(dir.path() / "settings");
    auto image = dir.path() / "holiday.jpg";
    std::ofstream(image) << "jpeg";

    ASSERT_TRUE(store.SetThumbnail("42", image));
    auto thumbnail = store.GetThumbnail("42");
    ASSERT_TRUE(thumbnail.has_value());
    EXPECT_NE(thumbnail->string(), image.string());
    EXPECT_EQ(thumbnail->parent_path().filename().string(), "thumbnails");
    EXPECT_EQ(thumbnail->extension().string(), ".jpg");

    EXPECT_TRUE(store.DeleteThumbnail("42"));
    EXPECT_FALSE(std::filesystem::exists(*thumbnail));
    EXPECT_TRUE(std::filesystem::exists(image));
    EXPECT_FALSE(store.GetThumbnail("42").has_value());
    EXPECT_FALSE(store.DeleteThumbnail("42"));
}

TEST(UserSettingsStoreTest, MissingImageIsNotStored) {
    TempDir dir;
    UserSettingsStore store(dir.path());
    EXPECT_FALSE(store.SetThumbnail("42", dir.path() / "missing.jpg"));
    EXPECT_FALSE(store.GetThumbnail("42").has_value());
}

TEST(UserSettingsStoreTest, ReplacingAThumbnailDropsTheOldCopy) {
    TempDir dir;
    UserSettingsStore store(dir.path());
    auto first = dir.path() / "first.png";
    auto second = dir.path() / "second.jpg";
    std::ofstream(first) << "png";
    std::ofstream(second) << "jpeg";

    ASSERT_TRUE(store.SetThumbnail("42", first));
    auto first_copy = *store.GetThumbnail("42");
    ASSERT_TRUE(store.SetThumbnail("42", second));

    EXPECT_FALSE(std::filesystem::exists(first_copy));
    EXPECT_EQ(store.GetThumbnail("42")->extension().string(), ".jpg");
    EXPECT_TRUE(std::filesystem::exists(first));
    EXPECT_TRUE(std::filesystem::exists(second));
}

// A thumbnails.json entry pointing outside the store (written by hand or by an older
// version) is forgotten without deleting the file.
TEST(UserSettingsStoreTest, DeleteNeverRemovesFilesOutsideTheStore) {
    TempDir dir;
    auto photo = dir.path() / "holiday.jpg";
    std::ofstream(photo) << "jpeg";
    nlohmann::json entries{{"42", photo.string()}};
    std::filesystem::create_directories(dir.path() / "settings");
    std::ofstream(dir.path() / "settings" / "thumbnails.json") << entries.dump();

    UserSettingsStore store(dir.path() / "settings");
    ASSERT_TRUE(store.GetThumbnail("42").has_value());
    EXPECT_TRUE(store.DeleteThumbnail("42"));
    EXPECT_TRUE(std::filesystem::exists(photo));
    EXPECT_FALSE(store.GetThumbnail("42").has_value());
}

TEST(UploadModeTest, AutoResolvesByExtension) {
    EXPECT_EQ(ResolveUploadMode(UploadMode::kAuto, "a.MKV"), MediaKind::kVideo);
    EXPECT_EQ(ResolveUploadMode(UploadMode::kAuto, "a.mp3"), MediaKind::kAudio);
    EXPECT_EQ(ResolveUploadMode(UploadMode::kAuto, "a.png"), MediaKind::kPhoto);
    EXPECT_EQ(ResolveUploadMode(UploadMode::kAuto, "archive.tar.gz"), MediaKind::kDocument);
    EXPECT_EQ(ResolveUploadMode(UploadMode::kAuto, "README"), MediaKind::kDocument);
    EXPECT_EQ(ResolveUploadMode(UploadMode::kAudio, "a.mkv"), MediaKind::kAudio);
    EXPECT_FALSE(SupportsThumbnail(MediaKind::kPhoto));
}
