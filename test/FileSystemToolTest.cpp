#include "BaseTestFixture.h"
#include "FileSystemTool.hpp"
#include <set>

class FileSystemToolTest : public BaseTestFixture {};

TEST(PathClassifierTest, AcceptsSupportedExtensions) {
    for (const char* name : {"a.jpg", "a.jpeg", "a.png", "a.gif", "a.bmp", "a.tiff", "a.webp"}) {
        EXPECT_TRUE(FileSystemTool::isImageFile(name)) << name;
    }
}

TEST(PathClassifierTest, IsCaseInsensitive) {
    EXPECT_TRUE(FileSystemTool::isImageFile("/photos/IMG_0001.JPG"));
    EXPECT_TRUE(FileSystemTool::isImageFile("scan.TiFf"));
}

TEST(PathClassifierTest, RejectsOtherFiles) {
    EXPECT_FALSE(FileSystemTool::isImageFile("notes.txt"));
    EXPECT_FALSE(FileSystemTool::isImageFile("image.tif"));
    EXPECT_FALSE(FileSystemTool::isImageFile("archive.png.zip"));
    EXPECT_FALSE(FileSystemTool::isImageFile("png"));
    EXPECT_FALSE(FileSystemTool::isImageFile("trailing."));
}

TEST(PathClassifierTest, RecognisesTempArtifacts) {
    EXPECT_TRUE(FileSystemTool::isTemporaryArtifact("/out/.lazywebp-0011223344556677.webp"));
    EXPECT_FALSE(FileSystemTool::isTemporaryArtifact("/out/lazywebp.webp"));
}

TEST_F(FileSystemToolTest, WebpPathForReplacesExtension) {
    EXPECT_EQ(FileSystemTool::webpPathFor("/in/photo.final.png", "/out"), fs::path("/out/photo.final.webp"));
}

TEST_F(FileSystemToolTest, GetImageFilesNoRecursive) {
    touch(tempDir / "a.png", "x");
    touch(tempDir / "b.txt", "x");
    touch(tempDir / "sub" / "c.jpg", "x");

    auto files = FileSystemTool::getImageFiles(tempDir, false);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].filename().string(), "a.png");
}

TEST_F(FileSystemToolTest, GetImageFilesRecursive) {
    touch(tempDir / "a.png", "x");
    touch(tempDir / "sub" / "c.jpg", "x");
    touch(tempDir / "sub" / "deeper" / "d.WEBP", "x");

    auto files = FileSystemTool::getImageFiles(tempDir, true);
    std::set<std::string> names;
    for (const auto& f : files) names.insert(f.filename().string());

    EXPECT_EQ(names, (std::set<std::string>{"a.png", "c.jpg", "d.WEBP"}));
}

TEST_F(FileSystemToolTest, GetImageFilesIgnoresDirectoriesAndTempFiles) {
    fs::create_directories(tempDir / "folder.png");
    touch(tempDir / ".lazywebp-deadbeefdeadbeef.webp", "x");
    touch(tempDir / "real.bmp", "x");

    auto files = FileSystemTool::getImageFiles(tempDir, true);
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].filename().string(), "real.bmp");
}

TEST_F(FileSystemToolTest, DirectorySizeSumsRegularFiles) {
    touch(tempDir / "a.bin", std::string(100, 'a'));
    touch(tempDir / "sub" / "b.bin", std::string(250, 'b'));

    EXPECT_EQ(FileSystemTool::directorySize(tempDir), 350u);
}

TEST_F(FileSystemToolTest, CreateDirectoryForFile) {
    fs::path target = tempDir / "x" / "y" / "file.webp";
    FileSystemTool::createDirectoryForFile(target);
    EXPECT_TRUE(fs::is_directory(tempDir / "x" / "y"));
    EXPECT_FALSE(fs::exists(target));
}

TEST_F(FileSystemToolTest, SameFileResolvesRelativeSegments) {
    touch(tempDir / "a.webp", "x");
    EXPECT_TRUE(FileSystemTool::isSameFile(tempDir / "a.webp", tempDir / "sub" / ".." / "a.webp"));
    EXPECT_FALSE(FileSystemTool::isSameFile(tempDir / "a.png", tempDir / "a.webp"));
}

TEST_F(FileSystemToolTest, RemoveQuietlyToleratesMissingFile) {
    EXPECT_FALSE(FileSystemTool::removeQuietly(tempDir / "missing"));
    touch(tempDir / "present", "x");
    EXPECT_TRUE(FileSystemTool::removeQuietly(tempDir / "present"));
    EXPECT_FALSE(fs::exists(tempDir / "present"));
}
