#include "BaseTestFixture.h"
#include "AtomicConverter.hpp"
#include "FakeCodecs.h"
#include "FileSystemTool.hpp"
#include <iterator>
#include <regex>

class AtomicConverterTest : public BaseTestFixture {
protected:
    RunStatistics stats;
    ConversionConfig config = ConversionConfig::make(80, 1);

    std::string readAll(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }
};

TEST_F(AtomicConverterTest, ConvertsThroughTempFile) {
    fs::path in = tempDir / "photo.png";
    fs::path out = tempDir / "photo.webp";
    touch(in, std::string(100, 'x'));

    auto codec = std::make_shared<StaticBytesCodec>(std::vector<std::uint8_t>(40, 'w'));
    AtomicConverter converter(codec, stats, config);
    FileConversionOutcome outcome = converter.convert(in, out);

    ASSERT_TRUE(outcome.success);
    EXPECT_FALSE(outcome.skipped);
    EXPECT_EQ(outcome.inputBytes, 100u);
    EXPECT_EQ(outcome.outputBytes, 40u);
    EXPECT_EQ(readAll(out), std::string(40, 'w'));
    EXPECT_TRUE(strayTempFiles(tempDir).empty());

    StatisticsSnapshot snap = stats.snapshot();
    EXPECT_EQ(snap.processed, 1u);
    EXPECT_EQ(snap.totalInputBytes, 100);
    EXPECT_EQ(snap.savedBytes, 60);
}

TEST_F(AtomicConverterTest, PassesEncoderSettings) {
    fs::path in = tempDir / "photo.jpg";
    touch(in, "data");

    auto codec = std::make_shared<StaticBytesCodec>(std::vector<std::uint8_t>{'x'}, "srgb");
    AtomicConverter converter(codec, stats, config);
    ASSERT_TRUE(converter.convert(in, tempDir / "photo.webp").success);

    EXPECT_EQ(codec->lastOptions.quality, 80);
    EXPECT_EQ(codec->lastOptions.effort, 6);
    EXPECT_EQ(codec->lastOptions.alphaQuality, 100);
    EXPECT_FALSE(codec->lastOptions.lossless);
    EXPECT_TRUE(codec->lastOptions.autoRotate);
    EXPECT_TRUE(codec->lastOptions.targetColorSpace.empty());
}

TEST_F(AtomicConverterTest, NormalisesRgbAndDisplayP3ToSrgb) {
    AtomicConverter converter(std::make_shared<FailingCodec>(), stats, config);

    EXPECT_EQ(converter.encodeOptionsFor(ImageMetadata{"rgb", 1, 1, 3}).targetColorSpace, "srgb");
    EXPECT_EQ(converter.encodeOptionsFor(ImageMetadata{"display-p3", 1, 1, 3}).targetColorSpace, "srgb");
    EXPECT_TRUE(converter.encodeOptionsFor(ImageMetadata{"b-w", 1, 1, 1}).targetColorSpace.empty());
}

TEST_F(AtomicConverterTest, SkipsUpToDateOutput) {
    fs::path in = tempDir / "photo.png";
    fs::path out = tempDir / "photo.webp";
    touch(in, "input");
    touch(out, "existing");
    shiftMtime(in, std::chrono::seconds(-60));

    auto codec = std::make_shared<StaticBytesCodec>(std::vector<std::uint8_t>{'n', 'e', 'w'});
    AtomicConverter converter(codec, stats, config);
    FileConversionOutcome outcome = converter.convert(in, out);

    EXPECT_TRUE(outcome.success);
    EXPECT_TRUE(outcome.skipped);
    EXPECT_EQ(codec->encodeCalls.load(), 0);
    EXPECT_EQ(readAll(out), "existing");
    EXPECT_EQ(stats.snapshot().skipped, 1u);
}

TEST_F(AtomicConverterTest, EmptyEncoderOutputFails) {
    fs::path in = tempDir / "photo.png";
    fs::path out = tempDir / "photo.webp";
    touch(in, "input");

    AtomicConverter converter(std::make_shared<StaticBytesCodec>(std::vector<std::uint8_t>{}), stats, config);
    FileConversionOutcome outcome = converter.convert(in, out);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.errorKind, ErrorKind::EmptyOutput);
    EXPECT_EQ(outcome.error, "Generated file is empty");
    EXPECT_FALSE(fs::exists(out));
    EXPECT_TRUE(strayTempFiles(tempDir).empty());

    StatisticsSnapshot snap = stats.snapshot();
    ASSERT_EQ(snap.failed.size(), 1u);
    EXPECT_EQ(snap.failed[0].file, in.string());
}

TEST_F(AtomicConverterTest, CodecFailureLeavesPreviousOutput) {
    fs::path in = tempDir / "photo.png";
    fs::path out = tempDir / "photo.webp";
    touch(out, "previous");
    touch(in, "input");
    shiftMtime(out, std::chrono::seconds(-60));

    AtomicConverter converter(std::make_shared<FailingCodec>(), stats, config);
    FileConversionOutcome outcome = converter.convert(in, out);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.errorKind, ErrorKind::Codec);
    EXPECT_EQ(readAll(out), "previous");
    EXPECT_TRUE(strayTempFiles(tempDir).empty());
    EXPECT_EQ(stats.snapshot().processed, 0u);
}

TEST_F(AtomicConverterTest, NonStandardExceptionIsRecordedAsFailure) {
    fs::path in = tempDir / "photo.png";
    fs::path out = tempDir / "photo.webp";
    touch(in, "input");

    AtomicConverter converter(std::make_shared<NonStandardThrowCodec>(), stats, config);
    FileConversionOutcome outcome;
    ASSERT_NO_THROW(outcome = converter.convert(in, out));

    EXPECT_FALSE(outcome.success);
    EXPECT_FALSE(outcome.errorKind.has_value());
    EXPECT_EQ(outcome.error, "Unknown error");
    EXPECT_FALSE(fs::exists(out));
    EXPECT_TRUE(strayTempFiles(tempDir).empty());

    StatisticsSnapshot snap = stats.snapshot();
    ASSERT_EQ(snap.failed.size(), 1u);
    EXPECT_EQ(snap.failed[0].error, "Unknown error");
}

TEST_F(AtomicConverterTest, RefusesToReplaceSymlink) {
    fs::path in = tempDir / "photo.png";
    fs::path target = tempDir / "elsewhere.bin";
    fs::path out = tempDir / "photo.webp";
    touch(in, "input");
    touch(target, "keep me");
    shiftMtime(target, std::chrono::seconds(-60));
    fs::create_symlink(target, out);

    AtomicConverter converter(std::make_shared<StaticBytesCodec>(std::vector<std::uint8_t>{'x'}), stats, config);
    FileConversionOutcome outcome = converter.convert(in, out);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.errorKind, ErrorKind::RefusedSymlinkOverwrite);
    EXPECT_TRUE(fs::is_symlink(out));
    EXPECT_EQ(readAll(target), "keep me");
    EXPECT_TRUE(strayTempFiles(tempDir).empty());
}

TEST_F(AtomicConverterTest, CreatesMissingOutputDirectories) {
    fs::path in = tempDir / "photo.png";
    fs::path out = tempDir / "out" / "a" / "b" / "photo.webp";
    touch(in, "input");

    AtomicConverter converter(std::make_shared<StaticBytesCodec>(std::vector<std::uint8_t>{'x'}), stats, config);
    ASSERT_TRUE(converter.convert(in, out).success);
    EXPECT_TRUE(fs::is_regular_file(out));
}

TEST_F(AtomicConverterTest, LargerOutputGivesNegativeSavings) {
    fs::path in = tempDir / "tiny.png";
    touch(in, "ab");

    AtomicConverter converter(std::make_shared<StaticBytesCodec>(std::vector<std::uint8_t>(10, 'x')), stats, config);
    ASSERT_TRUE(converter.convert(in, tempDir / "tiny.webp").success);

    EXPECT_EQ(stats.snapshot().savedBytes, -8);
}

TEST_F(AtomicConverterTest, CancelledConversionWritesNothing) {
    fs::path in = tempDir / "photo.png";
    fs::path out = tempDir / "photo.webp";
    touch(in, "input");
    std::atomic<bool> cancelled{true};

    auto codec = std::make_shared<StaticBytesCodec>(std::vector<std::uint8_t>{'x'});
    AtomicConverter converter(codec, stats, config, &cancelled);
    FileConversionOutcome outcome = converter.convert(in, out);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.errorKind, ErrorKind::Cancelled);
    EXPECT_EQ(codec->encodeCalls.load(), 0);
    EXPECT_FALSE(fs::exists(out));
    EXPECT_TRUE(strayTempFiles(tempDir).empty());
}

TEST(AtomicConverterTempPathTest, HiddenRandomNameBesideOutput) {
    fs::path out = fs::path("/data/out") / "photo.webp";
    fs::path a = AtomicConverter::makeTempPath(out);
    fs::path b = AtomicConverter::makeTempPath(out);

    EXPECT_EQ(a.parent_path(), out.parent_path());
    EXPECT_TRUE(std::regex_match(a.filename().string(), std::regex("\\.lazywebp-[0-9a-f]{16}\\.webp")));
    EXPECT_NE(a, b);
    EXPECT_TRUE(FileSystemTool::isTemporaryArtifact(a));
}
