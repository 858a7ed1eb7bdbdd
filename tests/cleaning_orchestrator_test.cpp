#include <gtest/gtest.h>
#include "core/cleaning_orchestrator.hpp"
#include "test_helpers.hpp"
#include <chrono>
#include <future>
#include <stdexcept>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

class CleaningOrchestratorTest : public TempDirTest
{
protected:
    void SetUp() override
    {
        TempDirTest::SetUp();
        config_.program_directory = test_dir_.string();
        runner_ = std::make_shared<FakeSubprocessRunner>();
    }

    std::unique_ptr<CleaningOrchestrator> makeOrchestrator(const std::string &token = "a3f91b")
    {
        return std::make_unique<CleaningOrchestrator>(config_, std::make_shared<LibMagicSniffer>(), runner_,
                                                      [token]()
                                                      { return token; });
    }

    std::string writeJpeg(const std::string &name)
    {
        cv::Mat image(32, 32, CV_8UC3, cv::Scalar(40, 90, 160));
        std::vector<uchar> encoded;
        EXPECT_TRUE(cv::imencode(".jpg", image, encoded));
        return writeBytes(name, std::vector<unsigned char>(encoded.begin(), encoded.end()));
    }

    CleanerConfig config_;
    std::shared_ptr<FakeSubprocessRunner> runner_;
};

TEST_F(CleaningOrchestratorTest, CleansImageNextToSource)
{
    auto orchestrator = makeOrchestrator();
    std::string input = writeJpeg("My Photo! (1).jpeg");

    CleaningOutcome outcome = orchestrator->clean(input);

    ASSERT_TRUE(outcome.success) << outcome.error_message;
    EXPECT_EQ(outcome.final_state, CleaningState::DONE);
    EXPECT_EQ(outcome.media_kind, MediaKind::IMAGE);
    EXPECT_EQ(std::filesystem::path(outcome.output_path).filename().string(), "[CLEANED]a3f91b_My_Photo_1.jpeg");
    EXPECT_EQ(std::filesystem::path(outcome.output_path).parent_path(), std::filesystem::absolute(test_dir_));
    EXPECT_FALSE(cv::imread(outcome.output_path).empty());
    EXPECT_TRUE(std::filesystem::exists(input));
    EXPECT_EQ(orchestrator->state(), CleaningState::DONE);
    EXPECT_FALSE(orchestrator->isBusy());
}

TEST_F(CleaningOrchestratorTest, CleansVideoThroughTool)
{
    auto orchestrator = makeOrchestrator("00ff00");
    std::string input = writeFile("holiday clip.mp4", "not decodable but named like a video");

    CleaningOutcome outcome = orchestrator->clean(input);

    ASSERT_TRUE(outcome.success) << outcome.error_message;
    EXPECT_EQ(outcome.media_kind, MediaKind::VIDEO);
    EXPECT_EQ(std::filesystem::path(outcome.output_path).filename().string(), "[CLEANED]00ff00_holiday_clip.mp4");
    auto conversions = runner_->conversionCalls();
    ASSERT_EQ(conversions.size(), 1u);
    EXPECT_EQ(conversions[0].back(), outcome.output_path);
}

TEST_F(CleaningOrchestratorTest, UnsupportedFileIsRejectedWithoutOutput)
{
    auto orchestrator = makeOrchestrator();
    std::string input = writeFile("notes.txt", "shopping list\n");

    CleaningOutcome outcome = orchestrator->clean(input);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.final_state, CleaningState::REJECTED);
    EXPECT_EQ(outcome.error_kind, CleaningErrorKind::UNSUPPORTED_MEDIA);
    EXPECT_NE(outcome.error_message.find("notes.txt"), std::string::npos);
    EXPECT_EQ(countFiles(), 1u);
    EXPECT_TRUE(runner_->calls.empty());
}

TEST_F(CleaningOrchestratorTest, MissingInputIsAnIOError)
{
    auto orchestrator = makeOrchestrator();

    CleaningOutcome outcome = orchestrator->clean(pathFor("gone.jpg"));

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_kind, CleaningErrorKind::IO);
    EXPECT_EQ(outcome.final_state, CleaningState::FAILED);
}

TEST_F(CleaningOrchestratorTest, VideoToolFailureLeavesInputUntouched)
{
    runner_->convert_handler = [](const std::vector<std::string> &)
    { return ExternalToolResult(1, "", "Invalid data found when processing input\n"); };
    auto orchestrator = makeOrchestrator();
    std::string input = writeFile("clip.mkv", "corrupt");

    CleaningOutcome outcome = orchestrator->clean(input);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.final_state, CleaningState::FAILED);
    EXPECT_EQ(outcome.error_kind, CleaningErrorKind::PROCESSING);
    EXPECT_NE(outcome.error_message.find("Invalid data found"), std::string::npos);
    EXPECT_EQ(outcome.error_message.find("partially written"), std::string::npos);
    EXPECT_EQ(readFile(input), "corrupt");
    EXPECT_EQ(countFiles(), 1u);
}

TEST_F(CleaningOrchestratorTest, PartialVideoOutputIsMentioned)
{
    runner_->convert_handler = [](const std::vector<std::string> &argv)
    {
        std::ofstream(argv.back(), std::ios::binary) << "half";
        return ExternalToolResult(1, "", "Conversion failed!\n");
    };
    auto orchestrator = makeOrchestrator();

    CleaningOutcome outcome = orchestrator->clean(writeFile("clip.mov", "video"));

    EXPECT_FALSE(outcome.success);
    EXPECT_NE(outcome.error_message.find("partially written"), std::string::npos);
    EXPECT_NE(outcome.error_message.find("[CLEANED]a3f91b_clip.mov"), std::string::npos);
}

TEST_F(CleaningOrchestratorTest, MissingVideoToolIsReported)
{
    auto missing = std::make_shared<MissingToolRunner>();
    CleaningOrchestrator orchestrator(config_, std::make_shared<FakeSniffer>(std::nullopt), missing);

    CleaningOutcome outcome = orchestrator.clean(writeFile("clip.webm", "video"));

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_kind, CleaningErrorKind::TOOL_UNAVAILABLE);
    EXPECT_EQ(outcome.final_state, CleaningState::FAILED);
    EXPECT_EQ(countFiles(), 1u);
    EXPECT_FALSE(orchestrator.isVideoToolAvailable());
}

TEST_F(CleaningOrchestratorTest, ConfiguredOutputDirectoryIsCreated)
{
    config_.output_directory = (test_dir_ / "out" / "nested").string();
    auto orchestrator = makeOrchestrator();

    CleaningOutcome outcome = orchestrator->clean(writeJpeg("photo.jpg"));

    ASSERT_TRUE(outcome.success) << outcome.error_message;
    EXPECT_EQ(std::filesystem::path(outcome.output_path).parent_path(), test_dir_ / "out" / "nested");
    EXPECT_TRUE(std::filesystem::exists(outcome.output_path));
}

TEST_F(CleaningOrchestratorTest, OutputDirectoryThatCannotBeCreatedIsAnIOError)
{
    std::string blocker = writeFile("blocker", "a regular file");
    config_.output_directory = blocker + "/out";
    auto orchestrator = makeOrchestrator();
    std::string input = writeJpeg("photo.jpg");

    CleaningOutcome outcome = orchestrator->clean(input);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_kind, CleaningErrorKind::IO);
    EXPECT_EQ(outcome.final_state, CleaningState::FAILED);
    EXPECT_EQ(orchestrator->state(), CleaningState::FAILED);
    EXPECT_EQ(countFiles(), 2u);
    EXPECT_TRUE(std::filesystem::is_regular_file(blocker));
}

TEST_F(CleaningOrchestratorTest, ConversionThatCannotStartIsAnExecutionError)
{
    runner_->convert_handler = [](const std::vector<std::string> &argv) -> ExternalToolResult
    { throw ExecutionError("Could not start " + argv[0] + ": Permission denied"); };
    auto orchestrator = makeOrchestrator();
    std::string input = writeFile("clip.mp4", "video");

    CleaningOutcome outcome = orchestrator->clean(input);

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.error_kind, CleaningErrorKind::EXECUTION);
    EXPECT_EQ(outcome.final_state, CleaningState::FAILED);
    EXPECT_NE(outcome.error_message.find("Permission denied"), std::string::npos);
    EXPECT_EQ(readFile(input), "video");
    EXPECT_EQ(countFiles(), 1u);
    EXPECT_FALSE(orchestrator->isBusy());
}

TEST_F(CleaningOrchestratorTest, OutputNameUsesPrefixTokenAndSanitizedName)
{
    config_.output_prefix = "clean-";
    config_.placeholder_name = "media";
    auto orchestrator = makeOrchestrator();

    EXPECT_EQ(orchestrator->buildOutputName("***.png", "abcdef"), "clean-abcdef_media.png");
    EXPECT_EQ(orchestrator->buildOutputName("a b.mp4", "123456"), "clean-123456_a_b.mp4");
}

TEST_F(CleaningOrchestratorTest, InspectDoesNotTouchState)
{
    auto orchestrator = makeOrchestrator();
    std::string input = writeJpeg("look.jpg");

    EXPECT_EQ(orchestrator->inspect(input).kind, MediaKind::IMAGE);
    EXPECT_EQ(orchestrator->state(), CleaningState::IDLE);
    EXPECT_EQ(countFiles(), 1u);
}

TEST_F(CleaningOrchestratorTest, AsyncCleanInvokesCallback)
{
    auto orchestrator = makeOrchestrator();
    std::promise<CleaningOutcome> delivered;

    auto future = orchestrator->cleanAsync(writeJpeg("async.jpg"), [&delivered](const CleaningOutcome &outcome)
                                           { delivered.set_value(outcome); });

    CleaningOutcome outcome = future.get();
    CleaningOutcome seen = delivered.get_future().get();
    EXPECT_TRUE(outcome.success) << outcome.error_message;
    EXPECT_EQ(seen.output_path, outcome.output_path);
}

TEST_F(CleaningOrchestratorTest, SecondRequestWhileBusyIsRejected)
{
    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> release_signal = release.get_future().share();
    runner_->convert_handler = [&started, release_signal](const std::vector<std::string> &argv)
    {
        started.set_value();
        release_signal.wait();
        return FakeSubprocessRunner::writeOutput(argv);
    };
    auto orchestrator = makeOrchestrator();

    auto first = orchestrator->cleanAsync(writeFile("long.mp4", "video"));
    started.get_future().wait();
    EXPECT_TRUE(orchestrator->isBusy());
    EXPECT_EQ(orchestrator->state(), CleaningState::STRIPPING);

    CleaningOutcome blocking = orchestrator->clean(writeJpeg("other.jpg"));
    EXPECT_EQ(blocking.error_kind, CleaningErrorKind::BUSY);

    bool callback_called = false;
    auto second = orchestrator->cleanAsync(pathFor("other.jpg"), [&callback_called](const CleaningOutcome &outcome)
                                           { callback_called = outcome.error_kind == CleaningErrorKind::BUSY; });
    ASSERT_EQ(second.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_EQ(second.get().error_kind, CleaningErrorKind::BUSY);
    EXPECT_TRUE(callback_called);

    release.set_value();
    EXPECT_TRUE(first.get().success);
    EXPECT_FALSE(orchestrator->isBusy());
    EXPECT_EQ(runner_->conversionCalls().size(), 1u);
}

TEST_F(CleaningOrchestratorTest, ThrowingCallbackDoesNotEscape)
{
    std::promise<void> started;
    std::promise<void> release;
    std::shared_future<void> release_signal = release.get_future().share();
    runner_->convert_handler = [&started, release_signal](const std::vector<std::string> &argv)
    {
        started.set_value();
        release_signal.wait();
        return FakeSubprocessRunner::writeOutput(argv);
    };
    auto orchestrator = makeOrchestrator();
    auto throwing = [](const CleaningOutcome &)
    { throw std::runtime_error("listener failed"); };

    auto first = orchestrator->cleanAsync(writeFile("long.mp4", "video"), throwing);
    started.get_future().wait();

    std::future<CleaningOutcome> rejected;
    EXPECT_NO_THROW(rejected = orchestrator->cleanAsync(pathFor("long.mp4"), throwing));
    EXPECT_EQ(rejected.get().error_kind, CleaningErrorKind::BUSY);

    release.set_value();
    CleaningOutcome outcome;
    EXPECT_NO_THROW(outcome = first.get());
    EXPECT_TRUE(outcome.success) << outcome.error_message;
    EXPECT_FALSE(orchestrator->isBusy());
}

TEST_F(CleaningOrchestratorTest, RepeatedRunsProduceDistinctOutputs)
{
    CleaningOrchestrator orchestrator(config_, std::make_shared<LibMagicSniffer>(), runner_);
    std::string input = writeJpeg("same.jpg");

    CleaningOutcome first = orchestrator.clean(input);
    CleaningOutcome second = orchestrator.clean(input);

    ASSERT_TRUE(first.success) << first.error_message;
    ASSERT_TRUE(second.success) << second.error_message;
    EXPECT_NE(first.output_path, second.output_path);
    EXPECT_EQ(countFiles(), 3u);
}
