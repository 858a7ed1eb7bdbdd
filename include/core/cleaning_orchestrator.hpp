#pragma once

#include <atomic>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include "core/cleaner_config.hpp"
#include "core/cleaning_outcome.hpp"
#include "core/media_type_detector.hpp"
#include "core/subprocess_runner.hpp"
#include "core/unique_suffix.hpp"
#include "core/video_stripper.hpp"

/**
 * @brief Runs one metadata cleaning request from input path to cleaned copy
 *
 * detect -> validate -> sanitize name -> build output path -> strip -> report.
 *
 * Error Handling Policy:
 * - Strategies throw CleaningError subclasses; they are caught here.
 * - Every request ends in a CleaningOutcome, nothing escapes clean().
 * - The input file is never modified.
 * - No retries; a failed request has to be submitted again.
 *
 * Only one request runs at a time. A request submitted while another one is
 * in flight fails immediately with CleaningErrorKind::BUSY.
 */
class CleaningOrchestrator
{
public:
    using TokenSource = std::function<std::string()>;
    using CompletionCallback = std::function<void(const CleaningOutcome &)>;

    explicit CleaningOrchestrator(const CleanerConfig &config,
                                  std::shared_ptr<SignatureSniffer> sniffer = std::make_shared<LibMagicSniffer>(),
                                  std::shared_ptr<SubprocessRunner> runner = std::make_shared<SystemSubprocessRunner>(),
                                  TokenSource token_source = &UniqueSuffix::newToken);

    /**
     * @brief Clean a file on the calling thread
     * @param input_path Path of the media file to clean
     * @return Outcome with the absolute output path or a failure message
     */
    CleaningOutcome clean(const std::string &input_path);

    /**
     * @brief Clean a file on a worker thread
     *
     * The callback, if any, runs on the worker thread once the request has
     * finished; the returned future carries the same outcome.
     *
     * @param input_path Path of the media file to clean
     * @param on_complete Optional completion callback
     * @return Future holding the outcome
     */
    std::future<CleaningOutcome> cleanAsync(const std::string &input_path, CompletionCallback on_complete = nullptr);

    /**
     * @brief Detect the media kind without cleaning, for validating a selection
     */
    DetectionResult inspect(const std::string &input_path) const;

    /**
     * @brief Compute the output location and make sure its directory exists
     * @throws IOError if the output directory cannot be created
     */
    OutputDescriptor prepareOutput(const std::string &input_path, MediaKind kind) const;

    /**
     * @brief Output file name: <prefix><token>_<sanitized name>
     */
    std::string buildOutputName(const std::string &original_name, const std::string &token) const;

    bool isVideoToolAvailable() const { return video_stripper_.isToolAvailable(); }

    CleaningState state() const { return state_.load(); }
    bool isBusy() const { return busy_.load(); }

private:
    CleanerConfig config_;
    MediaTypeDetector detector_;
    VideoStripper video_stripper_;
    TokenSource token_source_;

    std::atomic<CleaningState> state_{CleaningState::IDLE};
    std::atomic<bool> busy_{false};

    bool tryBegin();
    void finish();
    static void notifyCompletion(const CompletionCallback &on_complete, const CleaningOutcome &outcome);
    static std::future<CleaningOutcome> readyFuture(const CleaningOutcome &outcome);
    CleaningOutcome runRequest(const std::string &input_path);
    void strip(const OutputDescriptor &descriptor);
};
