#include "core/cleaning_orchestrator.hpp"
#include "core/filename_sanitizer.hpp"
#include "core/image_stripper.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

CleaningOrchestrator::CleaningOrchestrator(const CleanerConfig &config,
                                           std::shared_ptr<SignatureSniffer> sniffer,
                                           std::shared_ptr<SubprocessRunner> runner,
                                           TokenSource token_source)
    : config_(config),
      detector_(config, std::move(sniffer)),
      video_stripper_(config, std::move(runner)),
      token_source_(std::move(token_source))
{
}

CleaningOutcome CleaningOrchestrator::clean(const std::string &input_path)
{
    if (!tryBegin())
    {
        return CleaningOutcome::failed(input_path, CleaningErrorKind::BUSY,
                                       "A cleaning operation is already in progress");
    }

    CleaningOutcome outcome = runRequest(input_path);
    finish();
    return outcome;
}

std::future<CleaningOutcome> CleaningOrchestrator::cleanAsync(const std::string &input_path,
                                                              CompletionCallback on_complete)
{
    if (!tryBegin())
    {
        CleaningOutcome busy = CleaningOutcome::failed(input_path, CleaningErrorKind::BUSY,
                                                       "A cleaning operation is already in progress");
        notifyCompletion(on_complete, busy);
        return readyFuture(busy);
    }

    try
    {
        return std::async(std::launch::async, [this, input_path, on_complete]()
                          {
            CleaningOutcome outcome = runRequest(input_path);
            finish();
            notifyCompletion(on_complete, outcome);
            return outcome; });
    }
    catch (const std::system_error &e)
    {
        // No worker thread, so release the slot here
        finish();
        Logger::error("Could not start cleaning worker: " + std::string(e.what()));

        CleaningOutcome outcome = CleaningOutcome::failed(input_path, CleaningErrorKind::INTERNAL,
                                                          "Could not start cleaning: " + std::string(e.what()));
        notifyCompletion(on_complete, outcome);
        return readyFuture(outcome);
    }
}

DetectionResult CleaningOrchestrator::inspect(const std::string &input_path) const
{
    return detector_.detect(input_path);
}

OutputDescriptor CleaningOrchestrator::prepareOutput(const std::string &input_path, MediaKind kind) const
{
    const fs::path source = fs::absolute(input_path);
    const fs::path output_dir = config_.output_directory.empty()
                                    ? source.parent_path()
                                    : fs::absolute(config_.output_directory);

    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec || !fs::is_directory(output_dir))
        throw IOError("Could not create output directory: " + output_dir.string(), ec.message());

    // Fresh token on every request
    const fs::path destination = output_dir / buildOutputName(source.filename().string(), token_source_());
    if (destination.lexically_normal() == source.lexically_normal())
        throw IOError("Output path would overwrite the source: " + source.string());

    return OutputDescriptor(source.string(), destination.string(), kind);
}

std::string CleaningOrchestrator::buildOutputName(const std::string &original_name, const std::string &token) const
{
    return config_.output_prefix + token + "_" +
           FilenameSanitizer::sanitize(original_name, config_.placeholder_name);
}

bool CleaningOrchestrator::tryBegin()
{
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true))
    {
        Logger::warn("Rejected request, a cleaning operation is already running");
        return false;
    }
    state_.store(CleaningState::IDLE);
    return true;
}

void CleaningOrchestrator::finish()
{
    busy_.store(false);
}

void CleaningOrchestrator::notifyCompletion(const CompletionCallback &on_complete, const CleaningOutcome &outcome)
{
    if (!on_complete)
        return;

    try
    {
        on_complete(outcome);
    }
    catch (const std::exception &e)
    {
        Logger::error("Completion callback failed: " + std::string(e.what()));
    }
}

std::future<CleaningOutcome> CleaningOrchestrator::readyFuture(const CleaningOutcome &outcome)
{
    std::promise<CleaningOutcome> promise;
    promise.set_value(outcome);
    return promise.get_future();
}

CleaningOutcome CleaningOrchestrator::runRequest(const std::string &input_path)
{
    OutputDescriptor descriptor;
    MediaKind kind = MediaKind::UNSUPPORTED;

    try
    {
        state_.store(CleaningState::DETECTING);

        // Validate input file
        std::error_code ec;
        if (!fs::is_regular_file(input_path, ec))
            throw IOError("Input file not found: " + input_path);

        DetectionResult detection = detector_.detect(input_path);
        kind = detection.kind;
        if (!detection.isSupported())
        {
            state_.store(CleaningState::REJECTED);
            throw UnsupportedMediaError("Unsupported file. Select a compatible image or video: " +
                                        FilenameSanitizer::displayName(input_path));
        }

        state_.store(CleaningState::VALIDATED);
        Logger::info("Detected type: " + MediaKinds::toString(kind) + ", ready to clean " +
                     FilenameSanitizer::displayName(input_path));

        // Build sanitized destination name
        state_.store(CleaningState::SANITIZING);
        descriptor = prepareOutput(input_path, kind);

        state_.store(CleaningState::STRIPPING);
        strip(descriptor);

        // Strategies must leave a file behind on success
        if (!fs::exists(descriptor.destination_path, ec))
            throw IOError("Cleaned file was not written: " + descriptor.destination_path);

        state_.store(CleaningState::DONE);
        Logger::info("Metadata removed, saved to: " + descriptor.destination_path);

        CleaningOutcome outcome = CleaningOutcome::succeeded(descriptor.source_path, descriptor.destination_path, kind);
        return outcome;
    }
    catch (const CleaningError &e)
    {
        CleaningState final_state = state_.load() == CleaningState::REJECTED ? CleaningState::REJECTED
                                                                              : CleaningState::FAILED;
        state_.store(final_state);

        // Video tool may have left a partial file
        std::string message = e.what();
        std::error_code ec;
        if (kind == MediaKind::VIDEO && !descriptor.destination_path.empty() &&
            fs::exists(descriptor.destination_path, ec))
        {
            message += ". A partially written file was left at " + descriptor.destination_path +
                       " and may need to be removed before retrying";
        }

        if (final_state == CleaningState::REJECTED)
            Logger::warn(message);
        else
            Logger::error("Cleaning failed (" + CleaningErrors::getKindName(e.kind()) + "): " + message);

        CleaningOutcome outcome = CleaningOutcome::failed(input_path, e.kind(), message, e.diagnostic(), final_state);
        outcome.media_kind = kind;
        return outcome;
    }
    catch (const std::exception &e)
    {
        state_.store(CleaningState::FAILED);
        Logger::error("Unexpected error while cleaning " + input_path + ": " + e.what());

        CleaningOutcome outcome = CleaningOutcome::failed(input_path, CleaningErrorKind::INTERNAL,
                                                          "Unexpected error: " + std::string(e.what()));
        outcome.media_kind = kind;
        return outcome;
    }
}

void CleaningOrchestrator::strip(const OutputDescriptor &descriptor)
{
    switch (descriptor.kind)
    {
    case MediaKind::IMAGE:
        ImageStripper::stripImage(descriptor.source_path, descriptor.destination_path);
        break;
    case MediaKind::VIDEO:
        video_stripper_.stripVideo(descriptor.source_path, descriptor.destination_path);
        break;
    default:
        throw UnsupportedMediaError("Unsupported media type");
    }
}
