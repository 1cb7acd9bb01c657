#pragma once

#include "audio/media_toolkit.hpp"
#include "config.hpp"
#include "pipeline/diarizer.hpp"
#include "pipeline/job.hpp"
#include "pipeline/orchestrator.hpp"
#include "pipeline/segmenter.hpp"
#include "provider/provider.hpp"
#include "storage/chunk_store.hpp"
#include "util/clock.hpp"

#include <string>

// Executes a claimed job's stages in order until it completes, fails, needs
// a retry, or is interrupted. The job is persisted after every stage and,
// while transcribing, after every segment, so a later run resumes where this
// one stopped.
class JobRunner {
public:
    enum class Outcome {
        Completed,
        Failed,
        Retrying,  // retryable failure; the job goes back to the queue
        Requeued,  // shutdown; the job is pending again
        LeaseLost, // another worker owns the job now
    };

    JobRunner(const Config& config, ChunkStore& store, MediaToolkit& media,
              TranscriptionProvider& provider, Diarizer& diarizer, SleepFn sleep,
              bool verbose = false, ClockFn clock = now_ms, RetryExecutor::RandomFn random = {});

    Outcome run(TranscriptionJob& job, const PersistFn& persist, const InterruptCheck& interrupted);

private:
    struct StageResult {
        enum class Kind { Ok, Fatal, Retryable, Interrupted, LeaseLost };
        Kind kind = Kind::Ok;
        std::string error;
        Interrupt interrupt = Interrupt::None;

        static StageResult ok() { return {}; }
        static StageResult fatal(std::string e) { return {Kind::Fatal, std::move(e)}; }
        static StageResult retryable(std::string e) { return {Kind::Retryable, std::move(e)}; }
    };

    StageResult run_stage(TranscriptionJob& job, const PersistFn& persist,
                          const InterruptCheck& interrupted);

    template <Stage From>
    StageResult step(TranscriptionJob& job, StageResult result);

    StageResult validate(TranscriptionJob& job);
    StageResult transcode(TranscriptionJob& job);
    StageResult segment(TranscriptionJob& job);
    StageResult detect_language(TranscriptionJob& job, const InterruptCheck& interrupted);
    StageResult transcribe(TranscriptionJob& job, const PersistFn& persist,
                           const InterruptCheck& interrupted);
    StageResult merge(TranscriptionJob& job);
    StageResult diarize(TranscriptionJob& job);
    StageResult generate_outputs(TranscriptionJob& job);

    Outcome interrupt(TranscriptionJob& job, Interrupt why, const PersistFn& persist);
    Outcome retry_or_fail(TranscriptionJob& job, std::string summary, const PersistFn& persist);
    Outcome fail(TranscriptionJob& job, std::string summary, const PersistFn& persist);
    void remove_intermediates(const TranscriptionJob& job);
    void log(const std::string& msg);

    Config::Pipeline cfg_;
    ChunkStore& store_;
    MediaToolkit& media_;
    TranscriptionProvider& provider_;
    Diarizer& diarizer_;
    SleepFn sleep_;
    bool verbose_;
    ClockFn clock_;
    TranscriptionOrchestrator orchestrator_;
};

// Stable error code recorded when a job fails in `stage`.
std::string_view failure_code(Stage stage);

// Adds a warning unless an identical one is already recorded.
void add_warning(TranscriptionJob& job, std::string warning);
