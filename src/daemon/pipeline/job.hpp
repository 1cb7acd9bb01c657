#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Forward order of the pipeline. Failed is terminal and reachable from any stage.
enum class Stage {
    Created,
    Validating,
    Transcoding,
    Segmenting,
    DetectingLanguage,
    Transcribing,
    Merging,
    Diarizing,
    GeneratingOutputs,
    Complete,
    Failed,
};

enum class JobStatus { Pending, Running, Retrying, Failed, Complete };

enum class SegmentStatus { Pending, Transcribing, Done, Failed };

constexpr Stage next_stage(Stage s) {
    switch (s) {
        case Stage::Created:           return Stage::Validating;
        case Stage::Validating:        return Stage::Transcoding;
        case Stage::Transcoding:       return Stage::Segmenting;
        case Stage::Segmenting:        return Stage::DetectingLanguage;
        case Stage::DetectingLanguage: return Stage::Transcribing;
        case Stage::Transcribing:      return Stage::Merging;
        case Stage::Merging:           return Stage::Diarizing;
        case Stage::Diarizing:         return Stage::GeneratingOutputs;
        case Stage::GeneratingOutputs: return Stage::Complete;
        case Stage::Complete:          return Stage::Complete;
        case Stage::Failed:            return Stage::Failed;
    }
    return Stage::Failed;
}

constexpr bool is_terminal(Stage s) {
    return s == Stage::Complete || s == Stage::Failed;
}

// The only moves the runner may make: one step forward, or to Failed.
constexpr bool can_transition(Stage from, Stage to) {
    if (is_terminal(from)) return false;
    return to == Stage::Failed || next_stage(from) == to;
}

// Operator retry may rewind a failed job to any stage it had reached.
constexpr bool can_rewind(Stage failed_at, Stage to) {
    return to >= Stage::Validating && to <= failed_at && !is_terminal(to);
}

static_assert(can_transition(Stage::Validating, Stage::Transcoding));
static_assert(can_transition(Stage::Transcribing, Stage::Failed));
static_assert(!can_transition(Stage::Merging, Stage::Transcribing));
static_assert(!can_transition(Stage::Complete, Stage::Failed));

std::string_view to_string(Stage s);
std::string_view to_string(JobStatus s);
std::string_view to_string(SegmentStatus s);
std::optional<Stage> stage_from_string(std::string_view s);
std::optional<JobStatus> job_status_from_string(std::string_view s);
std::optional<SegmentStatus> segment_status_from_string(std::string_view s);

// A timestamped piece of text relative to the start of its segment.
struct Cue {
    double start = 0.0;
    double end = 0.0;
    std::string text;
};

struct Segment {
    int index = 0;
    double start_offset = 0.0;
    double end_offset = 0.0;
    std::string storage_ref;
    std::string transcript_text;
    SegmentStatus status = SegmentStatus::Pending;
    std::vector<Cue> cues;
};

struct TranscriptionJob {
    std::string id;
    std::string upload_id;
    std::string filename;
    uint64_t total_size = 0;
    std::string mime_type;

    Stage stage = Stage::Created;
    Stage failed_stage = Stage::Created; // where a Failed job stopped
    JobStatus status = JobStatus::Pending;
    std::string error;
    int retry_count = 0;
    int max_retries = 3;

    int64_t created_at = 0;
    int64_t updated_at = 0;
    int64_t started_at = 0;
    int64_t completed_at = 0;

    // Options carried over from the upload session
    std::optional<std::string> language_hint;
    bool enable_diarization = true;
    std::vector<std::string> output_formats;

    // Storage references
    std::string source_ref;
    std::string normalized_ref;

    double audio_duration_seconds = 0.0;
    std::vector<Segment> segments;

    std::optional<std::string> detected_language;
    double language_confidence = 0.0;

    std::string merged_transcript;
    std::string diarized_transcript;
    int speaker_count = 0;
    int word_count = 0;

    std::map<std::string, std::string> outputs; // format -> storage ref
    std::vector<std::string> warnings;
    std::map<std::string, double> stage_durations;

    // Provider error classes observed while transcribing
    int rate_limited_events = 0;
    int transient_error_events = 0;

    // Claim/lease
    std::string owner;
    int64_t lease_expires_at = 0;
    bool cancel_requested = false;

    size_t segment_count() const { return segments.size(); }
    size_t done_segments() const;

    // Fraction of segments transcribed, in [0, 1].
    double progress() const;
};

// The single forward-moving write of job.stage; an illegal pair does not compile.
template <Stage From, Stage To>
void advance(TranscriptionJob& job) {
    static_assert(can_transition(From, To), "illegal stage transition");
    job.stage = To;
}

// Puts a failed job back on the queue at `to`. Work produced at or after `to`
// is discarded; finished segments survive unless segmentation itself reruns.
// False when `to` is not a stage the job had reached.
bool rewind(TranscriptionJob& job, Stage to);

// Causes for stopping a job at the next segment or stage boundary.
enum class Interrupt { None, Cancelled, Shutdown, TimedOut };

using InterruptCheck = std::function<Interrupt()>;
