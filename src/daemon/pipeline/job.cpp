#include "pipeline/job.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace {

constexpr std::array<std::pair<Stage, std::string_view>, 11> kStageNames = {{
    {Stage::Created, "created"},
    {Stage::Validating, "validating"},
    {Stage::Transcoding, "transcoding"},
    {Stage::Segmenting, "segmenting"},
    {Stage::DetectingLanguage, "detecting_language"},
    {Stage::Transcribing, "transcribing"},
    {Stage::Merging, "merging"},
    {Stage::Diarizing, "diarizing"},
    {Stage::GeneratingOutputs, "generating_outputs"},
    {Stage::Complete, "complete"},
    {Stage::Failed, "failed"},
}};

constexpr std::array<std::pair<JobStatus, std::string_view>, 5> kJobStatusNames = {{
    {JobStatus::Pending, "pending"},
    {JobStatus::Running, "running"},
    {JobStatus::Retrying, "retrying"},
    {JobStatus::Failed, "failed"},
    {JobStatus::Complete, "complete"},
}};

constexpr std::array<std::pair<SegmentStatus, std::string_view>, 4> kSegmentStatusNames = {{
    {SegmentStatus::Pending, "pending"},
    {SegmentStatus::Transcribing, "transcribing"},
    {SegmentStatus::Done, "done"},
    {SegmentStatus::Failed, "failed"},
}};

template <typename E, size_t N>
std::string_view name_of(const std::array<std::pair<E, std::string_view>, N>& table, E value) {
    auto it = std::ranges::find(table, value, &std::pair<E, std::string_view>::first);
    return it != table.end() ? it->second : "unknown";
}

template <typename E, size_t N>
std::optional<E> value_of(const std::array<std::pair<E, std::string_view>, N>& table,
                          std::string_view name) {
    auto it = std::ranges::find(table, name, &std::pair<E, std::string_view>::second);
    if (it == table.end()) return std::nullopt;
    return it->first;
}

} // namespace

std::string_view to_string(Stage s) { return name_of(kStageNames, s); }
std::string_view to_string(JobStatus s) { return name_of(kJobStatusNames, s); }
std::string_view to_string(SegmentStatus s) { return name_of(kSegmentStatusNames, s); }

std::optional<Stage> stage_from_string(std::string_view s) {
    return value_of(kStageNames, s);
}

std::optional<JobStatus> job_status_from_string(std::string_view s) {
    return value_of(kJobStatusNames, s);
}

std::optional<SegmentStatus> segment_status_from_string(std::string_view s) {
    return value_of(kSegmentStatusNames, s);
}

size_t TranscriptionJob::done_segments() const {
    return static_cast<size_t>(std::ranges::count(segments, SegmentStatus::Done, &Segment::status));
}

double TranscriptionJob::progress() const {
    if (segments.empty()) return status == JobStatus::Complete ? 1.0 : 0.0;
    return static_cast<double>(done_segments()) / static_cast<double>(segments.size());
}

bool rewind(TranscriptionJob& job, Stage to) {
    if (job.stage != Stage::Failed || !can_rewind(job.failed_stage, to)) return false;

    if (to <= Stage::Transcoding) job.normalized_ref.clear();
    if (to <= Stage::Segmenting) job.segments.clear();
    if (to <= Stage::DetectingLanguage) {
        job.detected_language.reset();
        job.language_confidence = 0.0;
    }
    for (auto& seg : job.segments) {
        if (seg.status != SegmentStatus::Done) {
            seg.status = SegmentStatus::Pending;
            seg.transcript_text.clear();
            seg.cues.clear();
        }
    }
    if (to <= Stage::Merging) {
        job.merged_transcript.clear();
        job.word_count = 0;
    }
    if (to <= Stage::Diarizing) {
        job.diarized_transcript.clear();
        job.speaker_count = 0;
    }
    if (to <= Stage::GeneratingOutputs) job.outputs.clear();

    job.stage = to;
    job.failed_stage = Stage::Created;
    job.status = JobStatus::Pending;
    job.error.clear();
    job.warnings.clear();
    job.retry_count = 0;
    job.owner.clear();
    job.lease_expires_at = 0;
    job.completed_at = 0;
    return true;
}
