#include "pipeline/job_runner.hpp"

#include "audio/wav.hpp"
#include "output/output.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <format>
#include <map>
#include <print>
#include <sstream>

std::string_view failure_code(Stage stage) {
    switch (stage) {
        case Stage::Created:
        case Stage::Validating:        return "VALIDATION_FAILED";
        case Stage::Transcoding:       return "TRANSCODING_FAILED";
        case Stage::Segmenting:        return "SEGMENTATION_FAILED";
        case Stage::DetectingLanguage:
        case Stage::Transcribing:      return "TRANSCRIPTION_FAILED";
        case Stage::Merging:           return "MERGE_FAILED";
        case Stage::Diarizing:
        case Stage::GeneratingOutputs: return "OUTPUT_GENERATION_FAILED";
        case Stage::Complete:
        case Stage::Failed:            break;
    }
    return "JOB_FAILED";
}

void add_warning(TranscriptionJob& job, std::string warning) {
    if (std::ranges::find(job.warnings, warning) == job.warnings.end())
        job.warnings.push_back(std::move(warning));
}

JobRunner::JobRunner(const Config& config, ChunkStore& store, MediaToolkit& media,
                     TranscriptionProvider& provider, Diarizer& diarizer, SleepFn sleep,
                     bool verbose, ClockFn clock, RetryExecutor::RandomFn random)
    : cfg_(config.pipeline), store_(store), media_(media), provider_(provider),
      diarizer_(diarizer), sleep_(sleep), verbose_(verbose), clock_(std::move(clock)),
      orchestrator_(provider, store, RetryPolicy::from_config(config.retry),
                    std::chrono::milliseconds(config.pipeline.inter_segment_delay_ms),
                    sleep, verbose, std::move(random)) {}

JobRunner::Outcome JobRunner::run(TranscriptionJob& job, const PersistFn& persist,
                                  const InterruptCheck& interrupted) {
    auto check = [&interrupted] { return interrupted ? interrupted() : Interrupt::None; };

    job.status = JobStatus::Running;
    if (job.stage == Stage::Created) advance<Stage::Created, Stage::Validating>(job);

    while (!is_terminal(job.stage)) {
        if (auto why = check(); why != Interrupt::None) return interrupt(job, why, persist);

        Stage current = job.stage;
        log(std::format("job {}: {}", job.id, to_string(current)));

        auto t0 = std::chrono::steady_clock::now();
        StageResult r = run_stage(job, persist, interrupted);
        job.stage_durations[std::string(to_string(current))] +=
            std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        job.updated_at = clock_();

        switch (r.kind) {
            case StageResult::Kind::Ok:
                if (!persist(job)) return Outcome::LeaseLost;
                break;
            case StageResult::Kind::Fatal:
                return fail(job, std::format("{}: {}", failure_code(current), r.error), persist);
            case StageResult::Kind::Retryable:
                return retry_or_fail(job, std::format("{}: {}", failure_code(current), r.error),
                                     persist);
            case StageResult::Kind::Interrupted:
                return interrupt(job, r.interrupt, persist);
            case StageResult::Kind::LeaseLost:
                return Outcome::LeaseLost;
        }
    }

    if (job.stage == Stage::Failed) {
        // Fatal results move the stage; the status follows here
        job.status = JobStatus::Failed;
        return persist(job) ? Outcome::Failed : Outcome::LeaseLost;
    }

    remove_intermediates(job);
    job.status = JobStatus::Complete;
    job.error.clear();
    job.completed_at = job.updated_at = clock_();
    if (!persist(job)) return Outcome::LeaseLost;
    log(std::format("job {}: complete ({} segments, {} outputs)", job.id, job.segments.size(),
                    job.outputs.size()));
    return Outcome::Completed;
}

template <Stage From>
JobRunner::StageResult JobRunner::step(TranscriptionJob& job, StageResult result) {
    if (result.kind == StageResult::Kind::Ok) advance<From, next_stage(From)>(job);
    return result;
}

JobRunner::StageResult JobRunner::run_stage(TranscriptionJob& job, const PersistFn& persist,
                                            const InterruptCheck& interrupted) {
    switch (job.stage) {
        case Stage::Created:
            return step<Stage::Created>(job, StageResult::ok());
        case Stage::Validating:
            return step<Stage::Validating>(job, validate(job));
        case Stage::Transcoding:
            return step<Stage::Transcoding>(job, transcode(job));
        case Stage::Segmenting:
            return step<Stage::Segmenting>(job, segment(job));
        case Stage::DetectingLanguage:
            return step<Stage::DetectingLanguage>(job, detect_language(job, interrupted));
        case Stage::Transcribing:
            return step<Stage::Transcribing>(job, transcribe(job, persist, interrupted));
        case Stage::Merging:
            return step<Stage::Merging>(job, merge(job));
        case Stage::Diarizing:
            return step<Stage::Diarizing>(job, diarize(job));
        case Stage::GeneratingOutputs:
            return step<Stage::GeneratingOutputs>(job, generate_outputs(job));
        case Stage::Complete:
        case Stage::Failed:
            break;
    }
    return StageResult::ok();
}

JobRunner::StageResult JobRunner::validate(TranscriptionJob& job) {
    if (!store_.exists(job.source_ref)) return StageResult::fatal("uploaded file is missing");

    auto info = media_.probe(store_.path_for(job.source_ref));
    if (!info) {
        if (info.error().kind == MediaErrc::Io) return StageResult::retryable(info.error().message);
        return StageResult::fatal("not a decodable audio file: " + info.error().message);
    }

    double limit = cfg_.max_duration_hours * 3600.0;
    if (info->duration_seconds > limit) {
        return StageResult::fatal(std::format("duration {:.0f}s exceeds the {} hour limit",
                                              info->duration_seconds, cfg_.max_duration_hours));
    }

    job.audio_duration_seconds = info->duration_seconds;
    log(std::format("job {}: {:.1f}s of {} audio, {} channel(s) at {} Hz", job.id,
                    info->duration_seconds, info->codec, info->channels, info->sample_rate));
    return StageResult::ok();
}

JobRunner::StageResult JobRunner::transcode(TranscriptionJob& job) {
    job.normalized_ref = ChunkStore::blob_ref(job.id, "audio.wav");
    auto input = store_.path_for(job.source_ref);
    auto output = store_.path_for(job.normalized_ref);

    uint32_t attempts = std::max<uint32_t>(cfg_.transcode_attempts, 1);
    std::string last_error;
    bool done = false;
    for (uint32_t attempt = 1; attempt <= attempts && !done; ++attempt) {
        auto r = media_.transcode(input, output, cfg_.sample_rate);
        if (r) {
            done = true;
            break;
        }
        if (r.error().kind == MediaErrc::Corrupt) return StageResult::fatal(r.error().message);

        last_error = r.error().message;
        std::println(stderr, "worker: job {} transcode attempt {}/{}: {}", job.id, attempt,
                     attempts, last_error);
        if (attempt < attempts) sleep_(std::chrono::milliseconds(cfg_.transcode_retry_delay_ms));
    }
    if (!done) return StageResult::retryable(last_error);

    auto header = wav::read_header(output);
    if (!header) return StageResult::retryable("transcoded audio unreadable: " + header.error());
    if (!header->is_canonical(cfg_.sample_rate))
        return StageResult::fatal("transcoder produced non-canonical audio");
    if (header->frame_count() == 0) return StageResult::fatal("audio contains no samples");
    return StageResult::ok();
}

JobRunner::StageResult JobRunner::segment(TranscriptionJob& job) {
    Segmenter segmenter(store_, SegmentLimits::from_config(cfg_));
    double duration = 0.0;
    auto segments = segmenter.split(job.id, job.normalized_ref, duration);
    if (!segments) return StageResult::retryable(segments.error());

    job.segments = std::move(*segments);
    job.audio_duration_seconds = duration;
    log(std::format("job {}: {} segment(s) over {:.1f}s", job.id, job.segments.size(), duration));
    return StageResult::ok();
}

JobRunner::StageResult JobRunner::detect_language(TranscriptionJob& job,
                                                  const InterruptCheck& interrupted) {
    if (job.language_hint && !job.language_hint->empty()) {
        job.detected_language = job.language_hint;
        job.language_confidence = 1.0;
        return StageResult::ok();
    }

    job.detected_language.reset();
    job.language_confidence = 0.0;
    if (job.segments.empty()) return StageResult::ok();

    auto path = store_.path_for(job.normalized_ref);
    auto header = wav::read_header(path);
    if (!header) {
        add_warning(job, "language detection skipped: " + header.error());
        return StageResult::ok();
    }

    // First, middle and last segment
    std::vector<size_t> picks = {0, job.segments.size() / 2, job.segments.size() - 1};
    std::ranges::sort(picks);
    auto [first, last] = std::ranges::unique(picks);
    picks.erase(first, last);

    std::map<std::string, int> votes;
    int sampled = 0;
    for (size_t i : picks) {
        if (interrupted) {
            if (auto why = interrupted(); why != Interrupt::None)
                return StageResult{StageResult::Kind::Interrupted, {}, why};
        }
        if (sampled > 0) sleep_(std::chrono::milliseconds(cfg_.inter_segment_delay_ms));

        const auto& seg = job.segments[i];
        double seconds = std::min<double>(cfg_.detect_language_seconds, seg.end_offset - seg.start_offset);
        auto start = static_cast<uint64_t>(std::llround(seg.start_offset * header->sample_rate));
        auto count = static_cast<uint64_t>(std::llround(seconds * header->sample_rate));

        auto samples = wav::read_frames(path, *header, start, count);
        if (!samples || samples->empty()) continue;

        ++sampled;
        auto r = provider_.transcribe(wav::encode(*samples, header->sample_rate), std::nullopt);
        if (!r) {
            log(std::format("job {}: language sample {} failed: {}", job.id, i + 1, r.error().message));
            continue;
        }
        if (r->language) ++votes[*r->language];
    }

    if (votes.empty()) {
        add_warning(job, "language detection failed; transcribing without a language hint");
        return StageResult::ok();
    }

    auto best = std::ranges::max_element(votes, {}, &std::pair<const std::string, int>::second);
    job.detected_language = best->first;
    job.language_confidence = static_cast<double>(best->second) / sampled;
    log(std::format("job {}: language {} ({}/{} samples)", job.id, best->first, best->second, sampled));
    return StageResult::ok();
}

JobRunner::StageResult JobRunner::transcribe(TranscriptionJob& job, const PersistFn& persist,
                                             const InterruptCheck& interrupted) {
    using Status = TranscriptionOrchestrator::Status;

    auto r = orchestrator_.run(job, persist, interrupted);
    switch (r.status) {
        case Status::Done:          return StageResult::ok();
        case Status::Failed:        return StageResult::fatal(r.error);
        case Status::StorageFailed: return StageResult::retryable(r.error);
        case Status::Interrupted:   return StageResult{StageResult::Kind::Interrupted, {}, r.interrupt};
        case Status::LeaseLost:     return StageResult{StageResult::Kind::LeaseLost};
    }
    return StageResult::fatal("unknown orchestrator result");
}

JobRunner::StageResult JobRunner::merge(TranscriptionJob& job) {
    std::ranges::sort(job.segments, {}, &Segment::index);

    std::string merged;
    int words = 0;
    const bool marked = job.segments.size() > 1;
    for (const auto& seg : job.segments) {
        if (seg.status != SegmentStatus::Done)
            return StageResult::fatal(std::format("segment {} has no transcript", seg.index + 1));

        if (!merged.empty()) merged += "\n\n";
        if (marked) {
            merged += std::format("[Part {}]", seg.index + 1);
            if (!seg.transcript_text.empty()) merged += ' ';
        }
        merged += seg.transcript_text;

        std::istringstream in(seg.transcript_text);
        std::string word;
        while (in >> word) ++words;
    }

    job.merged_transcript = std::move(merged);
    job.word_count = words;
    job.diarized_transcript.clear();
    job.speaker_count = 0;
    return StageResult::ok();
}

JobRunner::StageResult JobRunner::diarize(TranscriptionJob& job) {
    if (!job.enable_diarization) return StageResult::ok();

    auto r = diarizer_.diarize(job);
    if (!r) {
        std::println(stderr, "worker: job {} diarization failed: {}", job.id, r.error());
        add_warning(job, "diarization failed: " + r.error());
        return StageResult::ok();
    }
    job.diarized_transcript = std::move(r->transcript);
    job.speaker_count = r->speaker_count;
    return StageResult::ok();
}

JobRunner::StageResult JobRunner::generate_outputs(TranscriptionJob& job) {
    auto doc = TranscriptDocument::from_job(job);
    job.outputs.clear();

    int storage_failures = 0;
    for (const auto& format : job.output_formats) {
        auto renderer = make_renderer(format);
        if (!renderer) {
            add_warning(job, std::format("unsupported output format '{}'", format));
            continue;
        }

        auto content = renderer->render(doc);
        if (!content) {
            add_warning(job, std::format("{} output failed: {}", format, content.error()));
            continue;
        }

        auto ref = ChunkStore::blob_ref(job.id, std::format("transcript.{}", renderer->extension()));
        if (auto w = store_.write_blob(ref, *content); !w) {
            std::println(stderr, "worker: job {} {} output: {}", job.id, format, w.error());
            add_warning(job, std::format("{} output could not be stored", format));
            ++storage_failures;
            continue;
        }
        job.outputs[format] = ref;
    }

    if (job.outputs.empty() && storage_failures > 0)
        return StageResult::retryable("no output could be stored");
    return StageResult::ok();
}

JobRunner::Outcome JobRunner::interrupt(TranscriptionJob& job, Interrupt why,
                                        const PersistFn& persist) {
    switch (why) {
        case Interrupt::Cancelled:
            return fail(job, "CANCELLED: cancelled by operator", persist);
        case Interrupt::TimedOut:
            return retry_or_fail(job, "JOB_TIMEOUT: job exceeded its time budget", persist);
        case Interrupt::Shutdown:
        case Interrupt::None:
            break;
    }
    job.status = JobStatus::Pending;
    job.updated_at = clock_();
    log(std::format("job {}: requeued at {}", job.id, to_string(job.stage)));
    return persist(job) ? Outcome::Requeued : Outcome::LeaseLost;
}

JobRunner::Outcome JobRunner::retry_or_fail(TranscriptionJob& job, std::string summary,
                                            const PersistFn& persist) {
    if (job.retry_count >= job.max_retries) return fail(job, std::move(summary), persist);

    ++job.retry_count;
    job.status = JobStatus::Retrying;
    job.error = std::move(summary);
    job.updated_at = clock_();
    std::println(stderr, "worker: job {} will retry ({}/{}): {}", job.id, job.retry_count,
                 job.max_retries, job.error);
    return persist(job) ? Outcome::Retrying : Outcome::LeaseLost;
}

JobRunner::Outcome JobRunner::fail(TranscriptionJob& job, std::string summary,
                                   const PersistFn& persist) {
    if (can_transition(job.stage, Stage::Failed)) {
        job.failed_stage = job.stage;
        job.stage = Stage::Failed;
    }
    job.status = JobStatus::Failed;
    job.error = std::move(summary);
    job.updated_at = clock_();
    std::println(stderr, "worker: job {} failed: {}", job.id, job.error);
    return persist(job) ? Outcome::Failed : Outcome::LeaseLost;
}

void JobRunner::remove_intermediates(const TranscriptionJob& job) {
    for (const auto& seg : job.segments) {
        if (!seg.storage_ref.empty()) store_.remove_blob(seg.storage_ref);
    }
    if (!job.normalized_ref.empty()) store_.remove_blob(job.normalized_ref);
}

void JobRunner::log(const std::string& msg) {
    if (verbose_) {
        std::println(stderr, "[longscribe] {}", msg);
    }
}
