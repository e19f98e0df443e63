#include "audiobook_resume/core/errors.hpp"
#include "audiobook_resume/pipeline/phase_pipeline.hpp"

#include "test_helpers.hpp"

#include <catch2/catch_test_macros.hpp>

using audiobook_resume::MediaOperationError;
using audiobook_resume::Phase;
using audiobook_resume::PipelineState;
using audiobook_resume::ProgressEvent;
using audiobook_resume::ProgressKind;
using audiobook_resume::ValidationError;
using audiobook_resume::pipeline::PhasePipeline;
using audiobook_resume::pipeline::PipelineOptions;
using audiobook_resume::testing::RecordingMediaOperations;
using audiobook_resume::testing::ScratchDir;

namespace {

PipelineState two_chapters() {
  PipelineState state;
  state.chapter_files = {"ch1.wav", "ch2.wav"};
  state.chapter_line_map["ch1.wav"] = {0, 1};
  state.chapter_line_map["ch2.wav"] = {2};
  return state;
}

// "<kind>:<phase>:<item>:<current>/<total>"
std::string describe(const ProgressEvent& ev) {
  return audiobook_resume::progress_kind_to_string(ev.kind) + ":" +
         audiobook_resume::phase_to_string(ev.phase) + ":" + ev.item + ":" +
         std::to_string(ev.current) + "/" + std::to_string(ev.total);
}

struct EventLog {
  std::vector<ProgressEvent> events;
  audiobook_resume::ProgressSink sink() {
    return [this](const ProgressEvent& ev) { events.push_back(ev); };
  }
  std::vector<std::string> described() const {
    std::vector<std::string> out;
    for (const auto& ev : events) out.push_back(describe(ev));
    return out;
  }
};

} // namespace

TEST_CASE("pipeline_runs_phases_in_order_without_final_merge") {
  ScratchDir dir;
  RecordingMediaOperations ops;
  EventLog log;

  PhasePipeline pipeline(ops, PipelineOptions{});
  auto result = pipeline.run(two_chapters(), dir.path() / "line_segments", dir.path(), log.sink());

  REQUIRE(ops.calls == std::vector<std::string>{
                           "assemble ch1.wav [0,1]",
                           "assemble ch2.wav [2]",
                           "add_silence ch1.wav 1000",
                           "add_silence ch2.wav 1000",
                           "convert ch1.wav -> ch1.m4a",
                           "convert ch2.wav -> ch2.m4a",
                       });

  REQUIRE(log.described() == std::vector<std::string>{
                                 "phase_start:ASSEMBLING::0/2",
                                 "step_done:ASSEMBLING:ch1.wav:1/2",
                                 "step_done:ASSEMBLING:ch2.wav:2/2",
                                 "phase_end:ASSEMBLING::2/2",
                                 "phase_start:POST_PROCESSING::0/2",
                                 "step_done:POST_PROCESSING:ch1.wav:1/2",
                                 "step_done:POST_PROCESSING:ch2.wav:2/2",
                                 "phase_end:POST_PROCESSING::2/2",
                                 "phase_start:CONVERTING::0/2",
                                 "step_done:CONVERTING:ch1.m4a:1/2",
                                 "step_done:CONVERTING:ch2.m4a:2/2",
                                 "phase_end:CONVERTING::2/2",
                                 "pipeline_done:DONE::2/2",
                             });

  for (const auto& ev : log.events) {
    REQUIRE(ev.phase != Phase::FINAL_MERGING);
  }
  REQUIRE(result.converted_files == std::vector<std::string>{"ch1.m4a", "ch2.m4a"});
  REQUIRE_FALSE(result.final_artifact.has_value());
  REQUIRE(pipeline.phase() == Phase::DONE);
}

TEST_CASE("pipeline_final_merge_receives_converted_files_in_chapter_order") {
  ScratchDir dir;
  RecordingMediaOperations ops;
  EventLog log;

  PipelineOptions options;
  options.final_merge = true;
  options.book_path = dir.path() / "My Book.epub";
  options.narrator_voice = "female";
  options.output_format = "mp3";
  options.silence_ms = 250;

  PhasePipeline pipeline(ops, options);
  auto result = pipeline.run(two_chapters(), dir.path() / "line_segments", dir.path(), log.sink());

  REQUIRE(ops.calls.at(2) == "add_silence ch1.wav 250");
  REQUIRE(ops.calls.back() == "merge_final [ch1.mp3,ch2.mp3] My Book.epub female");
  REQUIRE(result.final_artifact.has_value());
  REQUIRE(*result.final_artifact == std::filesystem::path("out") / "book.m4b");

  auto described = log.described();
  REQUIRE(described.size() == 16);
  REQUIRE(described[12] == "phase_start:FINAL_MERGING::0/1");
  REQUIRE(described[13] == "step_done:FINAL_MERGING:book.m4b:1/1");
  REQUIRE(described[14] == "phase_end:FINAL_MERGING::1/1");
  REQUIRE(described[15] == "pipeline_done:DONE::2/2");
}

TEST_CASE("pipeline_failure_in_post_processing_stops_at_failing_chapter") {
  ScratchDir dir;
  RecordingMediaOperations ops;
  ops.fail_op = "add_silence";
  ops.fail_on_call = 2;
  EventLog log;

  PhasePipeline pipeline(ops, PipelineOptions{});
  try {
    pipeline.run(two_chapters(), dir.path() / "line_segments", dir.path(), log.sink());
    FAIL("expected MediaOperationError");
  } catch (const MediaOperationError& e) {
    REQUIRE(e.phase_name() == "POST_PROCESSING");
    REQUIRE(e.group_id() == "ch2.wav");
    REQUIRE(e.cause() == "add_silence exploded");
  }

  REQUIRE(log.described() == std::vector<std::string>{
                                 "phase_start:ASSEMBLING::0/2",
                                 "step_done:ASSEMBLING:ch1.wav:1/2",
                                 "step_done:ASSEMBLING:ch2.wav:2/2",
                                 "phase_end:ASSEMBLING::2/2",
                                 "phase_start:POST_PROCESSING::0/2",
                                 "step_done:POST_PROCESSING:ch1.wav:1/2",
                             });
  REQUIRE(ops.calls.back() == "add_silence ch1.wav 1000");
  REQUIRE(pipeline.phase() == Phase::POST_PROCESSING);
}

TEST_CASE("pipeline_repeated_runs_produce_identical_event_streams") {
  ScratchDir dir;
  RecordingMediaOperations first_ops;
  RecordingMediaOperations second_ops;
  EventLog first;
  EventLog second;

  PhasePipeline(first_ops, PipelineOptions{})
      .run(two_chapters(), dir.path() / "line_segments", dir.path(), first.sink());
  PhasePipeline(second_ops, PipelineOptions{})
      .run(two_chapters(), dir.path() / "line_segments", dir.path(), second.sink());

  REQUIRE(first.events == second.events);
  REQUIRE(first_ops.calls == second_ops.calls);
}

TEST_CASE("pipeline_with_no_chapters_goes_straight_to_done") {
  ScratchDir dir;
  RecordingMediaOperations ops;
  EventLog log;

  auto result = PhasePipeline(ops, PipelineOptions{})
                    .run(PipelineState{}, dir.path() / "line_segments", dir.path(), log.sink());

  REQUIRE(ops.calls.empty());
  REQUIRE(result.converted_files.empty());
  REQUIRE(log.events.back().kind == ProgressKind::PIPELINE_DONE);
  for (const auto& ev : log.events) {
    REQUIRE(ev.kind != ProgressKind::STEP_DONE);
  }
}

TEST_CASE("pipeline_rejects_inconsistent_inputs_before_any_work") {
  ScratchDir dir;
  RecordingMediaOperations ops;
  EventLog log;

  PipelineState unmapped = two_chapters();
  unmapped.chapter_files.push_back("ch3.wav");
  REQUIRE_THROWS_AS(PhasePipeline(ops, PipelineOptions{})
                        .run(unmapped, dir.path(), dir.path(), log.sink()),
                    ValidationError);

  PipelineOptions merge_without_book;
  merge_without_book.final_merge = true;
  REQUIRE_THROWS_AS(PhasePipeline(ops, merge_without_book)
                        .run(two_chapters(), dir.path(), dir.path(), log.sink()),
                    ValidationError);

  REQUIRE(ops.calls.empty());
  REQUIRE(log.events.empty());
}

TEST_CASE("pipeline_runs_without_a_sink") {
  ScratchDir dir;
  RecordingMediaOperations ops;
  auto result = PhasePipeline(ops, PipelineOptions{})
                    .run(two_chapters(), dir.path(), dir.path(), nullptr);
  REQUIRE(result.converted_files.size() == 2);
}

TEST_CASE("pipeline_with_no_chapters_skips_final_merge") {
  ScratchDir dir;
  RecordingMediaOperations ops;
  EventLog log;

  PipelineOptions options;
  options.final_merge = true;
  options.book_path = dir.path() / "Empty.epub";

  PhasePipeline pipeline(ops, options);
  auto result = pipeline.run(PipelineState{}, dir.path() / "line_segments", dir.path(), log.sink());

  REQUIRE(ops.calls.empty());
  REQUIRE_FALSE(result.final_artifact.has_value());
  REQUIRE(pipeline.phase() == Phase::DONE);
  REQUIRE(log.events.back().kind == ProgressKind::PIPELINE_DONE);
  for (const auto& ev : log.events) {
    REQUIRE(ev.phase != Phase::FINAL_MERGING);
  }
}
