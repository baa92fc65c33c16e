// Stage ordering, detection fallbacks, animation scheduling, narration and assembly
// through the coordinator with in-process collaborators.

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "fixtures/FakeCollaborators.h"
#include "fixtures/TestPages.h"
#include "pipeline_coordinator.hpp"
#include "pipeline_errors.hpp"

namespace {

class PipelineCoordinatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    config_.seed = 7;
    config_.encoder.fps = 4;  // keeps the frame count small
    config_.detection.panel_ocr = true;
  }

  std::unique_ptr<PipelineCoordinator> MakeCoordinator(TextRecognizer* ocr = nullptr) {
    Collaborators collaborators;
    collaborators.ocr = ocr;
    collaborators.tts = &speech_;
    collaborators.mixer = &mixer_;
    collaborators.encoder = &encoder_;
    return std::make_unique<PipelineCoordinator>(config_, collaborators, dir_.file("work"), &progress_);
  }

  std::string GridPagePath() { return fixtures::WritePage(dir_, "grid.png", fixtures::GridPage()); }

  // Runs load_pages, detect and animate over the given pages.
  void RunToAnimated(PipelineCoordinator& coordinator, const std::vector<std::string>& pages,
                     const std::string& style = "pan_scan") {
    coordinator.load_pages(pages);
    coordinator.detect();
    coordinator.animate(style, 1.0, 0.5, 1.0);
  }

  fixtures::ScopedTempDir dir_;
  RunConfig config_;
  fixtures::FakeSpeech speech_;
  fixtures::FakeAudioMixer mixer_;
  fixtures::RecordingEncoder encoder_;
  ProgressChannel progress_;
};

TEST_F(PipelineCoordinatorTest, OperationsOutOfOrderAreRejectedWithoutMutation) {
  auto coordinator = MakeCoordinator();
  EXPECT_THROW(coordinator->detect(), PipelineStateError);
  EXPECT_THROW(coordinator->animate("pan_scan", 1.0, 0.5, 1.0), PipelineStateError);
  EXPECT_THROW(coordinator->narrate(config_.voice), PipelineStateError);
  EXPECT_THROW(coordinator->assemble(dir_.file("out.mp4")), PipelineStateError);
  EXPECT_THROW(coordinator->segments(), PipelineStateError);
  EXPECT_EQ(coordinator->project().stage, Stage::Created);
  EXPECT_EQ(coordinator->project().version, 0);

  coordinator->load_pages({GridPagePath()});
  EXPECT_THROW(coordinator->load_pages({GridPagePath()}), PipelineStateError);
  EXPECT_EQ(coordinator->project().pages.size(), 1u);
  EXPECT_EQ(coordinator->project().version, 1);
}

TEST_F(PipelineCoordinatorTest, EmptyPageListIsRejected) {
  auto coordinator = MakeCoordinator();
  EXPECT_THROW(coordinator->load_pages({}), EmptyInputError);
  EXPECT_EQ(coordinator->project().stage, Stage::Created);
}

TEST_F(PipelineCoordinatorTest, ExtractWithoutArchiveExtractor) {
  auto coordinator = MakeCoordinator();
  EXPECT_THROW(coordinator->extract(dir_.path()), PipelineStateError);
}

TEST_F(PipelineCoordinatorTest, ExtractFromDirectory) {
  fixtures::WritePage(dir_, "page10.png", fixtures::GridPage());
  fixtures::WritePage(dir_, "page2.png", fixtures::GridPage());
  CommandRunner runner;
  ComicArchive archive(runner);
  Collaborators collaborators;
  collaborators.archive = &archive;
  PipelineCoordinator coordinator(config_, collaborators, dir_.file("work"));

  coordinator.extract(dir_.path());
  const Project& project = coordinator.project();
  ASSERT_EQ(project.pages.size(), 2u);
  EXPECT_EQ(project.pages[0].id, "page_0");
  EXPECT_EQ(std::filesystem::path(project.pages[0].source_path).filename().string(), "page2.png");
  EXPECT_EQ(project.stage, Stage::Extracted);
}

TEST_F(PipelineCoordinatorTest, DetectFindsGridPanelsWithIds) {
  fixtures::FakeOcr ocr({"Look out"});
  auto coordinator = MakeCoordinator(&ocr);
  coordinator->load_pages({GridPagePath()});
  coordinator->detect();

  const Project& project = coordinator->project();
  EXPECT_EQ(project.stage, Stage::Detected);
  ASSERT_EQ(project.panels.size(), 4u);
  EXPECT_EQ(project.panels[0].id, "page_0_panel_0");
  EXPECT_EQ(project.panels[3].id, "page_0_panel_3");
  for (const Region& panel : project.panels) {
    EXPECT_EQ(panel.parent_id, "page_0");
    EXPECT_EQ(panel.text, "Look out");
  }
  EXPECT_EQ(project.bubbles.size(), 4u);
  EXPECT_EQ(project.panel_clips.size(), 4u);
  EXPECT_EQ(project.audio_clips.size(), 4u);
}

TEST_F(PipelineCoordinatorTest, PanelsFromSeveralPagesKeepPageOrder) {
  fixtures::FakeOcr ocr({"Hi"});
  auto coordinator = MakeCoordinator(&ocr);
  coordinator->load_pages({GridPagePath(), fixtures::WritePage(dir_, "balloons.png", fixtures::BalloonOnlyPage(2))});
  coordinator->detect();

  const Project& project = coordinator->project();
  ASSERT_EQ(project.panels.size(), 5u);  // 4 grid panels, then the whole second page
  for (int k = 0; k < 4; ++k) {
    EXPECT_EQ(project.panels[k].id, "page_0_panel_" + std::to_string(k));
    EXPECT_EQ(project.panels[k].parent_id, "page_0");
  }
  EXPECT_EQ(project.panels[4].id, "page_1_panel_0");
  EXPECT_EQ(project.panels[4].parent_id, "page_1");
  EXPECT_EQ(project.panels[4].bounding_box, cv::Rect(0, 0, 600, 800));
  ASSERT_NE(project.pageOf(project.panels[4]), nullptr);
  EXPECT_EQ(project.pageOf(project.panels[4])->index, 1);
  ASSERT_EQ(project.bubbles[4].size(), 2u);
  EXPECT_EQ(project.bubbles[4][0].id, "page_1_panel_0_bubble_0");
}

TEST_F(PipelineCoordinatorTest, DebugImagesAreWrittenPerPagePanelAndBalloon) {
  fixtures::FakeOcr ocr({"Hi"});
  config_.detection.debug_images = true;
  auto coordinator = MakeCoordinator(&ocr);
  coordinator->load_pages({fixtures::WritePage(dir_, "balloons.png", fixtures::BalloonOnlyPage(2))});
  coordinator->detect();

  std::string debug_dir = coordinator->work_dir() + "/debug";
  cv::Mat overlay = cv::imread(debug_dir + "/overlays/page_0.png");
  ASSERT_FALSE(overlay.empty());
  EXPECT_EQ(overlay.size(), cv::Size(600, 800));
  EXPECT_EQ(overlay.at<cv::Vec3b>(0, 300), cv::Vec3b(0, 255, 0));  // panel outline along the top edge
  EXPECT_TRUE(std::filesystem::exists(debug_dir + "/panels/page_0_panel_0.png"));
  EXPECT_TRUE(std::filesystem::exists(debug_dir + "/balloons/page_0_panel_0_bubble_0.png"));
  EXPECT_TRUE(std::filesystem::exists(debug_dir + "/balloons/page_0_panel_0_bubble_1.png"));
}

TEST_F(PipelineCoordinatorTest, DebugImagesGoToConfiguredDirectory) {
  config_.detection.debug_images = true;
  config_.detection.debug_dir = dir_.file("debug");
  auto coordinator = MakeCoordinator();
  coordinator->load_pages({GridPagePath()});
  coordinator->detect();

  EXPECT_TRUE(std::filesystem::exists(dir_.file("debug/overlays/page_0.png")));
  for (int k = 0; k < 4; ++k) {
    EXPECT_TRUE(std::filesystem::exists(dir_.file("debug/panels/page_0_panel_" + std::to_string(k) + ".png"))) << k;
  }
  EXPECT_FALSE(std::filesystem::exists(coordinator->work_dir() + "/debug"));
}

TEST_F(PipelineCoordinatorTest, NoDebugImagesByDefault) {
  auto coordinator = MakeCoordinator();
  coordinator->load_pages({GridPagePath()});
  coordinator->detect();
  EXPECT_FALSE(std::filesystem::exists(coordinator->work_dir() + "/debug"));
}

TEST_F(PipelineCoordinatorTest, PageWithoutPanelsBecomesOnePanel) {
  fixtures::FakeOcr ocr({"Hi"});
  config_.detection.panel_ocr = false;
  auto coordinator = MakeCoordinator(&ocr);
  coordinator->load_pages({fixtures::WritePage(dir_, "balloons.png", fixtures::BalloonOnlyPage(2))});
  coordinator->detect();

  const Project& project = coordinator->project();
  ASSERT_EQ(project.panels.size(), 1u);
  EXPECT_EQ(project.panels[0].bounding_box, cv::Rect(0, 0, 600, 800));
  ASSERT_EQ(project.bubbles[0].size(), 2u);
  EXPECT_EQ(project.bubbles[0][0].id, "page_0_panel_0_bubble_0");
  EXPECT_EQ(project.bubbles[0][0].parent_id, "page_0_panel_0");
  EXPECT_EQ(project.bubbles[0][1].text, "Hi");
}

TEST_F(PipelineCoordinatorTest, NoPanelsAnywhereWithoutFallback) {
  config_.detection.whole_page_fallback = false;
  auto coordinator = MakeCoordinator();
  coordinator->load_pages({fixtures::WritePage(dir_, "blank.png", fixtures::BlankPage())});
  EXPECT_THROW(coordinator->detect(), EmptyInputError);
  EXPECT_EQ(coordinator->project().stage, Stage::Extracted);
}

TEST_F(PipelineCoordinatorTest, UndecodablePageIsUnsupported) {
  std::string bogus = dir_.file("bogus.png");
  {
    std::ofstream out(bogus);
    out << "not an image";
  }
  auto coordinator = MakeCoordinator();
  coordinator->load_pages({bogus});
  EXPECT_THROW(coordinator->detect(), UnsupportedFormatError);
}

TEST_F(PipelineCoordinatorTest, SegmentsAlternateTransitionsBeforePanels) {
  auto coordinator = MakeCoordinator();
  RunToAnimated(*coordinator, {GridPagePath()});

  std::vector<Segment> segments = coordinator->segments();
  ASSERT_EQ(segments.size(), 7u);  // 4 panels + 3 transitions
  const Project& project = coordinator->project();
  for (size_t i = 0; i < segments.size(); ++i) {
    EXPECT_EQ(segments[i].order_index, (int)i);
    if (i % 2 == 0) {
      EXPECT_EQ(segments[i].animation.kind, ClipKind::pan_scan);
      EXPECT_EQ(segments[i].animation.owner_region_id, project.panels[i / 2].id);
      // 1.0 s at 4 fps
      EXPECT_EQ(segments[i].animation.frames.size(), 4u);
    } else {
      EXPECT_EQ(segments[i].animation.kind, ClipKind::transition);
      // leads into the following panel
      EXPECT_EQ(segments[i].animation.owner_region_id, project.panels[(i + 1) / 2].id);
      EXPECT_EQ(segments[i].animation.frames.size(), 2u);
      EXPECT_FALSE(segments[i].audio.has_value());
    }
  }
}

TEST_F(PipelineCoordinatorTest, TransitionBetweenPagesFadesFromPreviousPage) {
  cv::Mat black(800, 600, CV_8UC3, cv::Scalar(0, 0, 0));
  auto coordinator = MakeCoordinator();
  RunToAnimated(*coordinator, {GridPagePath(), fixtures::WritePage(dir_, "black.png", black)});

  const Project& project = coordinator->project();
  ASSERT_EQ(project.panels.size(), 5u);
  ASSERT_TRUE(project.transition_clips[4].has_value());
  const AnimationClip& across = *project.transition_clips[4];
  EXPECT_EQ(across.owner_region_id, "page_1_panel_0");
  ASSERT_EQ(across.frames.size(), 2u);
  EXPECT_GT(cv::mean(cv::imread(across.frames.front()))[0], 200);  // the grid page
  EXPECT_LT(cv::mean(cv::imread(across.frames.back()))[0], 30);    // the black page

  // transitions inside the first page stay on the grid page
  ASSERT_TRUE(project.transition_clips[2].has_value());
  EXPECT_GT(cv::mean(cv::imread(project.transition_clips[2]->frames.back()))[0], 200);

  std::vector<Segment> segments = coordinator->segments();
  ASSERT_EQ(segments.size(), 9u);
  EXPECT_EQ(segments[7].animation.kind, ClipKind::transition);
  EXPECT_EQ(segments[8].animation.owner_region_id, "page_1_panel_0");
}

TEST_F(PipelineCoordinatorTest, FailedMiddlePanelDropsItsTransitions) {
  std::vector<std::string> pages;
  for (const char* name : {"a.png", "b.png", "c.png", "d.png"}) {
    pages.push_back(fixtures::WritePage(dir_, name, fixtures::BlankPage()));
  }
  auto coordinator = MakeCoordinator();
  coordinator->load_pages(pages);
  coordinator->detect();
  ASSERT_EQ(coordinator->project().panels.size(), 4u);  // one whole-page panel each
  std::filesystem::remove(pages[1]);
  coordinator->animate("pan_scan", 1.0, 0.5, 1.0);

  const Project& project = coordinator->project();
  EXPECT_FALSE(project.panel_clips[1].has_value());
  EXPECT_FALSE(project.transition_clips[1].has_value());
  EXPECT_FALSE(project.transition_clips[2].has_value());
  EXPECT_TRUE(project.transition_clips[3].has_value());

  std::vector<Segment> segments = coordinator->segments();
  ASSERT_EQ(segments.size(), 4u);
  EXPECT_EQ(segments[0].animation.owner_region_id, "page_0_panel_0");
  EXPECT_EQ(segments[1].animation.owner_region_id, "page_2_panel_0");
  EXPECT_EQ(segments[2].animation.kind, ClipKind::transition);
  EXPECT_EQ(segments[3].animation.owner_region_id, "page_3_panel_0");
  for (size_t k = 0; k < segments.size(); ++k) {
    EXPECT_EQ(segments[k].order_index, (int)k);
    if (segments[k].animation.kind != ClipKind::transition) continue;
    // every transition sits right before the panel it leads into
    ASSERT_LT(k + 1, segments.size());
    EXPECT_NE(segments[k + 1].animation.kind, ClipKind::transition);
    EXPECT_EQ(segments[k + 1].animation.owner_region_id, segments[k].animation.owner_region_id);
  }
}

TEST_F(PipelineCoordinatorTest, SpeedFactorShortensClips) {
  auto coordinator = MakeCoordinator();
  coordinator->load_pages({GridPagePath()});
  coordinator->detect();
  EXPECT_THROW(coordinator->animate("pan_scan", 1.0, 0.5, 0.0), std::invalid_argument);
  coordinator->animate("ken_burns_effect", 1.0, 0.5, 2.0);
  std::vector<Segment> segments = coordinator->segments();
  EXPECT_EQ(segments[0].animation.kind, ClipKind::ken_burns);
  EXPECT_EQ(segments[0].animation.frames.size(), 2u);
  EXPECT_EQ(segments[1].animation.frames.size(), 1u);
}

TEST_F(PipelineCoordinatorTest, SameSeedSameMixedStyles) {
  auto first = MakeCoordinator();
  RunToAnimated(*first, {GridPagePath()}, "mixed");

  fixtures::ScopedTempDir other_dir;
  Collaborators collaborators;
  PipelineCoordinator second(config_, collaborators, other_dir.file("work"));
  RunToAnimated(second, {GridPagePath()}, "mixed");

  ASSERT_EQ(first->project().panel_clips.size(), second.project().panel_clips.size());
  for (size_t i = 0; i < first->project().panel_clips.size(); ++i) {
    ASSERT_TRUE(first->project().panel_clips[i].has_value());
    ASSERT_TRUE(second.project().panel_clips[i].has_value());
    EXPECT_EQ(first->project().panel_clips[i]->kind, second.project().panel_clips[i]->kind) << "panel " << i;
  }
}

TEST_F(PipelineCoordinatorTest, FailedSpeechFallsBackToPlaceholderTone) {
  fixtures::FakeOcr ocr({"one two three four five"});
  fixtures::FakeSpeech failing(fixtures::FakeSpeech::Mode::return_null);
  Collaborators collaborators;
  collaborators.ocr = &ocr;
  collaborators.tts = &failing;
  collaborators.mixer = &mixer_;
  PipelineCoordinator coordinator(config_, collaborators, dir_.file("work"));
  RunToAnimated(coordinator, {GridPagePath()});
  coordinator.narrate(config_.voice);

  const Project& project = coordinator.project();
  EXPECT_EQ(project.stage, Stage::Audioed);
  for (const std::optional<AudioClip>& audio : project.audio_clips) {
    ASSERT_TRUE(audio.has_value());
    EXPECT_NEAR(audio->duration_seconds, 0.5, 1e-9);
    EXPECT_TRUE(std::filesystem::exists(audio->path)) << audio->path;
  }
}

TEST_F(PipelineCoordinatorTest, SpeechIsKeptWithoutAMixer) {
  fixtures::FakeOcr ocr({"hello world"});
  Collaborators collaborators;
  collaborators.ocr = &ocr;
  collaborators.tts = &speech_;
  PipelineCoordinator coordinator(config_, collaborators, dir_.file("work"));
  RunToAnimated(coordinator, {GridPagePath()});
  coordinator.narrate(config_.voice);

  for (const std::optional<AudioClip>& audio : coordinator.project().audio_clips) {
    ASSERT_TRUE(audio.has_value());
    EXPECT_EQ(std::filesystem::path(audio->path).filename().string(), "panel_speech.wav");
    EXPECT_NEAR(audio->duration_seconds, speech_.seconds(), 1e-3);  // read from the WAV header
  }
}

TEST_F(PipelineCoordinatorTest, UnmeasurableSpeechIsKeptWithEstimatedLength) {
  fixtures::FakeOcr ocr({"hello world"});
  fixtures::FakeSpeech opaque(fixtures::FakeSpeech::Mode::unmeasurable);
  Collaborators collaborators;
  collaborators.ocr = &ocr;
  collaborators.tts = &opaque;
  collaborators.mixer = &mixer_;
  PipelineCoordinator coordinator(config_, collaborators, dir_.file("work"));
  RunToAnimated(coordinator, {GridPagePath()});
  coordinator.narrate(config_.voice);

  for (const std::optional<AudioClip>& audio : coordinator.project().audio_clips) {
    ASSERT_TRUE(audio.has_value());
    EXPECT_EQ(std::filesystem::path(audio->path).filename().string(), "panel_speech.wav");
    EXPECT_NEAR(audio->duration_seconds, 0.2, 1e-9);  // two words
  }
}

TEST_F(PipelineCoordinatorTest, ThrowingSpeechFallsBackToPlaceholderTone) {
  fixtures::FakeOcr ocr({"hello world"});
  fixtures::FakeSpeech throwing(fixtures::FakeSpeech::Mode::throw_failure);
  Collaborators collaborators;
  collaborators.ocr = &ocr;
  collaborators.tts = &throwing;
  PipelineCoordinator coordinator(config_, collaborators, dir_.file("work"));
  RunToAnimated(coordinator, {GridPagePath()});
  coordinator.narrate(config_.voice);

  for (const std::optional<AudioClip>& audio : coordinator.project().audio_clips) {
    ASSERT_TRUE(audio.has_value());
    EXPECT_NEAR(audio->duration_seconds, 0.2, 1e-9);
  }
}

TEST_F(PipelineCoordinatorTest, ImpactWordAddsEffectLongerThanSpeech) {
  fixtures::FakeOcr ocr({"BAM! the door slams"});
  auto coordinator = MakeCoordinator(&ocr);
  RunToAnimated(*coordinator, {GridPagePath()});
  coordinator->narrate(config_.voice);

  const Project& project = coordinator->project();
  ASSERT_TRUE(project.audio_clips[0].has_value());
  EXPECT_GT(project.audio_clips[0]->duration_seconds, speech_.seconds());
  EXPECT_NEAR(project.audio_clips[0]->duration_seconds, 1.0, 1e-9);

  bool overlaid_impact = false;
  for (const std::vector<std::string>& inputs : mixer_.overlays()) {
    if (inputs.size() == 2 && std::filesystem::path(inputs[1]).filename().string() == "impact.wav") overlaid_impact = true;
  }
  EXPECT_TRUE(overlaid_impact);
}

TEST_F(PipelineCoordinatorTest, SoundEffectsCanBeDisabled) {
  fixtures::FakeOcr ocr({"BAM! the door slams"});
  auto coordinator = MakeCoordinator(&ocr);
  RunToAnimated(*coordinator, {GridPagePath()});
  VoiceParams voice = config_.voice;
  voice.sound_effects = false;
  coordinator->narrate(voice);

  EXPECT_TRUE(mixer_.overlays().empty());
  EXPECT_NEAR(coordinator->project().audio_clips[0]->duration_seconds, speech_.seconds(), 1e-3);
}

TEST_F(PipelineCoordinatorTest, FailedOverlayKeepsSpeechOnly) {
  fixtures::FakeOcr ocr({"crash"});
  fixtures::FakeAudioMixer failing_mixer(true);
  Collaborators collaborators;
  collaborators.ocr = &ocr;
  collaborators.tts = &speech_;
  collaborators.mixer = &failing_mixer;
  PipelineCoordinator coordinator(config_, collaborators, dir_.file("work"));
  RunToAnimated(coordinator, {GridPagePath()});
  coordinator.narrate(config_.voice);

  const std::optional<AudioClip>& audio = coordinator.project().audio_clips[0];
  ASSERT_TRUE(audio.has_value());
  EXPECT_EQ(std::filesystem::path(audio->path).filename().string(), "panel_speech.wav");
}

TEST_F(PipelineCoordinatorTest, MixedVoiceRotatesThroughPoolPerBubble) {
  fixtures::FakeOcr ocr({"Hello there", "General Kenobi"});
  config_.detection.panel_ocr = false;
  auto coordinator = MakeCoordinator(&ocr);
  RunToAnimated(*coordinator, {fixtures::WritePage(dir_, "balloons.png", fixtures::BalloonOnlyPage(2))});
  VoiceParams voice = config_.voice;
  voice.voice = "mixed";
  coordinator->narrate(voice);

  std::vector<fixtures::FakeSpeech::Request> requests = speech_.requests();
  ASSERT_EQ(requests.size(), 2u);
  EXPECT_EQ(requests[0].text, "Hello there");
  EXPECT_EQ(requests[0].voice, voice.voice_pool[0]);
  EXPECT_EQ(requests[1].text, "General Kenobi");
  EXPECT_EQ(requests[1].voice, voice.voice_pool[1]);

  ASSERT_EQ(mixer_.overlays().size(), 1u);
  EXPECT_EQ(mixer_.overlays()[0].size(), 2u);
  ASSERT_TRUE(coordinator->project().audio_clips[0].has_value());
}

TEST_F(PipelineCoordinatorTest, BlankTextMeansNoAudio) {
  fixtures::FakeOcr ocr({"   "});
  auto coordinator = MakeCoordinator(&ocr);
  RunToAnimated(*coordinator, {GridPagePath()});
  coordinator->narrate(config_.voice);
  for (const std::optional<AudioClip>& audio : coordinator->project().audio_clips) {
    EXPECT_FALSE(audio.has_value());
  }
  EXPECT_TRUE(speech_.requests().empty());
}

TEST_F(PipelineCoordinatorTest, DisabledNarrationStillAdvances) {
  fixtures::FakeOcr ocr({"words"});
  auto coordinator = MakeCoordinator(&ocr);
  RunToAnimated(*coordinator, {GridPagePath()});
  VoiceParams voice = config_.voice;
  voice.enabled = false;
  coordinator->narrate(voice);
  EXPECT_EQ(coordinator->project().stage, Stage::Audioed);
  EXPECT_TRUE(speech_.requests().empty());
}

TEST_F(PipelineCoordinatorTest, AssembleHandsSegmentsToEncoder) {
  fixtures::FakeOcr ocr({"hello"});
  auto coordinator = MakeCoordinator(&ocr);
  RunToAnimated(*coordinator, {GridPagePath()});
  coordinator->narrate(config_.voice);
  std::string output = coordinator->assemble(dir_.file("out.mp4"));

  EXPECT_EQ(output, dir_.file("out.mp4"));
  EXPECT_EQ(coordinator->project().stage, Stage::Rendered);
  EXPECT_EQ(encoder_.encoded.size(), 7u);
  EXPECT_EQ(encoder_.muxed.size(), 4u);  // every panel has speech, transitions never do
  EXPECT_EQ(encoder_.concatenated.size(), 7u);
  EXPECT_EQ(encoder_.final_output, dir_.file("out.mp4"));

  // Progress events were published along the way.
  EXPECT_FALSE(progress_.drain().empty());
}

TEST_F(PipelineCoordinatorTest, SubtitlesCarryPanelText) {
  fixtures::FakeOcr ocr({"hello"});
  config_.subtitles = true;
  auto coordinator = MakeCoordinator(&ocr);
  RunToAnimated(*coordinator, {GridPagePath()});
  coordinator->narrate(config_.voice);
  coordinator->assemble(dir_.file("out.mp4"));

  ASSERT_EQ(encoder_.burned.size(), 1u);
  EXPECT_EQ(encoder_.burned[0].output, dir_.file("out.mp4"));
  EXPECT_NE(encoder_.final_output, dir_.file("out.mp4"));
  // one block per panel
  EXPECT_NE(encoder_.burned[0].subtitles.find("1\n00:00:00,000 --> "), std::string::npos);
  EXPECT_NE(encoder_.burned[0].subtitles.find("hello"), std::string::npos);
  EXPECT_NE(encoder_.burned[0].subtitles.find("\n4\n"), std::string::npos);
}

TEST_F(PipelineCoordinatorTest, SubtitlesOffByDefault) {
  fixtures::FakeOcr ocr({"hello"});
  auto coordinator = MakeCoordinator(&ocr);
  RunToAnimated(*coordinator, {GridPagePath()});
  coordinator->narrate(config_.voice);
  coordinator->assemble(dir_.file("out.mp4"));
  EXPECT_TRUE(encoder_.burned.empty());
  EXPECT_EQ(encoder_.final_output, dir_.file("out.mp4"));
}

TEST_F(PipelineCoordinatorTest, AssembleWithoutAnyPanelClipIsEmptyInput) {
  auto coordinator = MakeCoordinator();
  std::string page = GridPagePath();
  coordinator->load_pages({page});
  coordinator->detect();
  std::filesystem::remove(page);  // every animation unit now fails to load its image
  coordinator->animate("pan_scan", 1.0, 0.5, 1.0);
  EXPECT_EQ(coordinator->project().stage, Stage::Animated);
  EXPECT_TRUE(coordinator->segments().empty());

  coordinator->narrate(config_.voice);
  EXPECT_THROW(coordinator->assemble(dir_.file("out.mp4")), EmptyInputError);
  EXPECT_TRUE(encoder_.encoded.empty());
}

TEST_F(PipelineCoordinatorTest, EncoderFailurePropagates) {
  fixtures::RecordingEncoder failing(true);
  Collaborators collaborators;
  collaborators.encoder = &failing;
  PipelineCoordinator coordinator(config_, collaborators, dir_.file("work"));
  RunToAnimated(coordinator, {GridPagePath()});
  coordinator.narrate(config_.voice);
  EXPECT_THROW(coordinator.assemble(dir_.file("out.mp4")), EncodingFailure);
  EXPECT_EQ(coordinator.project().stage, Stage::Audioed);
}

TEST_F(PipelineCoordinatorTest, CancelStopsTheNextStage) {
  auto coordinator = MakeCoordinator();
  coordinator->load_pages({GridPagePath()});
  coordinator->request_cancel();
  EXPECT_THROW(coordinator->detect(), PipelineCancelled);
  EXPECT_EQ(coordinator->project().stage, Stage::Extracted);
}

TEST_F(PipelineCoordinatorTest, SaveProjectWritesSummary) {
  fixtures::FakeOcr ocr({"hello"});
  auto coordinator = MakeCoordinator(&ocr);
  RunToAnimated(*coordinator, {GridPagePath()});
  std::string path = dir_.file("project.yml");
  coordinator->save_project(path);

  cv::FileStorage fs(path, cv::FileStorage::READ);
  ASSERT_TRUE(fs.isOpened());
  EXPECT_EQ((std::string)fs["stage"], "Animated");
  EXPECT_EQ((int)fs["version"], 3);
  cv::FileNode panels = fs["panels"];
  ASSERT_EQ(panels.size(), 4u);
  EXPECT_EQ((std::string)panels[0]["id"], "page_0_panel_0");
  EXPECT_EQ((std::string)panels[0]["text"], "hello");
  EXPECT_EQ((int)panels[0]["frames"], 4);
}

TEST_F(PipelineCoordinatorTest, CleanupRemovesWorkDirectory) {
  auto coordinator = MakeCoordinator();
  RunToAnimated(*coordinator, {GridPagePath()});
  EXPECT_TRUE(std::filesystem::exists(coordinator->work_dir()));
  coordinator->cleanup();
  EXPECT_FALSE(std::filesystem::exists(coordinator->work_dir()));
}

TEST(ImpactKeywordTest, CaseInsensitiveSubstring) {
  EXPECT_TRUE(containsImpactKeyword("BAM! the door"));
  EXPECT_TRUE(containsImpactKeyword("it went kaboom"));
  EXPECT_TRUE(containsImpactKeyword("Thud."));
  EXPECT_FALSE(containsImpactKeyword("hello there"));
  EXPECT_FALSE(containsImpactKeyword(""));
}

TEST(AnimationStyleTest, LegacySpellingsAreAccepted) {
  EXPECT_EQ(parseAnimationStyle("pan_and_scan"), AnimationStyle::pan_scan);
  EXPECT_EQ(parseAnimationStyle("ken_burns_effect"), AnimationStyle::ken_burns);
  EXPECT_EQ(parseAnimationStyle("mixed"), AnimationStyle::mixed);
  EXPECT_EQ(parseAnimationStyle("spin"), AnimationStyle::pan_scan);
}

}  // namespace
