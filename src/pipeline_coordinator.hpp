//
//  pipeline_coordinator.hpp
//  motion_comic
//

#ifndef pipeline_coordinator_hpp
#define pipeline_coordinator_hpp

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "opencv2/opencv.hpp"

#include "audio_synthesis.hpp"
#include "comic_archive.hpp"
#include "media_encoder.hpp"
#include "motion_synthesis.hpp"
#include "panel_detection.hpp"
#include "progress_channel.hpp"
#include "project.hpp"
#include "run_config.hpp"
#include "text_recognizer.hpp"

//外部コマンドの窓口　ocr/tts/mixerは無くても動く（文字なし・代替音になる）
struct Collaborators {
    TextRecognizer *ocr = nullptr;
    SpeechSynthesizer *tts = nullptr;
    AudioMixer *mixer = nullptr;
    MediaEncoder *encoder = nullptr;
    ComicArchive *archive = nullptr;
};

enum class AnimationStyle {
    pan_scan,
    ken_burns,
    mixed
};

AnimationStyle parseAnimationStyle(const std::string &name);

//効果音を付けるキーワード（擬音）
const std::vector<std::string> &impactKeywords();
bool containsImpactKeyword(const std::string &text);

// Drives one run through Created -> Extracted -> Detected -> Animated -> Audioed -> Rendered.
// Every operation checks the stage it needs and throws PipelineStateError otherwise,
// before touching the project. animate() and narrate() fan out over panels with
// cv::parallel_for_; a failing panel is logged and skipped (or given fallback audio),
// stage-level failures propagate as PipelineError subclasses.
class PipelineCoordinator
{
public:
    PipelineCoordinator(const RunConfig &config, const Collaborators &collaborators,
                        const std::string &work_dir, ProgressChannel *progress = nullptr);

    void extract(const std::string &archive_path);
    void load_pages(const std::vector<std::string> &image_paths);
    void detect();
    void animate(const std::string &style, double panel_duration, double transition_duration, double speed_factor);
    void narrate(const VoiceParams &voice);
    std::string assemble(const std::string &output_path);

    //再生順のセグメント列（Animated以降）
    std::vector<Segment> segments() const;

    void save_project(const std::string &path) const;
    void cleanup();
    void request_cancel();

    const Project &project() const { return project_; }
    const std::string &work_dir() const { return work_dir_; }
    uint64_t seed() const { return seed_; }

private:
    void requireStage(Stage expected, const char *operation) const;
    void checkCancelled(const char *operation) const;
    void report(int percent, const std::string &message);
    cv::RNG unitRng(int unit, uint64_t salt) const;

    std::vector<cv::Rect> detectPagePanels(Paneldetect &detector, const cv::Mat &page_img, const Page &page) const;
    AnimationClip animatePanel(int index, AnimationStyle style, double duration, cv::RNG &rng) const;
    AnimationClip animateTransition(int index, double duration) const;
    //コマのテキストと吹き出しのテキストを空白でつなぐ
    std::string panelText(int index) const;
    std::optional<AudioClip> narratePanel(int index, const VoiceParams &voice, cv::RNG &rng) const;
    AudioClip synthesizeSpeech(const std::string &text, const std::string &voice_id, const VoiceParams &voice,
                               const std::string &output_path, const std::string &owner) const;
    AudioClip combineAudio(const std::vector<AudioClip> &clips, const std::string &output_path) const;

    RunConfig config_;
    Collaborators collaborators_;
    std::string work_dir_;
    ProgressChannel *progress_;
    uint64_t seed_;
    MotionSynthesizer synthesizer_;
    TransitionKind transition_kind_;
    Project project_;
    std::atomic<bool> cancel_requested_;
};

#endif /* pipeline_coordinator_hpp */
