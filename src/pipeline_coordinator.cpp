//
//  pipeline_coordinator.cpp
//  motion_comic
//

#include "pipeline_coordinator.hpp"
#include "logger.hpp"
#include "pipeline_errors.hpp"
#include "sequence_assembler.hpp"
#include "speechballoon_separation.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <map>
#include <stdexcept>

AnimationStyle parseAnimationStyle(const std::string &name){
    if (name == "pan_scan" || name == "pan_and_scan") return AnimationStyle::pan_scan;
    if (name == "ken_burns" || name == "ken_burns_effect") return AnimationStyle::ken_burns;
    if (name == "mixed") return AnimationStyle::mixed;
    Logger::Warn("unknown animation style '" + name + "', using pan_scan");
    return AnimationStyle::pan_scan;
}

const std::vector<std::string> &impactKeywords(){
    static const std::vector<std::string> keywords = {
        "pow", "bam", "boom", "crash", "bang", "wham", "smash", "crack", "slam", "thud", "whack"
    };
    return keywords;
}

bool containsImpactKeyword(const std::string &text){
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c){ return std::tolower(c); });
    for (const std::string &keyword : impactKeywords()) {
        if (lower.find(keyword) != std::string::npos) return true;
    }
    return false;
}

static cv::Mat loadImage(const std::string &path){
    cv::Mat image = cv::imread(path, cv::IMREAD_COLOR);
    if (image.empty()) {
        throw std::runtime_error("cannot decode image " + path);
    }
    return image;
}

//確認用画像　書けなくても処理は続ける
static void writeDebugImage(const std::string &dir, const std::string &name, const cv::Mat &image){
    if (image.empty()) return;
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    std::string path = dir + "/" + name + ".png";
    if (ec || !cv::imwrite(path, image)) {
        Logger::Warn("cannot write debug image " + path);
    }
}

PipelineCoordinator::PipelineCoordinator(const RunConfig &config, const Collaborators &collaborators,
                                         const std::string &work_dir, ProgressChannel *progress)
    : config_(config),
      collaborators_(collaborators),
      work_dir_(work_dir),
      progress_(progress),
      seed_(config.seed >= 0 ? (uint64_t)config.seed : (uint64_t)cv::getTickCount()),
      synthesizer_(config.encoder.fps),
      transition_kind_(parseTransitionKind(config.animation.transition)),
      cancel_requested_(false) {
    std::filesystem::create_directories(work_dir_);
    Logger::Info("working directory " + work_dir_ + ", seed " + std::to_string(seed_));
}

void PipelineCoordinator::requireStage(Stage expected, const char *operation) const{
    if (project_.stage != expected) {
        throw PipelineStateError(operation, std::string("requires stage ") + stageName(expected) +
                                 " but the project is at " + stageName(project_.stage));
    }
}

void PipelineCoordinator::checkCancelled(const char *operation) const{
    if (cancel_requested_) {
        throw PipelineCancelled(operation, "run cancelled");
    }
}

void PipelineCoordinator::request_cancel(){
    cancel_requested_ = true;
}

void PipelineCoordinator::report(int percent, const std::string &message){
    if (progress_) progress_->push(percent, message);
}

//ユニット毎に独立した乱数　スレッドの実行順に依存しない
cv::RNG PipelineCoordinator::unitRng(int unit, uint64_t salt) const{
    uint64_t state = seed_ ^ ((uint64_t)(unit + 1) * 0x9E3779B97F4A7C15ULL) ^ (salt * 0xC2B2AE3D27D4EB4FULL);
    return cv::RNG(state);
}

void PipelineCoordinator::extract(const std::string &archive_path){
    requireStage(Stage::Created, "extract");
    if (collaborators_.archive == nullptr) {
        throw PipelineStateError("extract", "no archive extractor configured");
    }
    std::vector<std::string> image_paths = collaborators_.archive->extract(archive_path, work_dir_ + "/extracted");
    load_pages(image_paths);
}

void PipelineCoordinator::load_pages(const std::vector<std::string> &image_paths){
    requireStage(Stage::Created, "extract");
    if (image_paths.empty()) {
        throw EmptyInputError("extract", "no page images found");
    }
    std::vector<Page> pages;
    for (int i=0; i<image_paths.size(); i++) {
        pages.push_back({"page_" + std::to_string(i), image_paths[i], i});
    }
    project_.pages = pages;
    project_.advance(Stage::Extracted);
    report(100, "extracted " + std::to_string(pages.size()) + " pages");
    Logger::Info("loaded " + std::to_string(pages.size()) + " pages");
}

std::vector<cv::Rect> PipelineCoordinator::detectPagePanels(Paneldetect &detector, const cv::Mat &page_img, const Page &page) const{
    std::vector<cv::Rect> boxes = detector.panel_detect(page_img);
    if (boxes.empty()) {
        throw RegionDetectionEmpty("detect", "no panels found on " + page.id);
    }
    return boxes;
}

void PipelineCoordinator::detect(){
    requireStage(Stage::Extracted, "detect");
    if (project_.pages.empty()) {
        throw EmptyInputError("detect", "no pages to process");
    }
    Logger::Info("detecting panels on " + std::to_string(project_.pages.size()) + " pages");

    Paneldetect detector(config_.detection.min_area_ratio, config_.detection.max_area_ratio);
    Speechballoon balloon_finder;
    std::string debug_dir = config_.detection.debug_dir.empty() ? work_dir_ + "/debug" : config_.detection.debug_dir;
    std::vector<Region> panels;
    std::vector<std::vector<Region>> bubbles;

    for (int p=0; p<project_.pages.size(); p++) {
        checkCancelled("detect");
        const Page &page = project_.pages[p];
        cv::Mat page_img = cv::imread(page.source_path, cv::IMREAD_COLOR);
        if (page_img.empty()) {
            throw UnsupportedFormatError("detect", "cannot decode page image " + page.source_path);
        }

        std::vector<cv::Rect> boxes;
        try {
            boxes = detectPagePanels(detector, page_img, page);
        } catch (const RegionDetectionEmpty &e) {
            if (!config_.detection.whole_page_fallback) {
                Logger::Warn(std::string(e.what()) + ", page skipped");
                continue;
            }
            Logger::Warn(std::string(e.what()) + ", using the whole page as one panel");
            boxes.push_back(cv::Rect(0, 0, page_img.cols, page_img.rows));
        }

        for (int k=0; k<boxes.size(); k++) {
            Region panel;
            panel.id = page.id + "_panel_" + std::to_string(k);
            panel.bounding_box = boxes[k] & cv::Rect(0, 0, page_img.cols, page_img.rows);
            panel.parent_id = page.id;

            cv::Mat panel_img = page_img(panel.bounding_box);
            std::vector<Region> panel_bubbles;
            if (collaborators_.ocr) {
                if (config_.detection.panel_ocr) {
                    panel.text = trimText(collaborators_.ocr->extract_text(panel_img));
                }
                std::vector<Speechballoon::Balloon> balloons = balloon_finder.find_text_regions(panel_img, *collaborators_.ocr);
                for (int j=0; j<balloons.size(); j++) {
                    Region bubble;
                    bubble.id = panel.id + "_bubble_" + std::to_string(j);
                    bubble.bounding_box = balloons[j].bbox;
                    bubble.parent_id = panel.id;
                    bubble.text = balloons[j].text;
                    panel_bubbles.push_back(bubble);
                    if (config_.detection.debug_images) {
                        writeDebugImage(debug_dir + "/balloons", bubble.id, balloons[j].img);
                    }
                }
            }
            if (config_.detection.debug_images) {
                writeDebugImage(debug_dir + "/panels", panel.id, panel_img);
            }
            panels.push_back(panel);
            bubbles.push_back(panel_bubbles);
        }
        if (config_.detection.debug_images) {
            writeDebugImage(debug_dir + "/overlays", page.id, Paneldetect::visualizePanels(page_img, boxes));
        }
        Logger::Debug(page.id + ": " + std::to_string(boxes.size()) + " panels");
        report((p + 1) * 100 / (int)project_.pages.size(), "detected panels on " + page.id);
    }

    if (panels.empty()) {
        throw EmptyInputError("detect", "no panels found on any page");
    }

    project_.panels = panels;
    project_.bubbles = bubbles;
    project_.panel_clips.assign(panels.size(), std::nullopt);
    project_.transition_clips.assign(panels.size(), std::nullopt);
    project_.audio_clips.assign(panels.size(), std::nullopt);
    project_.advance(Stage::Detected);
    Logger::Info("detected " + std::to_string(panels.size()) + " panels");
}

AnimationClip PipelineCoordinator::animatePanel(int index, AnimationStyle style, double duration, cv::RNG &rng) const{
    const Region &panel = project_.panels[index];
    const Page *page = project_.pageOf(panel);
    if (page == nullptr) {
        throw std::runtime_error("panel " + panel.id + " has no page");
    }
    cv::Mat image = loadImage(page->source_path);

    ClipKind kind = ClipKind::pan_scan;
    if (style == AnimationStyle::ken_burns) kind = ClipKind::ken_burns;
    else if (style == AnimationStyle::mixed) kind = rng.uniform(0, 2) == 1 ? ClipKind::pan_scan : ClipKind::ken_burns;

    std::string output_dir = work_dir_ + "/animations/" + panel.id;
    AnimationClip clip;
    clip.owner_region_id = panel.id;
    clip.kind = kind;
    clip.frame_duration_seconds = 1.0 / synthesizer_.fps();
    if (kind == ClipKind::pan_scan) {
        clip.frames = synthesizer_.pan_and_scan(image, panel.bounding_box, duration, output_dir, rng);
    }else{
        clip.frames = synthesizer_.ken_burns(image, duration, output_dir, rng);
    }
    return clip;
}

AnimationClip PipelineCoordinator::animateTransition(int index, double duration) const{
    const Page *from_page = project_.pageOf(project_.panels[index - 1]);
    const Page *to_page = project_.pageOf(project_.panels[index]);
    if (from_page == nullptr || to_page == nullptr) {
        throw std::runtime_error("transition " + std::to_string(index) + " has no page");
    }
    cv::Mat from_image = loadImage(from_page->source_path);
    cv::Mat to_image = loadImage(to_page->source_path);

    AnimationClip clip;
    clip.owner_region_id = project_.panels[index].id;
    clip.kind = ClipKind::transition;
    clip.frame_duration_seconds = 1.0 / synthesizer_.fps();
    clip.frames = synthesizer_.panel_transition(from_image, to_image, transition_kind_, duration,
                                                work_dir_ + "/animations/transition_" + std::to_string(index));
    return clip;
}

void PipelineCoordinator::animate(const std::string &style, double panel_duration, double transition_duration, double speed_factor){
    requireStage(Stage::Detected, "animate");
    if (speed_factor <= 0) {
        throw std::invalid_argument("animate: speed factor must be positive");
    }
    if (project_.panels.empty()) {
        throw EmptyInputError("animate", "no panels to animate");
    }
    checkCancelled("animate");

    AnimationStyle animation_style = parseAnimationStyle(style);
    panel_duration /= speed_factor;
    transition_duration /= speed_factor;

    int panel_count = (int)project_.panels.size();
    int unit_count = panel_count * 2 - 1; //コマ + 隣接コマ間の遷移
    std::vector<std::optional<AnimationClip>> panel_clips(panel_count);
    std::vector<std::optional<AnimationClip>> transition_clips(panel_count);
    std::atomic<int> finished(0);

    Logger::Info("animating " + std::to_string(panel_count) + " panels (" + style + ", " +
                 std::to_string(panel_duration) + "s per panel)");
    cv::parallel_for_(cv::Range(0, unit_count), [&](const cv::Range &range){
        for (int unit=range.start; unit<range.end; unit++) {
            if (cancel_requested_) return;
            std::string unit_name = unit < panel_count ? project_.panels[unit].id
                                                       : "transition_" + std::to_string(unit - panel_count + 1);
            try {
                if (unit < panel_count) {
                    cv::RNG rng = unitRng(unit, 1);
                    panel_clips[unit] = animatePanel(unit, animation_style, panel_duration, rng);
                }else{
                    int index = unit - panel_count + 1;
                    transition_clips[index] = animateTransition(index, transition_duration);
                }
            } catch (const std::exception &e) {
                Logger::Warn("animate: " + unit_name + " failed: " + e.what());
            }
            int done = ++finished;
            report(done * 100 / unit_count, "animated " + unit_name);
        }
    });
    checkCancelled("animate");

    int produced = 0;
    for (int i=0; i<panel_count; i++) {
        if (panel_clips[i]) produced++;
    }
    project_.panel_clips = panel_clips;
    project_.transition_clips = transition_clips;
    project_.advance(Stage::Animated);
    Logger::Info("animated " + std::to_string(produced) + "/" + std::to_string(panel_count) + " panels");
}

AudioClip PipelineCoordinator::synthesizeSpeech(const std::string &text, const std::string &voice_id, const VoiceParams &voice,
                                                const std::string &output_path, const std::string &owner) const{
    if (collaborators_.tts) {
        try {
            std::optional<std::string> path = collaborators_.tts->synthesize(text, voice_id, voice.pitch, voice.rate, output_path);
            if (path) {
                std::optional<double> duration;
                if (collaborators_.mixer) duration = collaborators_.mixer->duration_of(*path);
                if (!duration || *duration <= 0) duration = tone::wavDuration(*path);
                if (duration && *duration > 0) {
                    return {owner, *path, *duration};
                }
                //長さが測れなくても合成した音声は使う
                double estimate = std::max(0.1, tone::placeholderDuration(text));
                Logger::Warn("cannot measure " + *path + ", estimating " + std::to_string(estimate) + "s");
                return {owner, *path, estimate};
            }else{
                Logger::Warn("speech synthesis returned no audio for " + owner + ", using placeholder tone");
            }
        } catch (const std::exception &e) {
            Logger::Warn(std::string("speech synthesis failed for ") + owner + ": " + e.what() + ", using placeholder tone");
        }
    }

    std::filesystem::path placeholder(output_path);
    placeholder.replace_extension(".placeholder.wav");
    double duration = tone::placeholderDuration(text);
    if (!tone::writePlaceholderTone(placeholder.string(), duration)) {
        throw std::runtime_error("cannot write placeholder tone " + placeholder.string());
    }
    return {owner, placeholder.string(), duration};
}

//同時再生として重ねる　失敗したら先頭のクリップだけ使う
AudioClip PipelineCoordinator::combineAudio(const std::vector<AudioClip> &clips, const std::string &output_path) const{
    if (clips.size() == 1) return clips[0];
    if (collaborators_.mixer == nullptr) {
        Logger::Warn("no audio mixer, keeping " + clips[0].path);
        return clips[0];
    }
    std::vector<std::string> paths;
    double longest = 0.0;
    for (const AudioClip &clip : clips) {
        paths.push_back(clip.path);
        longest = std::max(longest, clip.duration_seconds);
    }
    std::optional<std::string> combined = collaborators_.mixer->overlay(paths, output_path);
    if (!combined) {
        Logger::Warn("audio overlay failed for " + clips[0].owner_region_id + ", keeping " + clips[0].path);
        return clips[0];
    }
    return {clips[0].owner_region_id, *combined, longest};
}

std::string PipelineCoordinator::panelText(int index) const{
    std::string text = trimText(project_.panels[index].text);
    for (const Region &bubble : project_.bubbles[index]) {
        std::string bubble_text = trimText(bubble.text);
        if (bubble_text.empty()) continue;
        if (!text.empty()) text += " ";
        text += bubble_text;
    }
    return text;
}

std::optional<AudioClip> PipelineCoordinator::narratePanel(int index, const VoiceParams &voice, cv::RNG &rng) const{
    const Region &panel = project_.panels[index];
    const std::vector<Region> &bubbles = project_.bubbles[index];

    std::string text = panelText(index);
    if (text.empty()) return std::nullopt;

    std::string audio_dir = work_dir_ + "/audio/" + panel.id;
    std::filesystem::create_directories(audio_dir);

    std::optional<AudioClip> speech;
    if (voice.voice == "mixed" && bubbles.size() > 1) {
        //吹き出し毎に声を変えて重ねる（順番には並べない）
        std::vector<AudioClip> parts;
        for (int j=0; j<bubbles.size(); j++) {
            std::string bubble_text = trimText(bubbles[j].text);
            if (bubble_text.empty()) continue;
            const std::string &voice_id = voice.voice_pool[j % voice.voice_pool.size()];
            parts.push_back(synthesizeSpeech(bubble_text, voice_id, voice,
                                             audio_dir + "/bubble_" + std::to_string(j) + ".wav", panel.id));
        }
        if (!parts.empty()) speech = combineAudio(parts, audio_dir + "/panel_speech_mix.wav");
    }
    if (!speech) {
        std::string voice_id = voice.voice == "mixed" ? voice.voice_pool[0] : voice.voice;
        speech = synthesizeSpeech(text, voice_id, voice, audio_dir + "/panel_speech.wav", panel.id);
    }

    if (voice.sound_effects && containsImpactKeyword(text)) {
        std::string effect_path = audio_dir + "/impact.wav";
        const double effect_duration = 1.0;
        if (!tone::writeImpactEffect(effect_path, effect_duration, rng)) {
            Logger::Warn("cannot write impact effect " + effect_path);
            return speech;
        }
        AudioClip effect = {panel.id, effect_path, effect_duration};
        Logger::Debug(panel.id + ": impact effect");
        if (!speech) return effect;
        return combineAudio({*speech, effect}, audio_dir + "/combined.wav");
    }
    return speech;
}

void PipelineCoordinator::narrate(const VoiceParams &voice){
    requireStage(Stage::Animated, "narrate");
    checkCancelled("narrate");

    int panel_count = (int)project_.panels.size();
    std::vector<std::optional<AudioClip>> audio_clips(panel_count);
    if (!voice.enabled) {
        Logger::Info("narration disabled");
        project_.audio_clips = audio_clips;
        project_.advance(Stage::Audioed);
        report(100, "narration disabled");
        return;
    }
    if (voice.voice_pool.empty()) {
        throw std::invalid_argument("narrate: voice pool must not be empty");
    }

    std::atomic<int> finished(0);
    cv::parallel_for_(cv::Range(0, panel_count), [&](const cv::Range &range){
        for (int i=range.start; i<range.end; i++) {
            if (cancel_requested_) return;
            try {
                cv::RNG rng = unitRng(i, 2);
                audio_clips[i] = narratePanel(i, voice, rng);
            } catch (const std::exception &e) {
                Logger::Warn("narrate: " + project_.panels[i].id + " failed: " + e.what());
            }
            int done = ++finished;
            report(done * 100 / panel_count, "narrated " + project_.panels[i].id);
        }
    });
    checkCancelled("narrate");

    int voiced = 0;
    for (int i=0; i<panel_count; i++) {
        if (audio_clips[i]) voiced++;
    }
    project_.audio_clips = audio_clips;
    project_.advance(Stage::Audioed);
    Logger::Info("generated audio for " + std::to_string(voiced) + "/" + std::to_string(panel_count) + " panels");
}

std::vector<Segment> PipelineCoordinator::segments() const{
    if (project_.stage < Stage::Animated) {
        throw PipelineStateError("segments", std::string("requires stage Animated but the project is at ") + stageName(project_.stage));
    }
    std::vector<Segment> list;
    int order_index = 0;
    for (int i=0; i<project_.panels.size(); i++) {
        if (!project_.panel_clips[i]) continue;
        //遷移はコマi-1とiの両方がある時だけ，コマiの直前に入れる
        if (i > 0 && project_.panel_clips[i - 1] && project_.transition_clips[i]) {
            list.push_back({order_index++, *project_.transition_clips[i], std::nullopt});
        }
        std::optional<AudioClip> audio;
        if (i < project_.audio_clips.size()) audio = project_.audio_clips[i];
        list.push_back({order_index++, *project_.panel_clips[i], audio});
    }
    return list;
}

std::string PipelineCoordinator::assemble(const std::string &output_path){
    requireStage(Stage::Audioed, "assemble");
    checkCancelled("assemble");
    if (collaborators_.encoder == nullptr) {
        throw EncodingFailure("assemble", "no encoder configured");
    }

    std::vector<Segment> ordered = segments();
    int panel_segments = 0;
    for (const Segment &segment : ordered) {
        if (segment.animation.kind != ClipKind::transition) panel_segments++;
    }
    if (panel_segments == 0) {
        throw EmptyInputError("assemble", "no panel produced an animation clip");
    }

    report(0, "assembling " + std::to_string(ordered.size()) + " segments");
    std::map<std::string, std::string> subtitle_texts;
    if (config_.subtitles) {
        for (int i=0; i<project_.panels.size(); i++) {
            std::string text = panelText(i);
            if (!text.empty()) subtitle_texts[project_.panels[i].id] = text;
        }
    }
    SequenceAssembler assembler(*collaborators_.encoder);
    std::string result = assembler.assemble(ordered, work_dir_ + "/video", output_path, subtitle_texts);
    project_.advance(Stage::Rendered);
    report(100, "rendered " + result);
    return result;
}

void PipelineCoordinator::save_project(const std::string &path) const{
    cv::FileStorage fs(path, cv::FileStorage::WRITE);
    if (!fs.isOpened()) {
        throw std::runtime_error("cannot write project file " + path);
    }
    fs << "stage" << stageName(project_.stage);
    fs << "version" << project_.version;
    fs << "seed" << std::to_string(seed_);

    fs << "pages" << "[";
    for (const Page &page : project_.pages) {
        fs << "{" << "id" << page.id << "path" << page.source_path << "index" << page.index << "}";
    }
    fs << "]";

    fs << "panels" << "[";
    for (int i=0; i<project_.panels.size(); i++) {
        const Region &panel = project_.panels[i];
        fs << "{";
        fs << "id" << panel.id << "page" << panel.parent_id << "box" << panel.bounding_box << "text" << panel.text;
        fs << "bubbles" << "[";
        if (i < project_.bubbles.size()) {
            for (const Region &bubble : project_.bubbles[i]) {
                fs << "{" << "id" << bubble.id << "box" << bubble.bounding_box << "text" << bubble.text << "}";
            }
        }
        fs << "]";
        if (i < project_.panel_clips.size() && project_.panel_clips[i]) {
            fs << "animation" << clipKindName(project_.panel_clips[i]->kind);
            fs << "frames" << (int)project_.panel_clips[i]->frames.size();
        }
        if (i < project_.transition_clips.size() && project_.transition_clips[i]) {
            fs << "transition_frames" << (int)project_.transition_clips[i]->frames.size();
        }
        if (i < project_.audio_clips.size() && project_.audio_clips[i]) {
            fs << "audio" << project_.audio_clips[i]->path;
            fs << "audio_duration" << project_.audio_clips[i]->duration_seconds;
        }
        fs << "}";
    }
    fs << "]";
    fs.release();
    Logger::Info("saved project " + path);
}

void PipelineCoordinator::cleanup(){
    std::error_code ec;
    std::filesystem::remove_all(work_dir_, ec);
    if (ec) {
        Logger::Error("cannot remove " + work_dir_ + ": " + ec.message());
        return;
    }
    Logger::Info("removed working directory " + work_dir_);
}
