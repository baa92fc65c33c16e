//
//  run_config.cpp
//  motion_comic
//

#include "run_config.hpp"
#include "logger.hpp"

#include <stdexcept>
#include "opencv2/core.hpp"

template <typename T>
static void readIfPresent(const cv::FileNode &node, T &value){
    if (!node.empty() && !node.isNone()) node >> value;
}

static void readIfPresent(const cv::FileNode &node, bool &value){
    if (node.empty() || node.isNone()) return;
    if (node.isString()) {
        std::string text = (std::string)node;
        value = (text == "true" || text == "yes" || text == "on" || text == "1");
    }else{
        value = (int)node != 0;
    }
}

RunConfig loadRunConfig(const std::string &path){
    RunConfig config;
    loadRunConfig(path, config);
    return config;
}

void loadRunConfig(const std::string &path, RunConfig &config){
    cv::FileStorage fs(path, cv::FileStorage::READ);
    if (!fs.isOpened()) {
        throw std::invalid_argument("cannot open config file: " + path);
    }

    readIfPresent(fs["temp_dir"], config.temp_dir);
    readIfPresent(fs["keep_temp"], config.keep_temp);
    readIfPresent(fs["seed"], config.seed);
    readIfPresent(fs["threads"], config.threads);
    readIfPresent(fs["command_timeout"], config.command_timeout);
    readIfPresent(fs["log_file"], config.log_file);
    readIfPresent(fs["subtitles"], config.subtitles);

    cv::FileNode detection = fs["detection"];
    readIfPresent(detection["min_area_ratio"], config.detection.min_area_ratio);
    readIfPresent(detection["max_area_ratio"], config.detection.max_area_ratio);
    readIfPresent(detection["whole_page_fallback"], config.detection.whole_page_fallback);
    readIfPresent(detection["panel_ocr"], config.detection.panel_ocr);
    readIfPresent(detection["debug_images"], config.detection.debug_images);
    readIfPresent(detection["debug_dir"], config.detection.debug_dir);

    cv::FileNode animation = fs["animation"];
    readIfPresent(animation["style"], config.animation.style);
    readIfPresent(animation["panel_duration"], config.animation.panel_duration);
    readIfPresent(animation["transition_duration"], config.animation.transition_duration);
    readIfPresent(animation["speed"], config.animation.speed);
    readIfPresent(animation["transition"], config.animation.transition);
    readIfPresent(animation["fps"], config.encoder.fps);

    cv::FileNode voice = fs["voice"];
    readIfPresent(voice["enabled"], config.voice.enabled);
    readIfPresent(voice["name"], config.voice.voice);
    readIfPresent(voice["pitch"], config.voice.pitch);
    readIfPresent(voice["rate"], config.voice.rate);
    readIfPresent(voice["sound_effects"], config.voice.sound_effects);
    if (!voice["pool"].empty() && voice["pool"].isSeq()) {
        std::vector<std::string> pool;
        voice["pool"] >> pool;
        if (!pool.empty()) config.voice.voice_pool = pool;
    }

    cv::FileNode encoder = fs["encoder"];
    readIfPresent(encoder["width"], config.encoder.width);
    readIfPresent(encoder["height"], config.encoder.height);
    readIfPresent(encoder["bitrate"], config.encoder.bitrate);
    readIfPresent(encoder["ffmpeg"], config.encoder.ffmpeg);
    readIfPresent(encoder["ffprobe"], config.ffprobe);

    cv::FileNode ocr = fs["ocr"];
    readIfPresent(ocr["tesseract"], config.tesseract);
    readIfPresent(ocr["language"], config.ocr_language);

    readIfPresent(fs["tts"]["command"], config.tts_command);

    Logger::Info("loaded config " + path);
}

void validateRunConfig(const RunConfig &config){
    const DetectionConfig &d = config.detection;
    if (d.min_area_ratio < 0 || d.max_area_ratio > 1 || d.min_area_ratio >= d.max_area_ratio) {
        throw std::invalid_argument("detection area ratios must satisfy 0 <= min < max <= 1");
    }
    if (config.animation.speed <= 0) {
        throw std::invalid_argument("animation speed must be positive");
    }
    if (config.animation.panel_duration <= 0 || config.animation.transition_duration < 0) {
        throw std::invalid_argument("animation durations must be positive");
    }
    if (config.encoder.fps <= 0 || config.encoder.width <= 0 || config.encoder.height <= 0) {
        throw std::invalid_argument("encoder fps and resolution must be positive");
    }
    if (config.voice.voice_pool.empty()) {
        throw std::invalid_argument("voice pool must not be empty");
    }
}
