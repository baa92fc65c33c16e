//g++ *.cpp -std=c++17 `pkg-config --cflags --libs opencv4` -lpthread
//  main.cpp
//  motion_comic
//
#include <stdio.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <opencv2/opencv.hpp>
//headerfile
#include "audio_synthesis.hpp"
#include "comic_archive.hpp"
#include "command_runner.hpp"
#include "logger.hpp"
#include "media_encoder.hpp"
#include "pipeline_coordinator.hpp"
#include "pipeline_errors.hpp"
#include "progress_channel.hpp"
#include "run_config.hpp"
#include "text_recognizer.hpp"
// Usage: ./motion_comic <input archive or folder> <output video> [options]

static void usage(const char *program){
    std::cout << "Usage: " << program << " <input archive or folder> <output video>"
              << " [--config file] [--style pan_scan|ken_burns|mixed] [--speed f] [--voice v]"
              << " [--no-audio] [--no-sfx] [--subtitles] [--seed n] [--keep-temp] [--save-project file] [--debug]" << std::endl;
}

struct CliOptions {
    std::string input;
    std::string output;
    std::string config_path;
    std::string save_project;
    bool debug = false;
};

//引数の解釈　--configを先に読んでから他のフラグで上書きする
static bool parseArguments(int argc, const char *argv[], CliOptions &options, RunConfig &config){
    if (argc < 3) return false;
    options.input = argv[1];
    options.output = argv[2];

    for (int ai = 3; ai < argc; ++ai) {
        if (std::string(argv[ai]) == "--config" && ai + 1 < argc) {
            options.config_path = argv[ai + 1];
        }
    }
    if (!options.config_path.empty()) {
        loadRunConfig(options.config_path, config);
    }

    for (int ai = 3; ai < argc; ++ai) {
        std::string a = argv[ai];
        bool has_value = ai + 1 < argc;
        if (a == "--config" && has_value) {
            ai++;
        }else if (a == "--style" && has_value) {
            config.animation.style = argv[++ai];
        }else if (a == "--speed" && has_value) {
            config.animation.speed = std::stod(argv[++ai]);
        }else if (a == "--voice" && has_value) {
            config.voice.voice = argv[++ai];
        }else if (a == "--seed" && has_value) {
            config.seed = std::stoi(argv[++ai]);
        }else if (a == "--save-project" && has_value) {
            options.save_project = argv[++ai];
        }else if (a == "--no-audio") {
            config.voice.enabled = false;
        }else if (a == "--no-sfx") {
            config.voice.sound_effects = false;
        }else if (a == "--subtitles") {
            config.subtitles = true;
        }else if (a == "--keep-temp") {
            config.keep_temp = true;
        }else if (a == "--debug") {
            options.debug = true;
            config.detection.debug_images = true;
        }else{
            std::cerr << "unknown option: " << a << std::endl;
            return false;
        }
    }
    //debug画像は出力動画の隣のdebug/へ
    if (config.detection.debug_images && config.detection.debug_dir.empty()) {
        std::filesystem::path parent = std::filesystem::path(options.output).parent_path();
        config.detection.debug_dir = (parent.empty() ? std::filesystem::path("debug") : parent / "debug").string();
    }
    return true;
}

static std::string makeWorkDir(const RunConfig &config){
    std::filesystem::path base = config.temp_dir.empty() ? std::filesystem::temp_directory_path()
                                                         : std::filesystem::path(config.temp_dir);
    return (base / ("motion_comic_" + std::to_string(cv::getTickCount()))).string();
}

//成功でも例外でも終了時にチャネルを閉じる
struct ProgressCloser {
    ProgressChannel &channel;
    ~ProgressCloser() { channel.close(); }
};

static void runPipeline(PipelineCoordinator &coordinator, const RunConfig &config, const CliOptions &options){
    coordinator.extract(options.input);
    coordinator.detect();
    coordinator.animate(config.animation.style, config.animation.panel_duration,
                        config.animation.transition_duration, config.animation.speed);
    coordinator.narrate(config.voice);
    coordinator.assemble(options.output);
}

int main(int argc, const char * argv[]) {
    CliOptions options;
    RunConfig config;
    try {
        if (!parseArguments(argc, argv, options, config)) {
            usage(argv[0]);
            return 1;
        }
        validateRunConfig(config);
    } catch (const std::exception &e) {
        std::cerr << "invalid arguments: " << e.what() << std::endl;
        usage(argv[0]);
        return 1;
    }

    if (options.debug) Logger::SetDebug(true);
    std::shared_ptr<std::ofstream> log_stream;
    if (!config.log_file.empty()) {
        log_stream = std::make_shared<std::ofstream>(config.log_file, std::ios::app);
        if (!log_stream->is_open()) {
            std::cerr << "cannot open log file " << config.log_file << std::endl;
            return 1;
        }
        Logger::SetSink([log_stream](const std::string &line){ *log_stream << line << '\n'; });
    }
    if (config.threads > 0) cv::setNumThreads(config.threads);

    //外部コマンドのアダプタ
    std::string work_dir = makeWorkDir(config);
    CommandRunner runner(config.command_timeout);
    ComicArchive archive(runner);
    TesseractRecognizer ocr(runner, work_dir + "/ocr", config.tesseract, config.ocr_language);
    EspeakSynthesizer tts(runner, config.tts_command);
    FFmpegAudioMixer mixer(runner, config.encoder.ffmpeg, config.ffprobe);
    FFmpegEncoder encoder(runner, config.encoder);

    Collaborators collaborators;
    collaborators.ocr = &ocr;
    collaborators.tts = &tts;
    collaborators.mixer = &mixer;
    collaborators.encoder = &encoder;
    collaborators.archive = &archive;

    ProgressChannel progress;
    int status = 0;
    try {
        PipelineCoordinator coordinator(config, collaborators, work_dir, &progress);
        std::filesystem::create_directories(work_dir + "/ocr");

        //パイプラインは別スレッド　メインスレッドは進捗を表示する
        std::future<void> run = std::async(std::launch::async, [&](){
            ProgressCloser closer{progress};
            runPipeline(coordinator, config, options);
        });
        int last_percent = -1;
        while (!progress.closed() || run.wait_for(std::chrono::milliseconds(0)) != std::future_status::ready) {
            std::optional<ProgressEvent> event = progress.pop(std::chrono::milliseconds(200));
            if (!event) continue;
            if (event->percent != last_percent || options.debug) {
                printf("[%3d%%] %s\n", event->percent, event->message.c_str());
                last_percent = event->percent;
            }
        }
        for (const ProgressEvent &event : progress.drain()) {
            Logger::Debug(event.message);
        }

        try {
            run.get();
            Logger::Info("wrote " + options.output);
        } catch (const PipelineError &e) {
            Logger::Error("failed at " + e.stage() + ": " + e.what());
            status = 1;
        } catch (const std::exception &e) {
            Logger::Error(std::string("failed: ") + e.what());
            status = 1;
        }

        if (!options.save_project.empty()) {
            coordinator.save_project(options.save_project);
        }
        if (!config.keep_temp) {
            coordinator.cleanup();
        }else{
            Logger::Info("kept working directory " + work_dir);
        }
    } catch (const std::exception &e) {
        Logger::Error(std::string("failed: ") + e.what());
        status = 1;
    }

    Logger::SetSink(nullptr);
    return status;
}
