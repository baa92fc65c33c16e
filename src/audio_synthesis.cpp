//
//  audio_synthesis.cpp
//  motion_comic
//

#include "audio_synthesis.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

EspeakSynthesizer::EspeakSynthesizer(const CommandRunner &runner, const std::string &executable)
    : runner(runner), executable(executable) {}

std::vector<std::string> EspeakSynthesizer::command(const std::string &text, const std::string &voice,
                                                    double pitch, double rate, const std::string &output_path) const{
    //pitchは半音単位(-20..20)，espeakは0..99(標準50)
    int espeak_pitch = std::min(99, std::max(0, (int)std::lround(50 + pitch * 2.5)));
    //rateは倍率，espeakは毎分の単語数(標準175)
    int words_per_minute = std::max(80, (int)std::lround(175 * rate));
    return {executable, "-v", voice, "-p", std::to_string(espeak_pitch),
            "-s", std::to_string(words_per_minute), "-w", output_path, "--", text};
}

std::optional<std::string> EspeakSynthesizer::synthesize(const std::string &text, const std::string &voice,
                                                         double pitch, double rate, const std::string &output_path){
    int code = runner.run(command(text, voice, pitch, rate, output_path));
    if (code != 0) {
        Logger::Warn("speech synthesis failed (exit " + std::to_string(code) + ") for " + output_path);
        return std::nullopt;
    }
    return output_path;
}

FFmpegAudioMixer::FFmpegAudioMixer(const CommandRunner &runner, const std::string &ffmpeg, const std::string &ffprobe)
    : runner(runner), ffmpeg(ffmpeg), ffprobe(ffprobe) {}

std::optional<std::string> FFmpegAudioMixer::overlay(const std::vector<std::string> &audio_paths, const std::string &output_path){
    if (audio_paths.empty()) return std::nullopt;
    if (audio_paths.size() == 1) return audio_paths[0];

    std::vector<std::string> args = {ffmpeg, "-y", "-loglevel", "error"};
    for (int i=0; i<audio_paths.size(); i++) {
        args.push_back("-i");
        args.push_back(audio_paths[i]);
    }
    args.push_back("-filter_complex");
    args.push_back("amix=inputs=" + std::to_string(audio_paths.size()) + ":duration=longest:dropout_transition=0");
    args.push_back(output_path);

    int code = runner.run(args);
    if (code != 0) {
        Logger::Warn("audio overlay failed (exit " + std::to_string(code) + ") for " + output_path);
        return std::nullopt;
    }
    return output_path;
}

std::optional<double> FFmpegAudioMixer::duration_of(const std::string &audio_path){
    std::string output;
    int code = runner.run({ffprobe, "-v", "error", "-show_entries", "format=duration",
                           "-of", "default=noprint_wrappers=1:nokey=1", audio_path}, &output);
    if (code != 0) return std::nullopt;
    std::istringstream in(output);
    double seconds = 0;
    if (!(in >> seconds) || seconds <= 0) return std::nullopt;
    return seconds;
}

namespace tone {

int wordCount(const std::string &text){
    std::istringstream in(text);
    std::string word;
    int count = 0;
    while (in >> word) count++;
    return count;
}

double placeholderDuration(const std::string &text){
    return 0.1 * wordCount(text);
}

bool writeWav(const std::string &output_path, const std::vector<float> &samples, int sample_rate){
    std::ofstream out(output_path, std::ios::binary);
    if (!out) return false;

    auto write_u32 = [&out](uint32_t v){
        char b[4] = {char(v & 0xff), char((v >> 8) & 0xff), char((v >> 16) & 0xff), char((v >> 24) & 0xff)};
        out.write(b, 4);
    };
    auto write_u16 = [&out](uint16_t v){
        char b[2] = {char(v & 0xff), char((v >> 8) & 0xff)};
        out.write(b, 2);
    };

    uint32_t data_size = (uint32_t)samples.size() * 2;
    out.write("RIFF", 4);
    write_u32(36 + data_size);
    out.write("WAVE", 4);
    out.write("fmt ", 4);
    write_u32(16);
    write_u16(1);                       //PCM
    write_u16(1);                       //mono
    write_u32(sample_rate);
    write_u32(sample_rate * 2);         //byte rate
    write_u16(2);                       //block align
    write_u16(16);                      //bits per sample
    out.write("data", 4);
    write_u32(data_size);
    for (float s : samples) {
        float clipped = std::max(-1.0f, std::min(1.0f, s));
        write_u16((uint16_t)(int16_t)std::lround(clipped * 32767));
    }
    return (bool)out;
}

bool writePlaceholderTone(const std::string &output_path, double duration){
    int n = (int)(sample_rate * duration);
    std::vector<float> samples(std::max(0, n));
    for (int i=0; i<samples.size(); i++) {
        double t = (double)i / sample_rate;
        samples[i] = (float)(std::sin(2 * CV_PI * 440 * t) * 0.3);
    }
    return writeWav(output_path, samples, sample_rate);
}

std::optional<double> wavDuration(const std::string &path){
    std::ifstream in(path, std::ios::binary);
    if (!in) return std::nullopt;
    auto read_u32 = [&in](uint32_t &v){
        unsigned char b[4];
        if (!in.read((char *)b, 4)) return false;
        v = b[0] | (b[1] << 8) | (b[2] << 16) | ((uint32_t)b[3] << 24);
        return true;
    };

    char tag[4];
    uint32_t riff_size = 0;
    if (!in.read(tag, 4) || std::string(tag, 4) != "RIFF") return std::nullopt;
    if (!read_u32(riff_size)) return std::nullopt;
    if (!in.read(tag, 4) || std::string(tag, 4) != "WAVE") return std::nullopt;

    //チャンクを順に読む　fmtのbyte rateとdataの大きさが揃えば終わり
    uint32_t byte_rate = 0;
    while (in.read(tag, 4)) {
        uint32_t size = 0;
        if (!read_u32(size)) return std::nullopt;
        std::string id(tag, 4);
        if (id == "fmt ") {
            char fmt[16];
            if (size < 16 || !in.read(fmt, 16)) return std::nullopt;
            byte_rate = (unsigned char)fmt[8] | ((unsigned char)fmt[9] << 8) |
                        ((unsigned char)fmt[10] << 16) | ((uint32_t)(unsigned char)fmt[11] << 24);
            in.seekg(size - 16 + (size & 1), std::ios::cur);
        }else if (id == "data") {
            if (byte_rate == 0 || size == 0) return std::nullopt;
            return (double)size / byte_rate;
        }else{
            in.seekg(size + (size & 1), std::ios::cur);
        }
    }
    return std::nullopt;
}

bool writeImpactEffect(const std::string &output_path, double duration, cv::RNG &rng){
    int n = (int)(sample_rate * duration);
    std::vector<float> samples(std::max(0, n));
    for (int i=0; i<samples.size(); i++) {
        double t = (double)i / sample_rate;
        samples[i] = (float)(rng.gaussian(1.0) * std::exp(-5 * t) * 0.5);
    }
    return writeWav(output_path, samples, sample_rate);
}

}
