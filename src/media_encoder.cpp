//
//  media_encoder.cpp
//  motion_comic
//

#include "media_encoder.hpp"
#include "logger.hpp"
#include "pipeline_errors.hpp"
#include "sequence_assembler.hpp"

#include <fstream>

FFmpegEncoder::FFmpegEncoder(const CommandRunner &runner, const EncoderSettings &settings)
    : runner(runner), settings(settings) {}

std::string FFmpegEncoder::scaleFilter() const{
    std::string w = std::to_string(settings.width);
    std::string h = std::to_string(settings.height);
    return "scale=" + w + ":" + h + ":force_original_aspect_ratio=decrease,pad=" + w + ":" + h + ":(ow-iw)/2:(oh-ih)/2,fps=" + std::to_string(settings.fps);
}

void FFmpegEncoder::execute(const std::vector<std::string> &args, const std::string &what){
    int code = runner.run(args);
    if (code != 0) {
        throw EncodingFailure("assemble", what + " failed (ffmpeg exit " + std::to_string(code) + ")");
    }
    Logger::Info(what);
}

//無音トラックを付けておき，音声のないクリップもconcatでそのまま繋げられるようにする
void FFmpegEncoder::encode_frames(const std::string &manifest_path, const std::string &output_path){
    execute({settings.ffmpeg, "-y", "-loglevel", "error",
             "-f", "concat", "-safe", "0", "-i", manifest_path,
             "-f", "lavfi", "-i", "anullsrc=r=44100:cl=stereo",
             "-map", "0:v:0", "-map", "1:a:0", "-shortest",
             "-vf", scaleFilter(),
             "-c:v", "libx264", "-preset", "medium", "-b:v", settings.bitrate,
             "-pix_fmt", "yuv420p", "-c:a", "aac", "-ar", "44100", "-ac", "2", output_path},
            "encoded " + output_path);
}

void FFmpegEncoder::mux(const std::string &video_path, const std::string &audio_path, const std::string &output_path){
    execute({settings.ffmpeg, "-y", "-loglevel", "error",
             "-i", video_path, "-i", audio_path,
             "-map", "0:v:0", "-map", "1:a:0",
             "-c:v", "copy", "-c:a", "aac", "-ar", "44100", "-ac", "2", "-shortest", output_path},
            "muxed " + output_path);
}

void FFmpegEncoder::concat(const std::vector<std::string> &clip_paths, const std::string &output_path){
    if (clip_paths.empty()) {
        throw EncodingFailure("assemble", "no clips to concatenate");
    }
    std::string list_path = output_path + ".concat.txt";
    {
        std::ofstream out(list_path);
        if (!out) throw EncodingFailure("assemble", "cannot write " + list_path);
        out << SequenceAssembler::formatConcatList(clip_paths);
    }
    execute({settings.ffmpeg, "-y", "-loglevel", "error",
             "-f", "concat", "-safe", "0", "-i", list_path, "-c", "copy", output_path},
            "concatenated " + std::to_string(clip_paths.size()) + " clips into " + output_path);
}

std::string FFmpegEncoder::subtitleFilter(const std::string &subtitle_path){
    std::string option_value;
    for (char c : subtitle_path) {
        if (c == '\\' || c == '\'' || c == ':') option_value += '\\';
        option_value += c;
    }
    std::string graph_value;
    for (char c : option_value) {
        if (c == '\\' || c == '\'' || c == '[' || c == ']' || c == ',' || c == ';') graph_value += '\\';
        graph_value += c;
    }
    return "subtitles=filename=" + graph_value;
}

void FFmpegEncoder::burn_subtitles(const std::string &video_path, const std::string &subtitle_path, const std::string &output_path){
    execute({settings.ffmpeg, "-y", "-loglevel", "error",
             "-i", video_path, "-vf", subtitleFilter(subtitle_path),
             "-c:v", "libx264", "-preset", "medium", "-b:v", settings.bitrate, "-pix_fmt", "yuv420p",
             "-c:a", "copy", output_path},
            "burned subtitles into " + output_path);
}
