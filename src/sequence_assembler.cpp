//
//  sequence_assembler.cpp
//  motion_comic
//

#include "sequence_assembler.hpp"
#include "logger.hpp"
#include "pipeline_errors.hpp"
#include "command_runner.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <stdio.h>

double Manifest::total_duration() const{
    double total = 0.0;
    for (const ManifestEntry &entry : entries) total += entry.duration;
    return total;
}

SequenceAssembler::SequenceAssembler(MediaEncoder &encoder) : encoder(encoder) {}

std::string SequenceAssembler::formatDuration(double seconds){
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%.6f", seconds);
    return buffer;
}

Manifest SequenceAssembler::segmentManifest(const Segment &segment){
    Manifest manifest;
    for (const std::string &frame : segment.animation.frames) {
        manifest.entries.push_back({frame, segment.animation.frame_duration_seconds});
    }
    return manifest;
}

Manifest SequenceAssembler::buildManifest(const std::vector<Segment> &segments){
    Manifest manifest;
    for (int i=0; i<segments.size(); i++) {
        Manifest part = segmentManifest(segments[i]);
        manifest.entries.insert(manifest.entries.end(), part.entries.begin(), part.entries.end());
    }
    return manifest;
}

std::string SequenceAssembler::formatManifest(const Manifest &manifest){
    std::string text;
    for (const ManifestEntry &entry : manifest.entries) {
        text += "file " + CommandRunner::quote(entry.path) + "\n";
        text += "duration " + formatDuration(entry.duration) + "\n";
    }
    //concat demuxerは最後のdurationを無視するので最終フレームをもう一度並べる
    if (!manifest.entries.empty()) {
        text += "file " + CommandRunner::quote(manifest.entries.back().path) + "\n";
    }
    return text;
}

std::string SequenceAssembler::formatConcatList(const std::vector<std::string> &clip_paths){
    std::string text;
    for (const std::string &path : clip_paths) {
        text += "file " + CommandRunner::quote(path) + "\n";
    }
    return text;
}

double SequenceAssembler::segmentDuration(const Segment &segment){
    double duration = segment.animation.duration_seconds();
    if (segment.audio && segment.audio->duration_seconds > 0) {
        duration = std::min(duration, segment.audio->duration_seconds);
    }
    return duration;
}

std::vector<SubtitleEntry> SequenceAssembler::buildSubtitles(const std::vector<Segment> &segments,
                                                             const std::map<std::string, std::string> &texts){
    std::vector<SubtitleEntry> entries;
    double clock = 0.0;
    for (int i=0; i<segments.size(); i++) {
        const Segment &segment = segments[i];
        double duration = segmentDuration(segment);
        if (segment.animation.kind != ClipKind::transition) {
            auto found = texts.find(segment.animation.owner_region_id);
            if (found != texts.end() && !found->second.empty() && duration > 0) {
                entries.push_back({clock, clock + duration, found->second});
            }
        }
        clock += duration;
    }
    return entries;
}

std::string SequenceAssembler::formatSrtTime(double seconds){
    long long millis = std::llround(std::max(0.0, seconds) * 1000);
    char buffer[32];
    snprintf(buffer, sizeof(buffer), "%02lld:%02lld:%02lld,%03lld",
             millis / 3600000, (millis / 60000) % 60, (millis / 1000) % 60, millis % 1000);
    return buffer;
}

std::string SequenceAssembler::formatSrt(const std::vector<SubtitleEntry> &entries){
    std::string text;
    for (int i=0; i<entries.size(); i++) {
        text += std::to_string(i + 1) + "\n";
        text += formatSrtTime(entries[i].start) + " --> " + formatSrtTime(entries[i].end) + "\n";
        text += entries[i].text + "\n\n";
    }
    return text;
}

std::string SequenceAssembler::assemble(const std::vector<Segment> &segments, const std::string &work_dir, const std::string &output_path,
                                        const std::map<std::string, std::string> &subtitle_texts){
    if (segments.empty()) {
        throw EmptyInputError("assemble", "no segments to assemble");
    }
    std::filesystem::create_directories(work_dir);

    std::vector<std::string> segment_videos;
    for (int i=0; i<segments.size(); i++) {
        const Segment &segment = segments[i];
        char name[64];
        snprintf(name, sizeof(name), "segment_%04d", segment.order_index);
        std::string base = work_dir + "/" + name;

        std::string manifest_path = base + ".txt";
        {
            std::ofstream out(manifest_path);
            if (!out) throw EncodingFailure("assemble", "cannot write manifest " + manifest_path);
            out << formatManifest(segmentManifest(segment));
        }

        std::string video_path = base + ".mp4";
        encoder.encode_frames(manifest_path, video_path);

        if (segment.audio) {
            //映像か音声の短い方で切れる
            std::string muxed_path = base + "_with_audio.mp4";
            encoder.mux(video_path, segment.audio->path, muxed_path);
            segment_videos.push_back(muxed_path);
        }else{
            segment_videos.push_back(video_path);
        }
    }

    std::vector<SubtitleEntry> subtitles;
    if (!subtitle_texts.empty()) subtitles = buildSubtitles(segments, subtitle_texts);
    if (subtitles.empty()) {
        encoder.concat(segment_videos, output_path);
    }else{
        std::string joined_path = work_dir + "/joined.mp4";
        std::string srt_path = work_dir + "/subtitles.srt";
        encoder.concat(segment_videos, joined_path);
        {
            std::ofstream out(srt_path);
            if (!out) throw EncodingFailure("assemble", "cannot write subtitles " + srt_path);
            out << formatSrt(subtitles);
        }
        encoder.burn_subtitles(joined_path, srt_path, output_path);
        Logger::Info("burned " + std::to_string(subtitles.size()) + " subtitles");
    }
    Logger::Info("assembled " + std::to_string(segments.size()) + " segments into " + output_path);
    return output_path;
}
