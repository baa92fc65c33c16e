//
//  sequence_assembler.hpp
//  motion_comic
//

#ifndef sequence_assembler_hpp
#define sequence_assembler_hpp

#include <map>
#include <string>
#include <vector>
#include "project.hpp"
#include "media_encoder.hpp"

struct ManifestEntry {
    std::string path;
    double duration = 0.0;
};

struct Manifest {
    std::vector<ManifestEntry> entries;
    double total_duration() const;
};

struct SubtitleEntry {
    double start = 0.0;
    double end = 0.0;
    std::string text;
};

//セグメント列をエンコーダ入力に変換し，セグメント毎のエンコード・音声多重化と最後の連結を依頼する
class SequenceAssembler
{
public:
    explicit SequenceAssembler(MediaEncoder &encoder);

    //全セグメントのフレームを順に並べる
    static Manifest buildManifest(const std::vector<Segment> &segments);
    static Manifest segmentManifest(const Segment &segment);
    //concat demuxer形式　最後のファイルはdurationなしでもう一度書く
    static std::string formatManifest(const Manifest &manifest);
    static std::string formatConcatList(const std::vector<std::string> &clip_paths);
    static std::string formatDuration(double seconds);

    //完成動画上の長さ　音声付きは映像と音声の短い方
    static double segmentDuration(const Segment &segment);
    //textsはコマid→表示する文字列　遷移と文字のないコマは時間だけ進める
    static std::vector<SubtitleEntry> buildSubtitles(const std::vector<Segment> &segments,
                                                     const std::map<std::string, std::string> &texts);
    static std::string formatSrt(const std::vector<SubtitleEntry> &entries);
    //HH:MM:SS,mmm
    static std::string formatSrtTime(double seconds);

    //work_dirにセグメント毎の中間ファイルを置き，output_pathに最終動画を書く
    //subtitle_textsが空でなければ連結後に字幕を焼き込む
    std::string assemble(const std::vector<Segment> &segments, const std::string &work_dir, const std::string &output_path,
                         const std::map<std::string, std::string> &subtitle_texts = {});

private:
    MediaEncoder &encoder;
};

#endif /* sequence_assembler_hpp */
