//
//  media_encoder.hpp
//  motion_comic
//

#ifndef media_encoder_hpp
#define media_encoder_hpp

#include <string>
#include <vector>
#include "command_runner.hpp"

//フレーム列→動画の変換，音声の多重化，動画の連結
//失敗時はEncodingFailureを投げる
class MediaEncoder
{
public:
    virtual ~MediaEncoder() {}
    //manifest_pathはconcat demuxer形式（file/durationの並び）
    virtual void encode_frames(const std::string &manifest_path, const std::string &output_path) = 0;
    //短い方の長さに切り詰める
    virtual void mux(const std::string &video_path, const std::string &audio_path, const std::string &output_path) = 0;
    //入力順を保って連結する（全入力のコーデック設定が同じであること）
    virtual void concat(const std::vector<std::string> &clip_paths, const std::string &output_path) = 0;
    //SRTの字幕を映像に焼き込む　音声はそのまま
    virtual void burn_subtitles(const std::string &video_path, const std::string &subtitle_path, const std::string &output_path) = 0;
};

struct EncoderSettings {
    int width = 1920;
    int height = 1080;
    int fps = 24;
    std::string bitrate = "8000k";
    std::string ffmpeg = "ffmpeg";
};

class FFmpegEncoder : public MediaEncoder
{
public:
    FFmpegEncoder(const CommandRunner &runner, const EncoderSettings &settings);

    void encode_frames(const std::string &manifest_path, const std::string &output_path) override;
    void mux(const std::string &video_path, const std::string &audio_path, const std::string &output_path) override;
    void concat(const std::vector<std::string> &clip_paths, const std::string &output_path) override;
    void burn_subtitles(const std::string &video_path, const std::string &subtitle_path, const std::string &output_path) override;

    //固定解像度に収めて余白を黒で埋めるフィルタ
    std::string scaleFilter() const;
    //フィルタ引数とフィルタグラフの2段階でエスケープする
    static std::string subtitleFilter(const std::string &subtitle_path);

private:
    void execute(const std::vector<std::string> &args, const std::string &what);

    CommandRunner runner;
    EncoderSettings settings;
};

#endif /* media_encoder_hpp */
