//
//  audio_synthesis.hpp
//  motion_comic
//

#ifndef audio_synthesis_hpp
#define audio_synthesis_hpp

#include <optional>
#include <string>
#include <vector>
#include "opencv2/core.hpp"
#include "command_runner.hpp"

//音声合成の窓口　失敗時はstd::nulloptを返すかSynthesisFailureを投げる
class SpeechSynthesizer
{
public:
    virtual ~SpeechSynthesizer() {}
    virtual std::optional<std::string> synthesize(const std::string &text, const std::string &voice,
                                                  double pitch, double rate, const std::string &output_path) = 0;
};

//音声の重ね合わせ（同時再生）と長さの取得
class AudioMixer
{
public:
    virtual ~AudioMixer() {}
    //全入力を時刻0に揃えて重ねる．長さは最長の入力
    virtual std::optional<std::string> overlay(const std::vector<std::string> &audio_paths, const std::string &output_path) = 0;
    virtual std::optional<double> duration_of(const std::string &audio_path) = 0;
};

class EspeakSynthesizer : public SpeechSynthesizer
{
public:
    EspeakSynthesizer(const CommandRunner &runner, const std::string &executable = "espeak-ng");

    std::optional<std::string> synthesize(const std::string &text, const std::string &voice,
                                          double pitch, double rate, const std::string &output_path) override;
    //テキストは"--"の後ろに置く（"-"で始まるOCR結果をオプションと解釈させない）
    std::vector<std::string> command(const std::string &text, const std::string &voice,
                                     double pitch, double rate, const std::string &output_path) const;

private:
    CommandRunner runner;
    std::string executable;
};

class FFmpegAudioMixer : public AudioMixer
{
public:
    FFmpegAudioMixer(const CommandRunner &runner, const std::string &ffmpeg = "ffmpeg", const std::string &ffprobe = "ffprobe");

    std::optional<std::string> overlay(const std::vector<std::string> &audio_paths, const std::string &output_path) override;
    std::optional<double> duration_of(const std::string &audio_path) override;

private:
    CommandRunner runner;
    std::string ffmpeg;
    std::string ffprobe;
};

//自前で書き出す音声（WAV, 16bit mono）
namespace tone {
    const int sample_rate = 22050;

    //TTSが使えない時の代わりの音　長さは単語数×0.1秒
    double placeholderDuration(const std::string &text);
    int wordCount(const std::string &text);
    //440Hzのサイン波
    bool writePlaceholderTone(const std::string &output_path, double duration);
    //指数減衰するノイズ（衝撃音）
    bool writeImpactEffect(const std::string &output_path, double duration, cv::RNG &rng);
    bool writeWav(const std::string &output_path, const std::vector<float> &samples, int sample_rate);
    //RIFFヘッダから長さを読む　WAVでなければnullopt
    std::optional<double> wavDuration(const std::string &path);
}

#endif /* audio_synthesis_hpp */
