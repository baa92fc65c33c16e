//
//  run_config.hpp
//  motion_comic
//

#ifndef run_config_hpp
#define run_config_hpp

#include <string>
#include <vector>
#include "media_encoder.hpp"

struct DetectionConfig {
    double min_area_ratio = 0.01;
    double max_area_ratio = 0.9;
    bool whole_page_fallback = true; //コマが見つからないページはページ全体を1コマに
    bool panel_ocr = true;           //コマ全体もOCRにかける（吹き出し外の擬音など）
    bool debug_images = false;       //コマ枠の重ね描きと切り出し画像を書く
    std::string debug_dir;           //空なら作業ディレクトリのdebug/
};

struct AnimationConfig {
    std::string style = "pan_scan";  //pan_scan, ken_burns, mixed
    double panel_duration = 2.5;
    double transition_duration = 0.5;
    double speed = 1.0;
    std::string transition = "fade"; //fade, slide, zoom
};

struct VoiceParams {
    bool enabled = true;
    std::string voice = "en-us";     //"mixed"なら吹き出し毎にvoice_poolから順番に
    double pitch = 0.0;
    double rate = 1.0;
    bool sound_effects = true;
    std::vector<std::string> voice_pool = {"en-us+m3", "en-us+f3", "en-gb+m1"};
};

struct RunConfig {
    std::string temp_dir;            //空ならシステムの一時ディレクトリ
    bool keep_temp = false;
    int seed = -1;                   //負ならtick countから
    int threads = 0;                 //0ならOpenCVの既定値
    int command_timeout = 0;         //秒　0なら無制限
    std::string log_file;
    bool subtitles = false;          //コマのテキストを字幕として焼き込む

    DetectionConfig detection;
    AnimationConfig animation;
    VoiceParams voice;
    EncoderSettings encoder;
    std::string ffprobe = "ffprobe";
    std::string tesseract = "tesseract";
    std::string ocr_language = "eng";
    std::string tts_command = "espeak-ng";
};

//YAML/JSON/XMLの設定ファイルを読む（cv::FileStorage）　無いキーは既定値のまま
RunConfig loadRunConfig(const std::string &path);
void loadRunConfig(const std::string &path, RunConfig &config);
//値の範囲チェック　不正ならstd::invalid_argument
void validateRunConfig(const RunConfig &config);

#endif /* run_config_hpp */
