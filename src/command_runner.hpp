//
//  command_runner.hpp
//  motion_comic
//

#ifndef command_runner_hpp
#define command_runner_hpp

#include <string>
#include <vector>

//外部コマンド（ffmpeg, tesseract, espeak-ng, unzip...）の実行
class CommandRunner
{
public:
    //timeout_seconds > 0 ならcoreutilsのtimeoutで包む
    explicit CommandRunner(int timeout_seconds = 0);

    //終了コードを返す．captureがあれば標準出力を格納する
    int run(const std::string &command, std::string *capture = nullptr) const;
    int run(const std::vector<std::string> &args, std::string *capture = nullptr) const;

    static std::string quote(const std::string &arg);//シェル用にシングルクォートで囲む
    static std::string join(const std::vector<std::string> &args);

private:
    int timeout_seconds;
};

#endif /* command_runner_hpp */
