//
//  text_recognizer.hpp
//  motion_comic
//

#ifndef text_recognizer_hpp
#define text_recognizer_hpp

#include <atomic>
#include <string>
#include "opencv2/opencv.hpp"
#include "command_runner.hpp"

//OCRの窓口　文字がない・失敗した時は空文字列を返す（例外は投げない）
class TextRecognizer
{
public:
    virtual ~TextRecognizer() {}
    virtual std::string extract_text(const cv::Mat &image_region) = 0;
};

//tesseractコマンドによるOCR
class TesseractRecognizer : public TextRecognizer
{
public:
    TesseractRecognizer(const CommandRunner &runner, const std::string &work_dir,
                        const std::string &executable = "tesseract", const std::string &language = "eng");

    std::string extract_text(const cv::Mat &image_region) override;

    static cv::Mat preprocess(const cv::Mat &image_region);//適応的二値化＋ノイズ除去

private:
    CommandRunner runner;
    std::string work_dir;
    std::string executable;
    std::string language;
    std::atomic<int> counter;
};

//前後の空白を除去
std::string trimText(const std::string &text);

#endif /* text_recognizer_hpp */
