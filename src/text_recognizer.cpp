//
//  text_recognizer.cpp
//  motion_comic
//

#include "text_recognizer.hpp"
#include "logger.hpp"

#include <filesystem>

std::string trimText(const std::string &text){
    const char *whitespace = " \t\r\n\f\v";
    size_t begin = text.find_first_not_of(whitespace);
    if (begin == std::string::npos) return "";
    size_t end = text.find_last_not_of(whitespace);
    return text.substr(begin, end - begin + 1);
}

TesseractRecognizer::TesseractRecognizer(const CommandRunner &runner, const std::string &work_dir,
                                         const std::string &executable, const std::string &language)
    : runner(runner), work_dir(work_dir), executable(executable), language(language), counter(0) {}

cv::Mat TesseractRecognizer::preprocess(const cv::Mat &image_region){
    cv::Mat gray_img;
    if (image_region.channels() == 4) cv::cvtColor(image_region, gray_img, cv::COLOR_BGRA2GRAY);
    else if (image_region.channels() == 3) cv::cvtColor(image_region, gray_img, cv::COLOR_BGR2GRAY);
    else gray_img = image_region.clone();

    cv::Mat bin_img;
    cv::adaptiveThreshold(gray_img, bin_img, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY, 11, 7);
    cv::Mat denoised_img;
    cv::fastNlMeansDenoising(bin_img, denoised_img, 10, 7, 21);
    return denoised_img;
}

std::string TesseractRecognizer::extract_text(const cv::Mat &image_region){
    if (image_region.empty() || image_region.cols < 2 || image_region.rows < 2) return "";

    std::filesystem::create_directories(work_dir);
    std::string image_path = work_dir + "/ocr_" + std::to_string(counter++) + ".png";
    if (!cv::imwrite(image_path, preprocess(image_region))) {
        Logger::Warn("OCR: failed to write " + image_path);
        return "";
    }

    std::string output;
    int code = runner.run({executable, image_path, "stdout", "-l", language, "--psm", "6"}, &output);
    std::error_code ec;
    std::filesystem::remove(image_path, ec);
    if (code != 0) {
        Logger::Warn("OCR failed (exit " + std::to_string(code) + ") for " + image_path);
        return "";
    }
    return trimText(output);
}
