//
//  speechballoon_separation.hpp
//  motion_comic
//

#ifndef speechballoon_separation_hpp
#define speechballoon_separation_hpp

#include <vector>
#include <string>
#include <stdio.h>
#include "opencv2/opencv.hpp"
#include "text_recognizer.hpp"

//吹き出し抽出クラス　入力はコマ画像
class Speechballoon
{
    public:
        struct Balloon {
            cv::Mat img;       // cropped image of the balloon
            cv::Rect bbox;     // bbox relative to the input panel
            std::string text;  // OCR result (empty until find_text_regions)
            Balloon() {}
            Balloon(const cv::Mat &i, const cv::Rect &b): img(i), bbox(b) {}
        };

        // Balloon candidates in reading order
        std::vector<Balloon> speechballoon_detect(const cv::Mat &src_img);//コマ画像
        // Candidates passed through OCR; balloons without text are dropped
        std::vector<Balloon> find_text_regions(const cv::Mat &src_img, TextRecognizer &ocr);

        static double solidity(const std::vector<cv::Point> &contour);//輪郭面積/凸包面積

    private:
        bool judgeBalloonShape(const std::vector<cv::Point> &contour, const cv::Rect &bounding_box, double panel_area);
};
#endif /* speechballoon_separation_hpp */
