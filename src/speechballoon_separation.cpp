//
//  speechballoon_separation.cpp
//  motion_comic
//

#include "speechballoon_separation.hpp"
#include "panel_detection.hpp"

std::vector<Speechballoon::Balloon> Speechballoon::speechballoon_detect(const cv::Mat &src_img){
    std::vector<Speechballoon::Balloon> speechballoon_images;//return用　コマ単位の吹き出し群 (img + bbox)
    if (src_img.empty()) return speechballoon_images;

    //二値化のためにグレースケール化
    cv::Mat gray_img;
    if (src_img.channels() == 4) cv::cvtColor(src_img, gray_img, cv::COLOR_BGRA2GRAY);
    else if (src_img.channels() == 3) cv::cvtColor(src_img, gray_img, cv::COLOR_BGR2GRAY);
    else gray_img = src_img;

    //平滑化
    cv::Mat gaussian_img;
    cv::GaussianBlur(gray_img, gaussian_img, cv::Size(5,5), 0);

    //適応的二値化（階調反転）
    cv::Mat bin_img;
    cv::adaptiveThreshold(gaussian_img, bin_img, 255, cv::ADAPTIVE_THRESH_GAUSSIAN_C, cv::THRESH_BINARY_INV, 11, 2);

    //膨張
    cv::Mat kernel = cv::Mat::ones(3, 3, CV_8U);
    cv::dilate(bin_img, bin_img, kernel, cv::Point(-1,-1), 2);

    //輪郭抽出
    std::vector<std::vector<cv::Point> > contours;
    cv::findContours(bin_img, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    double panel_area = (double)src_img.rows * src_img.cols;  //コマの面積
    std::vector<cv::Rect> bounding_boxes;
    for (int i=0; i<contours.size(); i++) {
        cv::Rect bounding_box = cv::boundingRect(contours[i]); //バウンディングボックスの取得
        //極端に小さいor大きい，または吹き出しっぽくない形の除外
        if (judgeBalloonShape(contours[i], bounding_box, panel_area) == false) continue;
        bounding_boxes.push_back(bounding_box);
    }

    Paneldetect::sortReadingOrder(bounding_boxes);
    for (int i=0; i<bounding_boxes.size(); i++) {
        //吹き出し部分だけ切り取る
        cv::Mat crop_img(src_img, bounding_boxes[i]);
        speechballoon_images.emplace_back(crop_img.clone(), bounding_boxes[i]);
    }
    return speechballoon_images;
}

std::vector<Speechballoon::Balloon> Speechballoon::find_text_regions(const cv::Mat &src_img, TextRecognizer &ocr){
    std::vector<Speechballoon::Balloon> text_balloons;
    std::vector<Speechballoon::Balloon> candidates = speechballoon_detect(src_img);
    for (int i=0; i<candidates.size(); i++) {
        std::string text = trimText(ocr.extract_text(candidates[i].img));
        if (text.empty()) continue;//文字のない吹き出しは除外
        candidates[i].text = text;
        text_balloons.push_back(candidates[i]);
    }
    return text_balloons;
}

double Speechballoon::solidity(const std::vector<cv::Point> &contour){
    double area = cv::contourArea(contour);
    std::vector<cv::Point> hull;
    cv::convexHull(contour, hull);
    double hull_area = cv::contourArea(hull);
    if (hull_area <= 0) return 0;
    return area / hull_area;
}

//吹き出しの形判定
bool Speechballoon::judgeBalloonShape(const std::vector<cv::Point> &contour, const cv::Rect &bounding_box, double panel_area){
    double area = cv::contourArea(contour);  //輪郭の面積
    if (area < 100) return false;
    //切り出し後の画像サイズでコマに近しいものを除去
    if (bounding_box.area() >= panel_area * 0.9) return false;

    if (bounding_box.height <= 0) return false;
    double aspect_ratio = (double)bounding_box.width / bounding_box.height;
    if (aspect_ratio < 0.3 || aspect_ratio > 3.0) return false;

    //吹き出しは凸　インクのにじみは凸でない
    return solidity(contour) > 0.7;
}
