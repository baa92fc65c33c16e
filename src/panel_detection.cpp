//
//  panel_detection.cpp
//  motion_comic
//

#include "panel_detection.hpp"
#include <algorithm>

Paneldetect::Paneldetect(double min_area_ratio, double max_area_ratio)
    : min_area_ratio(min_area_ratio), max_area_ratio(max_area_ratio) {}

std::vector<cv::Rect> Paneldetect::panel_detect(const cv::Mat &src_page){
    return panel_detect(src_page, min_area_ratio, max_area_ratio);
}

std::vector<cv::Rect> Paneldetect::panel_detect(const cv::Mat &src_page, double min_area_ratio, double max_area_ratio){
    std::vector<cv::Rect> bounding_boxes; //バウンディングボックス群
    if (src_page.empty()) return bounding_boxes;

    cv::Mat gray_img;
    if (src_page.channels() == 4) {
        cv::cvtColor(src_page, gray_img, cv::COLOR_BGRA2GRAY);
    }else if (src_page.channels() == 3) {//入力画像がグレースケールでない時
        cv::cvtColor(src_page, gray_img, cv::COLOR_BGR2GRAY);
    }else{
        gray_img = src_page;
    }

    //階調反転二値化（インクを前景に）
    cv::Mat inverse_bin_img;
    cv::threshold(gray_img, inverse_bin_img, 220, 255, cv::THRESH_BINARY_INV);

    //膨張で隙間を埋めてから収縮でノイズを落とす
    cv::Mat kernel = cv::Mat::ones(3, 3, CV_8U);
    cv::dilate(inverse_bin_img, inverse_bin_img, kernel, cv::Point(-1,-1), 2);//膨張
    cv::erode(inverse_bin_img, inverse_bin_img, kernel, cv::Point(-1,-1), 1);//収縮

    std::vector<std::vector<cv::Point>> contours; //輪郭点群
    cv::findContours(inverse_bin_img, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE); //外側輪郭のみ

    double page_area = (double)src_page.cols * src_page.rows;
    for (int i=0; i<contours.size(); i++) {
        double area = cv::contourArea(contours[i]);
        if (judgeAreaOfBoundingBox(area, page_area, min_area_ratio, max_area_ratio) == false) continue;

        cv::Rect bounding_box = cv::boundingRect(contours[i]); //バウンディングボックスの取得
        if (judgeAspectRatio(bounding_box) == false) continue;
        if (judgeCornerArtifact(bounding_box, src_page.size()) == true) continue;

        bounding_boxes.push_back(bounding_box); //バウンディングボックスの登録
    }

    bounding_boxes = mergeOverlappingBoxes(bounding_boxes);
    sortReadingOrder(bounding_boxes);
    return bounding_boxes;
}

//面積判定
bool Paneldetect::judgeAreaOfBoundingBox(double area, double page_area, double min_area_ratio, double max_area_ratio){
    if (area < min_area_ratio * page_area || area > max_area_ratio * page_area) {
        return(false);
    }
    return(true);
}

//縦横比が[0.1, 10]の外なら検出ミスとみなす
bool Paneldetect::judgeAspectRatio(const cv::Rect &bounding_box){
    if (bounding_box.height <= 0) return(false);
    double aspect_ratio = (double)bounding_box.width / bounding_box.height;
    if (aspect_ratio > 10 || aspect_ratio < 0.1) {
        return(false);
    }
    return(true);
}

//左端と上端の両方に寄っている矩形はページ外にはみ出したコマの断片
bool Paneldetect::judgeCornerArtifact(const cv::Rect &bounding_box, cv::Size page_size){
    int edge_margin = int(std::min(page_size.width, page_size.height) * 0.01);
    return bounding_box.x < edge_margin && bounding_box.y < edge_margin;
}

bool Paneldetect::judgeBoundingBoxOverlap(const cv::Rect &a, const cv::Rect &b, double overlap_threshold){
    cv::Rect overlap_rect = a & b;
    double smaller_area = std::min(a.area(), b.area());
    return (double)overlap_rect.area() > overlap_threshold * smaller_area;
}

std::vector<cv::Rect> Paneldetect::mergeOverlappingBoxes(std::vector<cv::Rect> bounding_boxes, double overlap_threshold){
    //統合で数が減らなくなるまで繰り返す（出力に再度かけても変化しない）
    while (true) {
        std::stable_sort(bounding_boxes.begin(), bounding_boxes.end(), [](const cv::Rect &a, const cv::Rect &b){
            return a.area() > b.area();
        });

        std::vector<cv::Rect> merged;
        std::vector<bool> used(bounding_boxes.size(), false);

        for (int i=0; i<bounding_boxes.size(); i++) {
            if (used[i]) continue;
            used[i] = true;
            cv::Rect merged_box = bounding_boxes[i];

            //この種で吸収が起きなくなるまで
            bool absorbed = true;
            while (absorbed) {
                absorbed = false;
                for (int j=0; j<bounding_boxes.size(); j++) {
                    if (used[j]) continue;
                    if (judgeBoundingBoxOverlap(merged_box, bounding_boxes[j], overlap_threshold)) {
                        merged_box = merged_box | bounding_boxes[j]; //両方を含む矩形
                        used[j] = true;
                        absorbed = true;
                    }
                }
            }
            merged.push_back(merged_box);
        }

        if (merged.size() == bounding_boxes.size()) {
            return merged;
        }
        bounding_boxes = merged;
    }
}

void Paneldetect::sortReadingOrder(std::vector<cv::Rect> &bounding_boxes){
    std::stable_sort(bounding_boxes.begin(), bounding_boxes.end(), [](const cv::Rect &a, const cv::Rect &b){
        if (a.y != b.y) return a.y < b.y;
        return a.x < b.x;
    });
}

cv::Mat Paneldetect::visualizePanels(const cv::Mat &src_page, const std::vector<cv::Rect> &bounding_boxes){
    cv::Mat overlay;
    if (src_page.channels() == 1) cv::cvtColor(src_page, overlay, cv::COLOR_GRAY2BGR);
    else overlay = src_page.clone();

    for (int i=0; i<bounding_boxes.size(); i++) {
        const cv::Rect &box = bounding_boxes[i];
        cv::rectangle(overlay, box, cv::Scalar(0, 255, 0), 2);
        //枠の上に収まらなければ枠の内側に書く
        int text_y = box.y > 20 ? box.y - 5 : box.y + 20;
        cv::putText(overlay, "Panel " + std::to_string(i + 1), cv::Point(box.x, text_y),
                    cv::FONT_HERSHEY_SIMPLEX, 0.7, cv::Scalar(0, 255, 0), 2);
    }
    return overlay;
}
