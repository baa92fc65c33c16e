//
//  panel_detection.hpp
//  motion_comic
//

#ifndef panel_detection_hpp
#define panel_detection_hpp

#include <vector>
#include <stdio.h>
#include "opencv2/opencv.hpp"

//コマ抽出クラス　入力はページ画像，出力は読み順に並んだコマ矩形（ページ座標）
class Paneldetect
{
public:
    Paneldetect(double min_area_ratio = 0.01, double max_area_ratio = 0.9);

    std::vector<cv::Rect> panel_detect(const cv::Mat &src_page);//コマ抽出関数
    std::vector<cv::Rect> panel_detect(const cv::Mat &src_page, double min_area_ratio, double max_area_ratio);

    //重なったバウンディングボックスの統合（面積の大きい順に吸収）
    static std::vector<cv::Rect> mergeOverlappingBoxes(std::vector<cv::Rect> bounding_boxes, double overlap_threshold = 0.3);
    //上から下，左から右
    static void sortReadingOrder(std::vector<cv::Rect> &bounding_boxes);
    //交差面積が小さい方の面積のoverlap_threshold倍を超えるか
    static bool judgeBoundingBoxOverlap(const cv::Rect &a, const cv::Rect &b, double overlap_threshold = 0.3);
    //確認用　コマ枠と番号(Panel 1, 2, ...)を描いたコピーを返す
    static cv::Mat visualizePanels(const cv::Mat &src_page, const std::vector<cv::Rect> &bounding_boxes);

private:
    bool judgeAreaOfBoundingBox(double area, double page_area, double min_area_ratio, double max_area_ratio);//面積判定
    bool judgeAspectRatio(const cv::Rect &bounding_box);//極端な縦横比の除外
    bool judgeCornerArtifact(const cv::Rect &bounding_box, cv::Size page_size);//左上の角に接する断片の除外

    double min_area_ratio;
    double max_area_ratio;
};

#endif /* panel_detection_hpp */
