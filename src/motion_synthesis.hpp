//
//  motion_synthesis.hpp
//  motion_comic
//

#ifndef motion_synthesis_hpp
#define motion_synthesis_hpp

#include <optional>
#include <string>
#include <vector>
#include "opencv2/opencv.hpp"

enum class TransitionKind {
    fade,
    slide,
    zoom
};

//"fade" "slide" "zoom"　それ以外はfade
TransitionKind parseTransitionKind(const std::string &name);

//コマ画像から動きのあるフレーム列を作る
//どの効果もoutput_dirにframe_0000.jpg...を書き出し，そのパスを順番に返す
class MotionSynthesizer
{
public:
    explicit MotionSynthesizer(int fps = 24);

    //全体から対象領域へのズーム（regionがなければランダムな移動）
    std::vector<std::string> pan_and_scan(const cv::Mat &image, const std::optional<cv::Rect> &region,
                                          double duration, const std::string &output_dir, cv::RNG &rng) const;
    //ランダムなズームイン/アウト＋平行移動
    std::vector<std::string> ken_burns(const cv::Mat &image, double duration,
                                       const std::string &output_dir, cv::RNG &rng) const;
    //コマ間の遷移
    std::vector<std::string> panel_transition(const cv::Mat &from_image, const cv::Mat &to_image, TransitionKind kind,
                                              double duration, const std::string &output_dir) const;

    int fps() const { return frames_per_second; }

    static int frameCount(double duration, int fps);//max(1, round(duration*fps))
    static double interpolationFactor(int i, int total_frames);
    static double easeInOut(double t);
    //ズーム率と左上座標から切り出し矩形を求める（画像内に収める）
    static cv::Rect cropRect(cv::Size image_size, double zoom, double x, double y);
    static cv::Mat transitionFrame(const cv::Mat &from_image, const cv::Mat &to_image, TransitionKind kind, double t);

private:
    std::string writeFrame(const cv::Mat &frame, const std::string &output_dir, int index) const;

    int frames_per_second;
};

#endif /* motion_synthesis_hpp */
