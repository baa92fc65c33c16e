//
//  motion_synthesis.cpp
//  motion_comic
//

#include "motion_synthesis.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <stdexcept>

TransitionKind parseTransitionKind(const std::string &name){
    if (name == "fade") return TransitionKind::fade;
    if (name == "slide") return TransitionKind::slide;
    if (name == "zoom") return TransitionKind::zoom;
    Logger::Warn("unknown transition '" + name + "', using fade");
    return TransitionKind::fade;
}

MotionSynthesizer::MotionSynthesizer(int fps) : frames_per_second(fps) {}

int MotionSynthesizer::frameCount(double duration, int fps){
    long count = std::lround(duration * fps);
    return (int)std::max(1L, count);
}

double MotionSynthesizer::interpolationFactor(int i, int total_frames){
    if (total_frames <= 1) return 0.0;
    return (double)i / (total_frames - 1);
}

double MotionSynthesizer::easeInOut(double t){
    if (t < 0.5) return 2 * t * t;
    return 1 - std::pow(-2 * t + 2, 2) / 2;
}

cv::Rect MotionSynthesizer::cropRect(cv::Size image_size, double zoom, double x, double y){
    if (zoom < 1.0) zoom = 1.0;
    int crop_width = std::max(1, int(image_size.width / zoom));
    int crop_height = std::max(1, int(image_size.height / zoom));
    int crop_x = std::min(std::max(0, int(x)), image_size.width - crop_width);
    int crop_y = std::min(std::max(0, int(y)), image_size.height - crop_height);
    return cv::Rect(crop_x, crop_y, crop_width, crop_height);
}

std::string MotionSynthesizer::writeFrame(const cv::Mat &frame, const std::string &output_dir, int index) const{
    char name[32];
    snprintf(name, sizeof(name), "frame_%04d.jpg", index);
    std::string frame_path = output_dir + "/" + name;
    if (!cv::imwrite(frame_path, frame)) {
        throw std::runtime_error("failed to write frame " + frame_path);
    }
    return frame_path;
}

std::vector<std::string> MotionSynthesizer::pan_and_scan(const cv::Mat &image, const std::optional<cv::Rect> &region,
                                                         double duration, const std::string &output_dir, cv::RNG &rng) const{
    if (image.empty()) throw std::invalid_argument("pan_and_scan: empty image");
    std::filesystem::create_directories(output_dir);

    int width = image.cols;
    int height = image.rows;
    int total_frames = frameCount(duration, frames_per_second);

    double start_zoom, end_zoom;
    double start_x, start_y, end_x, end_y;
    if (!region || region->width <= 0 || region->height <= 0) {
        //領域指定なし：ゆっくり寄りながら流す
        start_zoom = 1.0;
        end_zoom = 1.5;
        start_x = rng.uniform(0, std::max(1, int(width * 0.1)));
        start_y = rng.uniform(0, std::max(1, int(height * 0.1)));
        end_x = rng.uniform(int(width * 0.1), std::max(int(width * 0.1) + 1, int(width * 0.2)));
        end_y = rng.uniform(int(height * 0.1), std::max(int(height * 0.1) + 1, int(height * 0.2)));
    }else{
        const cv::Rect &target = *region;
        start_zoom = 1.0;
        start_x = 0;
        start_y = 0;
        //対象領域が画面の8割に収まるズーム
        end_zoom = std::min((double)width / target.width, (double)height / target.height) * 0.8;
        end_zoom = std::max(1.0, end_zoom);
        end_x = std::max(0.0, target.x - (width / end_zoom - target.width) / 2);
        end_y = std::max(0.0, target.y - (height / end_zoom - target.height) / 2);
    }

    std::vector<std::string> frame_paths;
    for (int i=0; i<total_frames; i++) {
        double f = easeInOut(interpolationFactor(i, total_frames));
        double zoom = start_zoom + f * (end_zoom - start_zoom);
        double x = start_x + f * (end_x - start_x);
        double y = start_y + f * (end_y - start_y);

        cv::Rect crop = cropRect(image.size(), zoom, x, y);
        cv::Mat frame;
        cv::resize(image(crop), frame, image.size(), 0, 0, cv::INTER_CUBIC);//元の解像度に戻す
        frame_paths.push_back(writeFrame(frame, output_dir, i));
    }
    Logger::Debug("pan and scan: " + std::to_string(frame_paths.size()) + " frames -> " + output_dir);
    return frame_paths;
}

std::vector<std::string> MotionSynthesizer::ken_burns(const cv::Mat &image, double duration,
                                                      const std::string &output_dir, cv::RNG &rng) const{
    if (image.empty()) throw std::invalid_argument("ken_burns: empty image");
    std::filesystem::create_directories(output_dir);

    int width = image.cols;
    int height = image.rows;
    int total_frames = frameCount(duration, frames_per_second);

    //ズームインかズームアウトか
    bool zoom_in = rng.uniform(0, 2) == 1;
    double start_scale = zoom_in ? 1.0 : 1.3;
    double end_scale = zoom_in ? 1.3 : 1.0;

    double max_scale = std::max(start_scale, end_scale);
    int max_x_offset = std::max(1, int(width * (max_scale - 1)));
    int max_y_offset = std::max(1, int(height * (max_scale - 1)));
    int start_x = rng.uniform(0, max_x_offset);
    int start_y = rng.uniform(0, max_y_offset);
    int end_x = rng.uniform(0, max_x_offset);
    int end_y = rng.uniform(0, max_y_offset);

    cv::Point2f center(width / 2.0f, height / 2.0f);
    std::vector<std::string> frame_paths;
    for (int i=0; i<total_frames; i++) {
        double t = interpolationFactor(i, total_frames);//線形
        double scale = start_scale + t * (end_scale - start_scale);
        int x_offset = int(start_x + t * (end_x - start_x));
        int y_offset = int(start_y + t * (end_y - start_y));

        cv::Mat transform = cv::getRotationMatrix2D(center, 0, scale);
        transform.at<double>(0, 2) -= x_offset;
        transform.at<double>(1, 2) -= y_offset;

        cv::Mat frame;
        cv::warpAffine(image, frame, transform, image.size(), cv::INTER_LINEAR, cv::BORDER_CONSTANT, cv::Scalar(0, 0, 0));
        frame_paths.push_back(writeFrame(frame, output_dir, i));
    }
    Logger::Debug("ken burns (" + std::string(zoom_in ? "in" : "out") + "): " + std::to_string(frame_paths.size()) + " frames -> " + output_dir);
    return frame_paths;
}

cv::Mat MotionSynthesizer::transitionFrame(const cv::Mat &from_image, const cv::Mat &to_image, TransitionKind kind, double t){
    cv::Mat frame;
    int width = from_image.cols;
    int height = from_image.rows;
    switch (kind) {
        case TransitionKind::slide: {
            //右から左へ押し出す
            frame = cv::Mat::zeros(from_image.size(), from_image.type());
            int offset = std::min(width, std::max(0, (int)std::lround(width * t)));
            if (offset < width) {
                from_image(cv::Rect(offset, 0, width - offset, height)).copyTo(frame(cv::Rect(0, 0, width - offset, height)));
            }
            if (offset > 0) {
                to_image(cv::Rect(0, 0, offset, height)).copyTo(frame(cv::Rect(width - offset, 0, offset, height)));
            }
            break;
        }
        case TransitionKind::zoom: {
            //次のコマを中央から拡大して重ねる
            frame = from_image.clone();
            int scaled_width = int(width * t);
            int scaled_height = int(height * t);
            if (scaled_width > 0 && scaled_height > 0) {
                cv::Mat resized;
                cv::resize(to_image, resized, cv::Size(scaled_width, scaled_height));
                int x_offset = (width - scaled_width) / 2;
                int y_offset = (height - scaled_height) / 2;
                resized.copyTo(frame(cv::Rect(x_offset, y_offset, scaled_width, scaled_height)));
            }
            break;
        }
        case TransitionKind::fade:
        default:
            cv::addWeighted(from_image, 1 - t, to_image, t, 0, frame);
            break;
    }
    return frame;
}

std::vector<std::string> MotionSynthesizer::panel_transition(const cv::Mat &from_image, const cv::Mat &to_image, TransitionKind kind,
                                                             double duration, const std::string &output_dir) const{
    if (from_image.empty() || to_image.empty()) throw std::invalid_argument("panel_transition: empty image");
    std::filesystem::create_directories(output_dir);

    //サイズと型を合わせる
    cv::Mat to_matched = to_image;
    if (to_matched.type() != from_image.type()) {
        cv::Mat converted;
        if (from_image.channels() == 3 && to_matched.channels() == 1) cv::cvtColor(to_matched, converted, cv::COLOR_GRAY2BGR);
        else if (from_image.channels() == 1 && to_matched.channels() == 3) cv::cvtColor(to_matched, converted, cv::COLOR_BGR2GRAY);
        else if (from_image.channels() == 3 && to_matched.channels() == 4) cv::cvtColor(to_matched, converted, cv::COLOR_BGRA2BGR);
        else throw std::invalid_argument("panel_transition: incompatible image types");
        to_matched = converted;
    }
    if (to_matched.size() != from_image.size()) {
        cv::Mat resized;
        cv::resize(to_matched, resized, from_image.size());
        to_matched = resized;
    }

    int total_frames = frameCount(duration, frames_per_second);
    std::vector<std::string> frame_paths;
    for (int i=0; i<total_frames; i++) {
        double t = interpolationFactor(i, total_frames);
        frame_paths.push_back(writeFrame(transitionFrame(from_image, to_matched, kind, t), output_dir, i));
    }
    Logger::Debug("transition: " + std::to_string(frame_paths.size()) + " frames -> " + output_dir);
    return frame_paths;
}
