//
//  project.hpp
//  motion_comic
//

#ifndef project_hpp
#define project_hpp

#include <optional>
#include <string>
#include <vector>
#include "opencv2/core.hpp"

//入力ページ画像（展開順）
struct Page {
    std::string id;
    std::string source_path;
    int index = 0;
};

//コマまたは吹き出し
//コマのbounding_boxはページ座標，吹き出しはコマ座標
struct Region {
    std::string id;
    cv::Rect bounding_box;
    std::string parent_id;
    std::string text;
};

enum class ClipKind {
    pan_scan,
    ken_burns,
    transition
};

const char *clipKindName(ClipKind kind);

struct AnimationClip {
    std::string owner_region_id;
    ClipKind kind = ClipKind::pan_scan;
    std::vector<std::string> frames;
    double frame_duration_seconds = 0.0;

    double duration_seconds() const { return frames.size() * frame_duration_seconds; }
};

struct AudioClip {
    std::string owner_region_id;
    std::string path;
    double duration_seconds = 0.0;
};

struct Segment {
    int order_index = 0;
    AnimationClip animation;
    std::optional<AudioClip> audio;
};

enum class Stage {
    Created = 0,
    Extracted,
    Detected,
    Animated,
    Audioed,
    Rendered
};

const char *stageName(Stage stage);

//1回の実行で扱う全データ　PipelineCoordinatorだけが書き換える
//クリップ類はコマ番号で引けるスロットとして事前に確保し，各ワーカーは自分のスロットだけに書く
struct Project {
    std::vector<Page> pages;
    std::vector<Region> panels;                 //読み順
    std::vector<std::vector<Region>> bubbles;   //panelsと同じ添字
    std::vector<std::optional<AnimationClip>> panel_clips;
    std::vector<std::optional<AnimationClip>> transition_clips; //[i]はコマi-1 -> iへの遷移
    std::vector<std::optional<AudioClip>> audio_clips;
    Stage stage = Stage::Created;
    int version = 0;

    const Page *pageOf(const Region &panel) const;

    //ステージ遷移時に呼ぶ
    void advance(Stage next);
};

#endif /* project_hpp */
