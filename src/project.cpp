//
//  project.cpp
//  motion_comic
//

#include "project.hpp"

const char *clipKindName(ClipKind kind){
    switch (kind) {
        case ClipKind::pan_scan: return "pan_scan";
        case ClipKind::ken_burns: return "ken_burns";
        case ClipKind::transition: return "transition";
    }
    return "unknown";
}

const char *stageName(Stage stage){
    switch (stage) {
        case Stage::Created: return "Created";
        case Stage::Extracted: return "Extracted";
        case Stage::Detected: return "Detected";
        case Stage::Animated: return "Animated";
        case Stage::Audioed: return "Audioed";
        case Stage::Rendered: return "Rendered";
    }
    return "unknown";
}

const Page *Project::pageOf(const Region &panel) const{
    for (int i=0; i<pages.size(); i++) {
        if (pages[i].id == panel.parent_id) return &pages[i];
    }
    return nullptr;
}

void Project::advance(Stage next){
    stage = next;
    version++;
}
