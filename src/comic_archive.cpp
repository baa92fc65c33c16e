//
//  comic_archive.cpp
//  motion_comic
//

#include "comic_archive.hpp"
#include "logger.hpp"
#include "pipeline_errors.hpp"
#include "read_file_path.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

static std::string lowerExtension(const std::string &path){
    std::string ext = std::filesystem::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c){ return std::tolower(c); });
    return ext;
}

ComicArchive::ComicArchive(const CommandRunner &runner) : runner(runner) {}

bool ComicArchive::isZip(const std::string &path){
    std::string ext = lowerExtension(path);
    return ext == ".cbz" || ext == ".zip";
}

bool ComicArchive::isRar(const std::string &path){
    std::string ext = lowerExtension(path);
    return ext == ".cbr" || ext == ".rar";
}

std::vector<std::string> ComicArchive::extract(const std::string &archive_path, const std::string &output_dir){
    std::error_code ec;
    if (std::filesystem::is_directory(archive_path, ec)) {
        Logger::Info("reading pages from directory " + archive_path);
        return ReadFilePath::get_image_path(archive_path);
    }
    if (!std::filesystem::exists(archive_path, ec)) {
        throw UnsupportedFormatError("extract", "file not found: " + archive_path);
    }

    std::filesystem::create_directories(output_dir);
    Logger::Info("extracting " + archive_path + " to " + output_dir);

    if (isZip(archive_path)) {
        int code = runner.run({"unzip", "-o", "-q", archive_path, "-d", output_dir});
        if (code != 0) {
            throw UnsupportedFormatError("extract", "unzip failed (exit " + std::to_string(code) + ") for " + archive_path);
        }
    }else if (isRar(archive_path)) {
        int code = runner.run({"unrar", "x", "-o+", "-idq", archive_path, output_dir + "/"});
        if (code != 0) {
            Logger::Warn("unrar failed (exit " + std::to_string(code) + "), trying 7z");
            code = runner.run({"7z", "x", "-y", archive_path, "-o" + output_dir});
            if (code != 0) {
                throw UnsupportedFormatError("extract", "failed to extract " + archive_path + " (install unrar or 7z)");
            }
        }
    }else{
        throw UnsupportedFormatError("extract", "unsupported file format: " + archive_path);
    }

    std::vector<std::string> image_paths = ReadFilePath::get_image_path(output_dir);
    Logger::Info("extracted " + std::to_string(image_paths.size()) + " images");
    return image_paths;
}
