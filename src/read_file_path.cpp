#include "read_file_path.hpp"
#include <algorithm>
#include <cctype>

bool ReadFilePath::has_extension(const std::string &path, const std::string &ext) {
    if (ext.empty()) return true;
    std::string lower = path;
    std::string e = ext;
    for (auto &c : lower) c = std::tolower((unsigned char)c);
    for (auto &c : e) c = std::tolower((unsigned char)c);
    if (lower.size() >= e.size()) {
        return lower.substr(lower.size() - e.size()) == e;
    }
    return false;
}

// Compare digit runs by numeric value, everything else case-insensitively
bool ReadFilePath::natural_less(const std::string &a, const std::string &b) {
    size_t i = 0, j = 0;
    while (i < a.size() && j < b.size()) {
        if (std::isdigit((unsigned char)a[i]) && std::isdigit((unsigned char)b[j])) {
            size_t ie = i, je = j;
            while (ie < a.size() && std::isdigit((unsigned char)a[ie])) ie++;
            while (je < b.size() && std::isdigit((unsigned char)b[je])) je++;
            std::string na = a.substr(i, ie - i);
            std::string nb = b.substr(j, je - j);
            // strip leading zeros, then a longer run is a bigger number
            na.erase(0, std::min(na.find_first_not_of('0'), na.size()));
            nb.erase(0, std::min(nb.find_first_not_of('0'), nb.size()));
            if (na.size() != nb.size()) return na.size() < nb.size();
            if (na != nb) return na < nb;
            i = ie;
            j = je;
        } else {
            char ca = std::tolower((unsigned char)a[i]);
            char cb = std::tolower((unsigned char)b[j]);
            if (ca != cb) return ca < cb;
            i++;
            j++;
        }
    }
    if ((a.size() - i) != (b.size() - j)) return (a.size() - i) < (b.size() - j);
    return a < b;
}

std::vector<std::string> ReadFilePath::get_file_path(std::string dir_path) {
    return get_file_path(dir_path, std::vector<std::string>());
}

std::vector<std::string> ReadFilePath::get_file_path(std::string dir_path, const std::vector<std::string> &extensions) {
    std::vector<std::string> files;
    std::error_code ec;
    if (!std::filesystem::is_directory(dir_path, ec)) return files;
    for (std::filesystem::recursive_directory_iterator it(dir_path, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) continue;
        std::string full = it->path().string();
        bool matched = extensions.empty();
        for (const std::string &ext : extensions) {
            if (has_extension(full, ext)) {
                matched = true;
                break;
            }
        }
        if (matched) files.push_back(full);
    }
    std::sort(files.begin(), files.end(), natural_less);
    return files;
}

std::vector<std::string> ReadFilePath::get_image_path(std::string dir_path) {
    return get_file_path(dir_path, {".jpg", ".jpeg", ".png", ".bmp", ".webp"});
}
