#ifndef read_file_path_hpp
#define read_file_path_hpp

#include <stdio.h>
#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <filesystem>

class ReadFilePath {
public:
    static std::vector<std::string> get_file_path(std::string dir_path); //Read all files in the directory tree

    static std::vector<std::string> get_file_path(std::string dir_path, const std::vector<std::string> &extensions); // Only files with one of the extensions (ex> .png .jpg)

    static std::vector<std::string> get_image_path(std::string dir_path); // Page images (jpg, jpeg, png, bmp, webp)

    static bool natural_less(const std::string &a, const std::string &b); // page2 < page10
private:
    static bool has_extension(const std::string &path, const std::string &ext);
};

#endif /* read_file_path_hpp */
