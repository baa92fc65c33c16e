//
//  comic_archive.hpp
//  motion_comic
//

#ifndef comic_archive_hpp
#define comic_archive_hpp

#include <string>
#include <vector>
#include "command_runner.hpp"

//コミックアーカイブ（cbz/cbr）を展開してページ画像のパスを返す
//ディレクトリを渡した時はその中の画像をそのまま使う
class ComicArchive
{
public:
    explicit ComicArchive(const CommandRunner &runner);

    std::vector<std::string> extract(const std::string &archive_path, const std::string &output_dir);

    static bool isZip(const std::string &path);
    static bool isRar(const std::string &path);

private:
    CommandRunner runner;
};

#endif /* comic_archive_hpp */
