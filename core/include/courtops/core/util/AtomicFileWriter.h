#pragma once

#include <string>

namespace courtops::core::util {

class AtomicFileWriter {
public:
    // Writes through a sibling temp file and renames it into place. With
    // keep_backup the previous contents survive as <stem>.backup<ext>.
    static bool Write(const std::string& path, const std::string& contents, bool keep_backup = false);
    static std::string BackupPathFor(const std::string& path);
};

}  // namespace courtops::core::util
