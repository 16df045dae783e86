#include "courtops/core/util/AtomicFileWriter.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <system_error>

namespace courtops::core::util {

std::string AtomicFileWriter::BackupPathFor(const std::string& path) {
    std::filesystem::path fs_path(path);
    const std::string extension = fs_path.extension().string();
    fs_path.replace_extension(".backup" + extension);
    return fs_path.string();
}

bool AtomicFileWriter::Write(const std::string& path, const std::string& contents, bool keep_backup) {
    const std::filesystem::path fs_path(path);
    std::error_code ec;
    if (!fs_path.parent_path().empty()) {
        std::filesystem::create_directories(fs_path.parent_path(), ec);
        if (ec) {
            std::cerr << "[atomic] Failed to create directory for " << path << ": " << ec.message() << '\n';
            return false;
        }
    }

    const std::string temp_path = path + ".tmp";
    {
        std::ofstream output(temp_path, std::ios::binary | std::ios::trunc);
        if (!output) {
            std::cerr << "[atomic] Failed to open temp file: " << temp_path << '\n';
            return false;
        }
        output.write(contents.data(), static_cast<std::streamsize>(contents.size()));
        output.flush();
        if (!output) {
            std::cerr << "[atomic] Failed to write temp file: " << temp_path << '\n';
            std::remove(temp_path.c_str());
            return false;
        }
    }

    if (keep_backup && std::filesystem::exists(fs_path, ec)) {
        std::filesystem::copy_file(fs_path, BackupPathFor(path),
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            std::cerr << "[atomic] Backup failed for " << path << ": " << ec.message() << '\n';
        }
    }

    std::filesystem::rename(temp_path, fs_path, ec);
    if (ec) {
        std::cerr << "[atomic] rename failed for " << path << ": " << ec.message() << '\n';
        std::remove(temp_path.c_str());
        return false;
    }
    return true;
}

}  // namespace courtops::core::util
