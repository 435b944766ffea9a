// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;

/**
 * @brief Scratch directory removed on destruction
 */
class TempDir {
  public:
    explicit TempDir(const std::string& tag) {
        path_ = fs::temp_directory_path() /
                ("raspap_" + tag + "_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const {
        return path_;
    }

    /// Write (or overwrite) a file relative to the directory; returns its full path
    std::string write(const std::string& name, const std::string& content) const {
        fs::path file = path_ / name;
        fs::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::trunc);
        out << content;
        return file.string();
    }

    std::string file(const std::string& name) const {
        return (path_ / name).string();
    }

  private:
    fs::path path_;
};
