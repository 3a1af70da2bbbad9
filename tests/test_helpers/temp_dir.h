// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

/**
 * @file temp_dir.h
 * @brief RAII scratch directory for filesystem tests
 */

#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <sys/stat.h>
#include <unistd.h>

class TempDir {
  public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("kiro2api_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const {
        return path_;
    }

    std::string str() const {
        return path_.string();
    }

    /// Path of @p rel inside the directory
    std::string file(const std::string& rel) const {
        return (path_ / rel).string();
    }

    /// Write @p content to @p rel (parent directories are created)
    std::string write(const std::string& rel, const std::string& content, mode_t mode = 0644) const {
        auto p = path_ / rel;
        std::filesystem::create_directories(p.parent_path());
        {
            std::ofstream out(p, std::ios::trunc);
            out << content;
        }
        chmod(p.c_str(), mode);
        return p.string();
    }

    std::string read(const std::string& rel) const {
        std::ifstream in(path_ / rel);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

  private:
    std::filesystem::path path_;
};
