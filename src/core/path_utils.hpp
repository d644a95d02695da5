/* SPDX-FileCopyrightText: 2025 Vista Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once

#include <filesystem>
#include <fstream>
#include <string>

#ifdef _WIN32
#include <windows.h>
#endif

namespace vista::core {

    /**
     * @brief Convert a filesystem path to a UTF-8 string for log messages and errors
     *
     * std::filesystem::path::string() uses the system codepage on Windows, so the
     * wide representation is converted explicitly there. Elsewhere the native
     * encoding is already UTF-8.
     */
    inline std::string path_to_utf8(const std::filesystem::path& p) {
#ifdef _WIN32
        const std::wstring wstr = p.wstring();
        if (wstr.empty()) {
            return std::string();
        }

        const int size_needed = WideCharToMultiByte(CP_UTF8, 0, wstr.c_str(),
                                                    static_cast<int>(wstr.size()),
                                                    nullptr, 0, nullptr, nullptr);
        if (size_needed <= 0) {
            return std::string();
        }

        std::string utf8_str(size_needed, 0);
        const int converted = WideCharToMultiByte(CP_UTF8, 0, wstr.c_str(),
                                                  static_cast<int>(wstr.size()),
                                                  &utf8_str[0], size_needed, nullptr, nullptr);
        if (converted <= 0) {
            return std::string();
        }
        utf8_str.resize(converted);
        return utf8_str;
#else
        return p.string();
#endif
    }

    // Opens with the native path type so non-ASCII config locations work on every platform
    inline bool open_file_for_read(const std::filesystem::path& path, std::ifstream& stream) {
        stream.open(path, std::ios::in | std::ios::binary);
        return stream.is_open();
    }

    inline bool open_file_for_write(const std::filesystem::path& path, std::ofstream& stream) {
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                return false;
            }
        }
        stream.open(path, std::ios::out | std::ios::trunc);
        return stream.is_open();
    }

} // namespace vista::core
