#pragma once

/**
 * JSON file persistence helpers
 *
 * Writes go to "<path>.tmp" first and are renamed over the target
 * (atomic on POSIX), so a crash mid-write never leaves a torn file.
 */

#include "../errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace tradefinder {
namespace store {

/**
 * Serialize `doc` to `path` atomically.
 * Returns false if the temp file cannot be written or renamed.
 */
inline bool write_json_atomic(const std::string& path, const nlohmann::json& doc) {
    std::error_code ec;
    std::filesystem::path target(path);
    if (target.has_parent_path()) {
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec)
            return false;
    }

    std::string temp_path = path + ".tmp";
    {
        std::ofstream out(temp_path);
        if (!out.is_open())
            return false;
        out << doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        out.flush();
        if (!out.good()) {
            out.close();
            std::remove(temp_path.c_str());
            return false;
        }
    }

    // Atomic rename
    if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
        std::remove(temp_path.c_str());
        return false;
    }
    return true;
}

/**
 * Load `path` into `doc`.
 * Returns false if the file does not exist; throws ConfigurationError if
 * it exists but is not valid JSON.
 */
inline bool read_json_file(const std::string& path, nlohmann::json& doc) {
    std::ifstream in(path);
    if (!in.is_open())
        return false;

    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (content.empty())
        return false;

    try {
        doc = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("corrupt JSON file " + path + ": " + e.what());
    }
    return true;
}

}  // namespace store
}  // namespace tradefinder
