/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/json_io.hpp"
#include "sonavec/logger.hpp"
#include <fstream>
#include <iterator>
#include <memory>

namespace sonavec {

bool parseJson(const std::string& text, Json::Value& out, std::string* error) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errs;
    bool ok = reader->parse(text.data(), text.data() + text.size(), &out, &errs);
    if (!ok && error) {
        *error = errs;
    }
    return ok;
}

std::string toJsonString(const Json::Value& value, bool pretty) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = pretty ? "  " : "";
    return Json::writeString(builder, value);
}

bool readJsonFile(const std::filesystem::path& path, Json::Value& out, std::string* error) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        if (error) *error = "cannot open " + path.string();
        return false;
    }
    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    return parseJson(content, out, error);
}

bool writeJsonFileAtomic(const std::filesystem::path& path, const Json::Value& value) noexcept {
    try {
        auto tempPath = path;
        tempPath += ".tmp";
        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file) return false;
            file << toJsonString(value, true) << "\n";
            file.flush();
            if (!file.good()) return false;
        }
        std::error_code ec;
        std::filesystem::rename(tempPath, path, ec);
        if (ec) {
            LOG_ERROR("Failed to publish " + path.string() + ": " + ec.message());
            std::filesystem::remove(tempPath, ec);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Failed to write " + path.string() + ": " + e.what());
        return false;
    }
}

}
