/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <filesystem>
#include <string>

#include <json/json.h>

namespace sonavec {

[[nodiscard]] bool parseJson(const std::string& text, Json::Value& out, std::string* error = nullptr);
[[nodiscard]] std::string toJsonString(const Json::Value& value, bool pretty = false);

[[nodiscard]] bool readJsonFile(const std::filesystem::path& path, Json::Value& out, std::string* error = nullptr);

// Writes to "<path>.tmp" and renames over path so readers never see a partial file.
[[nodiscard]] bool writeJsonFileAtomic(const std::filesystem::path& path, const Json::Value& value) noexcept;

}
