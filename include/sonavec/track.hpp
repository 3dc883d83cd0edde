/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <json/value.h>

namespace sonavec {

inline constexpr const char* kUnknownArtist = "Unknown Artist";
inline constexpr const char* kUnknownTrack = "Unknown Track";

struct TrackDescriptor {
    std::string id;
    std::string name;
    std::string artist;
    std::int64_t durationMs = 0;
    std::string previewUrl;   // empty when the preview must be resolved
};

// Fields shared by every accepted record shape.
struct TrackFields {
    std::string id;
    std::string name;
    std::string nestedName;
    std::string previewUrl;
    std::int64_t durationMs = 0;
};

// {"artists": [{"name": ...} | "...", ...]}
struct FlatArtistsTrack {
    TrackFields fields;
    std::optional<std::string> firstArtist;
};

// {"track": {"name": ..., "artists": [...]}}
struct NestedTrack {
    TrackFields fields;
    std::optional<std::string> firstArtist;
};

// {"artist": "..."}
struct LegacyArtistTrack {
    TrackFields fields;
    std::string artist;
};

// Object with no recognizable artist information
struct AnonymousTrack {
    TrackFields fields;
};

using RawTrack = std::variant<FlatArtistsTrack, NestedTrack, LegacyArtistTrack, AnonymousTrack>;

// Returns nullopt for anything that is not a JSON object.
[[nodiscard]] std::optional<RawTrack> parseRawTrack(const Json::Value& record);
[[nodiscard]] TrackDescriptor normalizeTrack(const RawTrack& raw);

// Parses and normalizes every object in the array, skipping the rest.
[[nodiscard]] std::vector<TrackDescriptor> normalizeTracks(const Json::Value& records);

// "name - artist", the lookup key for preview resolution
[[nodiscard]] std::string compositeKey(const TrackDescriptor& track);
[[nodiscard]] std::string compositeKey(const std::string& name, const std::string& artist);

// Identity used for the index and result files: the id, or the composite key when the id is empty
[[nodiscard]] std::string trackKey(const TrackDescriptor& track);

// Keeps alphanumerics, space, '-' and '_'; everything else becomes '_'
[[nodiscard]] std::string sanitizeFilename(const std::string& text);

[[nodiscard]] Json::Value toJson(const TrackDescriptor& track);

}
