/*
 * sonavec - Track Embedding Pipeline
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "sonavec/track.hpp"
#include "sonavec/logger.hpp"
#include <cctype>

namespace sonavec {

namespace {
std::string stringMember(const Json::Value& obj, const char* key) {
    const Json::Value& v = obj[key];
    return v.isString() ? v.asString() : std::string();
}

// First artist of a list whose entries are either {"name": ...} objects or plain strings.
// Present-but-unusable entries yield the unknown sentinel, an empty list yields nullopt.
std::optional<std::string> firstArtistOf(const Json::Value& artists) {
    if (!artists.isArray() || artists.empty()) {
        return std::nullopt;
    }
    const Json::Value& first = artists[0u];
    if (first.isObject()) {
        const Json::Value& name = first["name"];
        return name.isString() ? name.asString() : std::string(kUnknownArtist);
    }
    if (first.isString()) {
        return first.asString();
    }
    return std::string(kUnknownArtist);
}

TrackFields commonFields(const Json::Value& record) {
    TrackFields f;
    const Json::Value& nested = record["track"];
    f.id = stringMember(record, "id");
    f.name = stringMember(record, "name");
    f.previewUrl = stringMember(record, "preview_url");

    const Json::Value& duration = record["duration_ms"];
    if (duration.isNumeric()) {
        f.durationMs = duration.asInt64();
    }

    if (nested.isObject()) {
        f.nestedName = stringMember(nested, "name");
        if (f.id.empty()) f.id = stringMember(nested, "id");
        if (f.previewUrl.empty()) f.previewUrl = stringMember(nested, "preview_url");
        if (f.durationMs == 0 && nested["duration_ms"].isNumeric()) {
            f.durationMs = nested["duration_ms"].asInt64();
        }
    }
    return f;
}

TrackDescriptor fromFields(const TrackFields& f, const std::optional<std::string>& artist) {
    TrackDescriptor d;
    d.id = f.id;
    d.name = !f.name.empty() ? f.name : (!f.nestedName.empty() ? f.nestedName : kUnknownTrack);
    d.artist = (artist && !artist->empty()) ? *artist : kUnknownArtist;
    d.durationMs = f.durationMs;
    d.previewUrl = f.previewUrl;
    return d;
}
}

std::optional<RawTrack> parseRawTrack(const Json::Value& record) {
    if (!record.isObject()) {
        return std::nullopt;
    }

    TrackFields fields = commonFields(record);

    const Json::Value& artists = record["artists"];
    if (artists.isArray() && !artists.empty()) {
        return RawTrack{FlatArtistsTrack{fields, firstArtistOf(artists)}};
    }

    const Json::Value& nested = record["track"];
    if (nested.isObject() && nested.isMember("artists")) {
        return RawTrack{NestedTrack{fields, firstArtistOf(nested["artists"])}};
    }

    const Json::Value& legacy = record["artist"];
    if (legacy.isString()) {
        return RawTrack{LegacyArtistTrack{fields, legacy.asString()}};
    }

    return RawTrack{AnonymousTrack{fields}};
}

TrackDescriptor normalizeTrack(const RawTrack& raw) {
    struct Visitor {
        TrackDescriptor operator()(const FlatArtistsTrack& t) const { return fromFields(t.fields, t.firstArtist); }
        TrackDescriptor operator()(const NestedTrack& t) const { return fromFields(t.fields, t.firstArtist); }
        TrackDescriptor operator()(const LegacyArtistTrack& t) const { return fromFields(t.fields, t.artist); }
        TrackDescriptor operator()(const AnonymousTrack& t) const { return fromFields(t.fields, std::nullopt); }
    };
    return std::visit(Visitor{}, raw);
}

std::vector<TrackDescriptor> normalizeTracks(const Json::Value& records) {
    std::vector<TrackDescriptor> tracks;
    if (!records.isArray()) {
        LOG_WARN("Track payload is not an array");
        return tracks;
    }

    tracks.reserve(records.size());
    for (Json::ArrayIndex i = 0; i < records.size(); ++i) {
        auto raw = parseRawTrack(records[i]);
        if (!raw) {
            LOG_WARN("Skipping invalid track at index " + std::to_string(i));
            continue;
        }
        tracks.push_back(normalizeTrack(*raw));
        LOG_TRACE("Normalized track: " + compositeKey(tracks.back()));
    }
    return tracks;
}

std::string compositeKey(const std::string& name, const std::string& artist) {
    return name + " - " + artist;
}

std::string compositeKey(const TrackDescriptor& track) {
    return compositeKey(track.name, track.artist);
}

std::string trackKey(const TrackDescriptor& track) {
    return track.id.empty() ? compositeKey(track) : track.id;
}

std::string sanitizeFilename(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == ' ' || c == '-' || c == '_') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('_');
        }
    }
    return out;
}

Json::Value toJson(const TrackDescriptor& track) {
    Json::Value v(Json::objectValue);
    v["id"] = track.id;
    v["name"] = track.name;
    v["artist"] = track.artist;
    v["duration_ms"] = static_cast<Json::Int64>(track.durationMs);
    if (!track.previewUrl.empty()) {
        v["preview_url"] = track.previewUrl;
    }
    return v;
}

}
