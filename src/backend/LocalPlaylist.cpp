#include "backend/LocalPlaylist.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include "util/UnicodeUtils.hpp"
#include <algorithm>
#include <system_error>

namespace listui::backend {

std::optional<model::Playlist> scan_local_playlist(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return std::nullopt;
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        std::error_code type_ec;
        if (!entry.is_regular_file(type_ec)) continue;
        if (!listui::util::Platform::is_audio_file(entry.path())) continue;
        files.push_back(entry.path());
    }
    if (ec) {
        listui::util::Logger::warn("LocalPlaylist: Error reading " + dir.string() + ": " + ec.message());
        return std::nullopt;
    }

    std::sort(files.begin(), files.end(), [](const auto& a, const auto& b) {
        return listui::util::case_insensitive_compare(a.filename().string(), b.filename().string()) < 0;
    });

    model::Playlist playlist;
    playlist.id = model::kEphemeralPlaylist;
    playlist.source = model::SourceKind::Local;
    auto canonical = std::filesystem::weakly_canonical(dir, ec);
    playlist.title = (ec ? dir : canonical).filename().string();
    if (playlist.title.empty()) playlist.title = dir.string();

    // Ephemeral tracks are numbered from 1; they never reach the store
    model::TrackId next_id = 1;
    for (const auto& file : files) {
        model::Track track;
        track.id = next_id++;
        track.title = file.stem().string();
        track.playlist_id = model::kEphemeralPlaylist;
        track.local_path = file;
        playlist.tracks.push_back(std::move(track));
    }
    playlist.track_count = playlist.tracks.size();

    listui::util::Logger::info("LocalPlaylist: Found " + std::to_string(playlist.track_count) +
                               " audio files in " + dir.string());
    return playlist;
}

}  // namespace listui::backend
