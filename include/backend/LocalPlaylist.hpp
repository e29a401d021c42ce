#pragma once

#include "model/Library.hpp"
#include <filesystem>
#include <optional>

namespace listui::backend {

// Builds an ephemeral (never stored) playlist from the audio files directly inside `dir`,
// sorted by file name, titled by file stem. Returns nullopt when `dir` is not a directory.
std::optional<model::Playlist> scan_local_playlist(const std::filesystem::path& dir);

}  // namespace listui::backend
