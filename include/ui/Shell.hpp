#pragma once

#include "backend/TrackStore.hpp"
#include "collectors/PlaylistImporter.hpp"
#include "config/KeyMap.hpp"
#include "core/PlaybackEngine.hpp"
#include "events/EventBus.hpp"
#include "ui/InputEvent.hpp"
#include "ui/Renderer.hpp"
#include "ui/widgets/HelpOverlay.hpp"
#include "ui/widgets/LoadingView.hpp"
#include "ui/widgets/PlayerBar.hpp"
#include "ui/widgets/PlaylistList.hpp"
#include "ui/widgets/SongList.hpp"
#include <optional>
#include <string>
#include <vector>

namespace listui::ui {

// Screens, key handling and drawing. Turns keys into engine commands and
// redraws when the engine reports a change.
class Shell {
public:
    enum class Screen { Playlists, Songs, Loading, Help };

    struct Options {
        int seek_seconds = 15;
        int volume_step = 10;
    };

    Shell(core::PlaybackEngine& engine, backend::TrackStore& store, collectors::PlaylistImporter& importer,
          events::EventBus& bus, config::KeyMap keys, Options options);
    ~Shell();

    Shell(const Shell&) = delete;
    Shell& operator=(const Shell&) = delete;

    // Reloads the stored playlists and shows them.
    void show_playlists();
    // Plays a directory given on the command line. Closing it quits.
    void open_local(const model::Playlist& playlist);
    // Resolves and stores a remote playlist, showing progress meanwhile.
    void import(const std::string& url_or_id);
    void show_error(const std::string& message);

    void handle_input(const InputEvent& event);
    // Applies background results (playlist import). Call once per loop iteration.
    void tick();
    void render();

    void mark_dirty() { dirty_ = true; }
    [[nodiscard]] bool needs_render() const { return dirty_; }
    [[nodiscard]] bool should_quit() const { return should_quit_; }
    [[nodiscard]] Screen screen() const { return screen_; }
    [[nodiscard]] const std::optional<std::string>& error() const { return error_; }

private:
    void handle_playlists_key(const InputEvent& event, const std::string& action);
    void handle_songs_key(const InputEvent& event, const std::string& action);
    void show_help();

    void open_selected();
    void refresh_selected();
    void delete_selected();
    void close_songs();
    void on_import_settled();
    void reload_playlists();

    void draw_error_banner(Canvas& canvas);

    core::PlaybackEngine& engine_;
    backend::TrackStore& store_;
    collectors::PlaylistImporter& importer_;
    events::EventBus& bus_;
    config::KeyMap keys_;
    Options options_;

    Renderer renderer_;
    widgets::PlaylistList playlist_list_;
    widgets::SongList song_list_;
    widgets::PlayerBar player_bar_;
    widgets::LoadingView loading_view_;
    widgets::HelpOverlay help_overlay_;

    std::vector<model::Playlist> playlists_;
    std::vector<events::EventBus::SubscriptionId> subscriptions_;

    Screen screen_ = Screen::Playlists;
    Screen help_return_ = Screen::Playlists;
    std::optional<std::string> error_;
    std::optional<model::PlaylistId> refreshing_;  // Playlist being refreshed by the importer
    bool quit_on_close_ = false;
    bool should_quit_ = false;
    bool dirty_ = true;
};

}  // namespace listui::ui
