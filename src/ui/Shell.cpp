#include "ui/Shell.hpp"
#include "ui/Formatting.hpp"
#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include <algorithm>

namespace listui::ui {

using events::Command;
using util::Logger;

namespace {

constexpr int kMinCols = 40;
constexpr int kMinRows = 10;

const events::Event::Type kRedrawEvents[] = {
    events::Event::Type::SessionOpened,
    events::Event::Type::SessionClosed,
    events::Event::Type::OrderChanged,
    events::Event::Type::TransportChanged,
    events::Event::Type::Progress,
    events::Event::Type::TrackReady,
    events::Event::Type::TrackFailed,
    events::Event::Type::DownloadSettled,
    events::Event::Type::PositionChanged,
    events::Event::Type::VolumeChanged,
    events::Event::Type::ModeChanged,
    events::Event::Type::RemoteUnavailable,
};

}  // namespace

Shell::Shell(core::PlaybackEngine& engine, backend::TrackStore& store, collectors::PlaylistImporter& importer,
             events::EventBus& bus, config::KeyMap keys, Options options)
    : engine_(engine),
      store_(store),
      importer_(importer),
      bus_(bus),
      keys_(std::move(keys)),
      options_(options) {
    for (auto type : kRedrawEvents) {
        subscriptions_.push_back(bus_.subscribe(type, [this](const events::Event& event) {
            switch (event.type) {
                case events::Event::Type::SessionOpened:
                case events::Event::Type::OrderChanged:
                    song_list_.invalidate();
                    break;
                case events::Event::Type::RemoteUnavailable:
                    show_error(event.message);
                    break;
                default:
                    break;
            }
            dirty_ = true;
        }));
    }
}

Shell::~Shell() {
    for (auto id : subscriptions_) {
        bus_.unsubscribe(id);
    }
}

// ---------------------------------------------------------------------------
// Screens
// ---------------------------------------------------------------------------

void Shell::show_playlists() {
    reload_playlists();
    screen_ = Screen::Playlists;
    dirty_ = true;
}

void Shell::reload_playlists() {
    playlists_ = store_.list_playlists();
    playlist_list_.set_count(playlists_.size());
}

void Shell::open_local(const model::Playlist& playlist) {
    engine_.open(playlist);
    quit_on_close_ = true;
    song_list_.reset();
    screen_ = Screen::Songs;
    dirty_ = true;
}

void Shell::import(const std::string& url_or_id) {
    if (!importer_.start(url_or_id)) {
        show_error("A playlist is already being fetched.");
        return;
    }
    refreshing_.reset();
    screen_ = Screen::Loading;
    dirty_ = true;
}

void Shell::show_error(const std::string& message) {
    Logger::warn("Shell: " + message);
    error_ = message;
    dirty_ = true;
}

void Shell::show_help() {
    help_return_ = screen_;
    help_overlay_.set_context(screen_ == Screen::Songs ? widgets::HelpOverlay::Context::Songs
                                                       : widgets::HelpOverlay::Context::Playlists);
    screen_ = Screen::Help;
}

// ---------------------------------------------------------------------------
// Input
// ---------------------------------------------------------------------------

void Shell::handle_input(const InputEvent& event) {
    if (event.type == InputEvent::Type::Resize) {
        renderer_.invalidate();
        dirty_ = true;
        return;
    }
    if (event.type != InputEvent::Type::KeyPress) return;
    dirty_ = true;

    if (event.is_key("ctrl-c")) {
        should_quit_ = true;
        return;
    }

    // The banner swallows the key that dismisses it
    if (error_) {
        error_.reset();
        return;
    }

    const std::string action = keys_.lookup_action(event.key_name);
    switch (screen_) {
        case Screen::Playlists:
            handle_playlists_key(event, action);
            break;
        case Screen::Songs:
            handle_songs_key(event, action);
            break;
        case Screen::Help:
            screen_ = help_return_;
            break;
        case Screen::Loading:
            break;
    }
}

void Shell::handle_playlists_key(const InputEvent& event, const std::string& action) {
    if (playlist_list_.handle_input(event)) return;

    if (event.is_key("enter")) {
        open_selected();
    } else if (action == "refresh") {
        refresh_selected();
    } else if (action == "delete") {
        delete_selected();
    } else if (action == "help") {
        show_help();
    } else if (action == "back") {
        should_quit_ = true;
    }
}

void Shell::handle_songs_key(const InputEvent& event, const std::string& action) {
    auto play_selected = [this] {
        if (auto position = song_list_.selected_position()) {
            engine_.dispatch({Command::Type::PlayAt, static_cast<std::int64_t>(*position)});
        }
        song_list_.clear_filter();
        song_list_.set_follow(true);
    };

    if (song_list_.searching()) {
        // Typed characters go to the query, not to the key map
        if (event.is_key("enter")) {
            play_selected();
        } else {
            song_list_.handle_input(event);
        }
        return;
    }

    if (song_list_.handle_input(event)) return;

    const std::int64_t seek_step = static_cast<std::int64_t>(options_.seek_seconds) * 1000;
    core::CommandResult result = core::CommandResult::Ok;

    if (event.is_key("enter")) {
        play_selected();
    } else if (event.is_key("left")) {
        result = engine_.dispatch({Command::Type::SeekRelative, -seek_step});
    } else if (event.is_key("right")) {
        result = engine_.dispatch({Command::Type::SeekRelative, seek_step});
    } else if (action == "pause") {
        engine_.dispatch({Command::Type::TogglePause});
    } else if (action == "next") {
        engine_.dispatch({Command::Type::SkipNext});
    } else if (action == "prev") {
        engine_.dispatch({Command::Type::SkipPrev});
    } else if (action == "shuffle") {
        engine_.dispatch({Command::Type::ToggleShuffle});
    } else if (action == "repeat") {
        engine_.dispatch({Command::Type::CycleRepeat});
    } else if (action == "follow") {
        song_list_.set_follow(true);
    } else if (action == "search") {
        song_list_.start_search();
    } else if (action == "volume_up") {
        engine_.dispatch({Command::Type::SetVolume, engine_.volume() + options_.volume_step});
    } else if (action == "volume_down") {
        engine_.dispatch({Command::Type::SetVolume, engine_.volume() - options_.volume_step});
    } else if (action == "help") {
        show_help();
    } else if (action == "back") {
        close_songs();
    } else if (event.key >= '0' && event.key <= '9' && event.key_name.size() == 1) {
        double fraction = static_cast<double>(event.key - '0') / 10.0;
        result = engine_.dispatch({Command::Type::SeekFraction, 0, fraction});
    }

    if (result == core::CommandResult::NotReady) {
        Logger::debug("Shell: Seek ignored, nothing is playing");
    }
}

// ---------------------------------------------------------------------------
// Playlist actions
// ---------------------------------------------------------------------------

void Shell::open_selected() {
    auto index = playlist_list_.selected();
    if (!index || *index >= playlists_.size()) return;

    const auto& playlist = playlists_[*index];
    Command open{Command::Type::Open};
    open.playlist_id = playlist.id;
    if (engine_.dispatch(open) != core::CommandResult::Ok) {
        show_error("Playlist \"" + playlist.title + "\" no longer exists.");
        reload_playlists();
        return;
    }

    song_list_.reset();
    screen_ = Screen::Songs;
}

void Shell::refresh_selected() {
    auto index = playlist_list_.selected();
    if (!index || *index >= playlists_.size()) return;

    const auto& playlist = playlists_[*index];
    if (!playlist.is_remote() || !playlist.remote_id) {
        show_error("Only YouTube playlists can be refreshed.");
        return;
    }
    if (!importer_.start(*playlist.remote_id)) {
        show_error("A playlist is already being fetched.");
        return;
    }
    refreshing_ = playlist.id;
    screen_ = Screen::Loading;
}

void Shell::delete_selected() {
    auto index = playlist_list_.selected();
    if (!index || *index >= playlists_.size()) return;

    Logger::info("Shell: Deleting playlist \"" + playlists_[*index].title + "\"");
    store_.delete_playlist(playlists_[*index].id);
    reload_playlists();
}

void Shell::close_songs() {
    engine_.dispatch({Command::Type::Close});
    song_list_.reset();
    if (quit_on_close_) {
        should_quit_ = true;
        return;
    }
    show_playlists();
}

void Shell::tick() {
    if (!importer_.poll()) return;
    dirty_ = true;
    on_import_settled();
}

void Shell::on_import_settled() {
    const auto& status = importer_.status();
    if (status.phase == collectors::PlaylistImporter::Phase::Running) return;

    if (status.phase == collectors::PlaylistImporter::Phase::Done && status.playlist_id) {
        const auto id = *status.playlist_id;
        if (refreshing_) {
            // Keeps playing if the refreshed playlist is the open one
            engine_.update_tracks(id, store_.get_tracks(id));
        }
        reload_playlists();
        for (size_t i = 0; i < playlists_.size(); ++i) {
            if (playlists_[i].id == id) playlist_list_.select(i);
        }
    } else if (status.phase == collectors::PlaylistImporter::Phase::Failed) {
        reload_playlists();
        show_error(status.error);
    }

    refreshing_.reset();
    importer_.acknowledge();
    screen_ = engine_.has_session() ? Screen::Songs : Screen::Playlists;
}

// ---------------------------------------------------------------------------
// Drawing
// ---------------------------------------------------------------------------

void Shell::render() {
    auto& terminal = Terminal::instance();
    const int cols = std::max(terminal.get_terminal_width(), kMinCols);
    const int rows = std::max(terminal.get_terminal_height(), kMinRows);

    auto& canvas = renderer_.begin_frame(cols, rows);
    ShellView view{engine_, playlists_, importer_.status(), keys_};
    const LayoutRect full{0, 0, cols, rows};

    const Screen base = screen_ == Screen::Help ? help_return_ : screen_;
    switch (base) {
        case Screen::Playlists:
            playlist_list_.render(canvas, full, view);
            break;
        case Screen::Songs: {
            LayoutRect list_rect, player_rect;
            split_bottom(full, widgets::PlayerBar::kHeight, list_rect, player_rect);
            song_list_.render(canvas, list_rect, view);
            player_bar_.render(canvas, player_rect, view);
            break;
        }
        case Screen::Loading:
        case Screen::Help:
            loading_view_.render(canvas, full, view);
            break;
    }

    if (screen_ == Screen::Help) {
        help_overlay_.render(canvas, full, view);
    }
    if (error_) {
        draw_error_banner(canvas);
    }

    renderer_.present();
    dirty_ = false;
}

void Shell::draw_error_banner(Canvas& canvas) {
    const int y = canvas.height() - 1;
    std::string text = " Error: " + *error_;
    std::string hint = "(press any key) ";
    canvas.draw_text(0, y, lr_align(canvas.width(), text, hint), styles::kError);
}

}  // namespace listui::ui
