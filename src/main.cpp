#include "audio/PlaybackThread.hpp"
#include "backend/Config.hpp"
#include "backend/HttpClient.hpp"
#include "backend/InvidiousResolver.hpp"
#include "backend/LocalPlaylist.hpp"
#include "backend/SqliteTrackStore.hpp"
#include "backend/YouTubeResolver.hpp"
#include "collectors/PlaylistImporter.hpp"
#include "config/KeyMap.hpp"
#include "core/PlaybackEngine.hpp"
#include "events/EventBus.hpp"
#include "events/Scheduler.hpp"
#include "fetch/YtDlpFetcher.hpp"
#include "ui/Shell.hpp"
#include "ui/Terminal.hpp"
#include "util/Logger.hpp"
#include <atomic>
#include <cerrno>
#include <chrono>
#include <clocale>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <unistd.h>

using namespace std::chrono_literals;
using listui::util::Logger;

namespace {

std::atomic<bool> g_shutdown{false};

void signal_handler(int) {
    g_shutdown.store(true);
}

void print_usage() {
    std::cerr << "Usage: listui [DIRECTORY | PLAYLIST_URL | PLAYLIST_ID]\n"
                 "  DIRECTORY     play the audio files of a local directory\n"
                 "  PLAYLIST_URL  import a YouTube playlist (youtube.com/...?list=PL...)\n"
                 "  PLAYLIST_ID   import a YouTube playlist by id\n"
                 "Without arguments the stored playlists are listed.\n";
}

}  // namespace

int main(int argc, char** argv) {
    namespace fs = std::filesystem;

    if (argc > 2 || (argc == 2 && (std::strcmp(argv[1], "-h") == 0 || std::strcmp(argv[1], "--help") == 0))) {
        print_usage();
        return argc > 2 ? 2 : 0;
    }

    try {
        std::setlocale(LC_ALL, "");

        auto config = listui::backend::ConfigLoader::load_config();
        Logger::init(config.log_file);
        Logger::set_level(Logger::level_from_string(config.log_level));
        Logger::info("listui starting");

        // Command line: directory, playlist URL/id, or nothing
        std::optional<listui::model::Playlist> local_playlist;
        std::optional<std::string> import_request;
        if (argc == 2) {
            std::string arg = argv[1];
            std::error_code ec;
            if (fs::is_directory(arg, ec)) {
                local_playlist = listui::backend::scan_local_playlist(arg);
            } else if (listui::backend::extract_playlist_id(arg)) {
                import_request = arg;
            } else {
                std::cerr << "listui: " << arg << " is neither a directory nor a YouTube playlist\n";
                print_usage();
                return 2;
            }
        }

        listui::backend::SqliteTrackStore store(config.database.string());

        listui::backend::HttpClient http(std::chrono::seconds(config.request_timeout));
        std::unique_ptr<listui::backend::MetadataResolver> resolver;
        if (!config.youtube_api_key.empty()) {
            Logger::info("Using the YouTube Data API");
            resolver = std::make_unique<listui::backend::YouTubeResolver>(http, config.youtube_api_key);
        } else {
            Logger::info("Using " + std::to_string(config.invidious_instances.size()) + " Invidious instances");
            resolver = std::make_unique<listui::backend::InvidiousResolver>(http, config.invidious_instances);
        }
        listui::collectors::PlaylistImporter importer(*resolver, store);

        // Remote playback needs the external downloader and decoder
        std::unique_ptr<listui::fetch::YtDlpFetcher> fetcher;
        std::string remote_unavailable;
        try {
            listui::fetch::YtDlpFetcher::Options fetch_options;
            fetch_options.downloader = config.downloader;
            fetch_options.decoder = config.decoder;
            fetch_options.cache_dir = config.download_directory;
            fetch_options.max_concurrent = static_cast<size_t>(config.max_downloads);
            fetcher = std::make_unique<listui::fetch::YtDlpFetcher>(fetch_options);
        } catch (const listui::fetch::MissingExternalTool& e) {
            Logger::warn(std::string("Remote playback disabled: ") + e.what());
            remote_unavailable = "Please install " + e.tool() + " to play YouTube playlists.";
        }

        audio::PlaybackThread sink;
        auto& bus = listui::events::EventBus::instance();

        listui::core::EngineOptions engine_options;
        engine_options.shuffle = config.shuffle;
        engine_options.repeat = listui::model::repeat_from_string(config.repeat);
        engine_options.volume = config.default_volume;
        engine_options.advance_on_failure = config.advance_on_failure;
        engine_options.remote_unavailable_reason = remote_unavailable;
        listui::core::PlaybackEngine engine(store, fetcher.get(), sink, bus, engine_options);

        listui::ui::Shell shell(engine, store, importer, bus, listui::config::KeyMap(config.keybinds),
                                {config.seek_seconds, config.volume_step});

        auto& terminal = listui::ui::Terminal::instance();
        terminal.init();

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGHUP, signal_handler);

        if (local_playlist) {
            shell.open_local(*local_playlist);
        } else {
            shell.show_playlists();
            if (import_request) shell.import(*import_request);
        }

        listui::events::Scheduler scheduler;
        scheduler.schedule("loading-spinner", 100ms, [&shell] {
            if (shell.screen() == listui::ui::Shell::Screen::Loading) shell.mark_dirty();
        });

        while (!shell.should_quit() && !g_shutdown.load()) {
            struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
            int ret = poll(&pfd, 1, 33);  // ~30 fps
            if (ret < 0 && errno != EINTR) {
                throw std::runtime_error(std::string("poll failed: ") + std::strerror(errno));
            }

            // Drain every pending key so that held keys do not lag behind
            for (;;) {
                auto event = terminal.read_input();
                if (event.type == listui::ui::InputEvent::Type::None) break;
                shell.handle_input(event);
                if (shell.should_quit()) break;
            }

            engine.pump();
            shell.tick();
            scheduler.process();

            if (shell.needs_render()) {
                shell.render();
            }
        }

        Logger::info("Shutting down");
        engine.shutdown();
        terminal.shutdown();
        Logger::info("listui shutdown");
        return 0;
    } catch (const std::exception& e) {
        // Restore the terminal before printing anything
        listui::ui::Terminal::instance().shutdown();
        Logger::error("Fatal error: " + std::string(e.what()));
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
