#include "collectors/PlaylistImporter.hpp"
#include "util/Logger.hpp"

namespace listui::collectors {

PlaylistImporter::PlaylistImporter(backend::MetadataResolver& resolver, backend::TrackStore& store)
    : resolver_(resolver), store_(store), inbox_(std::make_shared<events::Mailbox<Message>>()) {}

PlaylistImporter::~PlaylistImporter() {
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.join();
    }
}

bool PlaylistImporter::start(const std::string& url_or_id) {
    if (running()) return false;
    if (worker_.joinable()) worker_.join();

    status_ = Status{};
    status_.phase = Phase::Running;
    status_.request = url_or_id;

    util::Logger::info("PlaylistImporter: Importing " + url_or_id);
    worker_ = std::jthread([this, url_or_id](std::stop_token st) { run(st, url_or_id); });
    return true;
}

void PlaylistImporter::run(std::stop_token stop_token, std::string url_or_id) {
    auto inbox = inbox_;
    try {
        auto playlist = resolver_.resolve_remote_playlist(url_or_id, [&](const backend::ResolveProgress& p) {
            if (stop_token.stop_requested()) return;
            inbox->post({Message::Type::Progress, p, {}, {}});
        });
        if (stop_token.stop_requested()) return;
        inbox->post({Message::Type::Resolved, {}, std::move(playlist), {}});
    } catch (const backend::MetadataUnavailable& e) {
        util::Logger::warn(std::string("PlaylistImporter: ") + e.what());
        inbox->post({Message::Type::Failed, {}, {}, e.what()});
    }
}

bool PlaylistImporter::poll() {
    bool changed = false;
    for (auto& msg : inbox_->drain()) {
        if (status_.phase != Phase::Running) continue;
        changed = true;

        switch (msg.type) {
            case Message::Type::Progress:
                status_.source = msg.progress.source;
                status_.fetched = msg.progress.fetched;
                break;

            case Message::Type::Resolved: {
                auto stored = store_.save_remote_playlist(msg.playlist);
                status_.fetched = msg.playlist.tracks.size();
                status_.playlist_id = stored.id;
                status_.phase = Phase::Done;
                util::Logger::info("PlaylistImporter: Stored \"" + stored.title + "\" with " +
                                   std::to_string(stored.track_count) + " tracks");
                break;
            }

            case Message::Type::Failed:
                status_.error = msg.error;
                status_.phase = Phase::Failed;
                break;
        }
    }
    return changed;
}

void PlaylistImporter::acknowledge() {
    if (status_.phase == Phase::Done || status_.phase == Phase::Failed) {
        status_ = Status{};
    }
}

}  // namespace listui::collectors
