#pragma once

#include "backend/MetadataResolver.hpp"
#include "backend/TrackStore.hpp"
#include "events/Mailbox.hpp"
#include "model/Library.hpp"
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

namespace listui::collectors {

// Resolves a remote playlist on a background thread and stores the result.
// The resolver runs off-thread; the store is only touched from poll().
class PlaylistImporter {
public:
    enum class Phase { Idle, Running, Done, Failed };

    struct Status {
        Phase phase = Phase::Idle;
        std::string request;                      // URL or id being imported
        std::string source;                       // Instance currently queried
        size_t fetched = 0;
        std::string error;                        // Set when phase == Failed
        std::optional<model::PlaylistId> playlist_id;  // Set when phase == Done
    };

    PlaylistImporter(backend::MetadataResolver& resolver, backend::TrackStore& store);
    ~PlaylistImporter();

    PlaylistImporter(const PlaylistImporter&) = delete;
    PlaylistImporter& operator=(const PlaylistImporter&) = delete;

    // Returns false while another import is running.
    bool start(const std::string& url_or_id);

    // Foreground: applies messages from the import thread. Returns true when status changed.
    // A finished import is written to the store here. Throws StoreError.
    bool poll();

    // Returns to Idle after a Done/Failed result was consumed by the caller.
    void acknowledge();

    [[nodiscard]] const Status& status() const { return status_; }
    [[nodiscard]] bool running() const { return status_.phase == Phase::Running; }

private:
    struct Message {
        enum class Type { Progress, Resolved, Failed };
        Type type;
        backend::ResolveProgress progress;
        model::RemotePlaylist playlist;
        std::string error;
    };

    void run(std::stop_token stop_token, std::string url_or_id);

    backend::MetadataResolver& resolver_;
    backend::TrackStore& store_;
    std::shared_ptr<events::Mailbox<Message>> inbox_;
    Status status_;
    std::jthread worker_;
};

}  // namespace listui::collectors
