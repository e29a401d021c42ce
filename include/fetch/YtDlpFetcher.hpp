#pragma once

#include "fetch/Fetcher.hpp"
#include "util/WorkerPool.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace listui::fetch {

// Downloads with yt-dlp, converts to MP3 with ffmpeg, caches as <cache_dir>/<remote id>.mp3.
// Jobs for the same video write separate temporaries; the cache file only appears by rename.
class YtDlpFetcher : public Fetcher {
public:
    struct Options {
        std::string downloader = "yt-dlp";
        std::string decoder = "ffmpeg";
        std::filesystem::path cache_dir;
        size_t max_concurrent = 3;
        std::chrono::milliseconds grace{2000};  // SIGTERM -> SIGKILL
    };

    // Throws MissingExternalTool when either program cannot be found.
    explicit YtDlpFetcher(Options options);
    ~YtDlpFetcher() override;

    FetchHandle fetch(const model::TrackDescriptor& track, model::FetchToken token,
                      ProgressCallback on_progress, CompletionCallback on_complete) override;

    [[nodiscard]] std::filesystem::path cache_path(const std::string& remote_id) const;

    // "[download]  42.3% of ..." -> 0.423
    static std::optional<double> parse_progress(const std::string& line);

private:
    struct StageResult {
        int status = -1;
        bool cancelled = false;
        std::string last_line;
    };

    void run_job(std::uint64_t job, const std::shared_ptr<FetchControl>& control,
                 const model::TrackDescriptor& track, model::FetchToken token, const ProgressCallback& on_progress,
                 const CompletionCallback& on_complete);

    StageResult run_stage(const std::vector<std::string>& argv, FetchControl& control,
                          const std::function<void(const std::string&)>& on_line);

    Options options_;
    std::string downloader_path_;
    std::string decoder_path_;

    std::mutex controls_mutex_;
    std::vector<std::weak_ptr<FetchControl>> controls_;
    std::atomic<std::uint64_t> next_job_{0};

    // Last member: its destructor drains the queue while everything above is alive
    std::unique_ptr<util::WorkerPool> pool_;
};

}  // namespace listui::fetch
