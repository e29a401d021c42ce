#include "fetch/YtDlpFetcher.hpp"
#include "util/ChildProcess.hpp"
#include "util/Logger.hpp"
#include "util/Platform.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>

namespace listui::fetch {

namespace {

constexpr double kDownloadShare = 0.9;
constexpr auto kReadInterval = std::chrono::milliseconds(100);

void remove_quietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
}

std::string describe_failure(const std::string& program, int status, const std::string& last_line) {
    std::string reason = program + " exited with status " + std::to_string(status);
    if (!last_line.empty()) reason += ": " + last_line;
    return reason;
}

}  // namespace

YtDlpFetcher::YtDlpFetcher(Options options) : options_(std::move(options)) {
    auto downloader = util::Platform::find_executable(options_.downloader);
    if (!downloader) throw MissingExternalTool(options_.downloader);
    auto decoder = util::Platform::find_executable(options_.decoder);
    if (!decoder) throw MissingExternalTool(options_.decoder);

    downloader_path_ = downloader->string();
    decoder_path_ = decoder->string();

    std::error_code ec;
    std::filesystem::create_directories(options_.cache_dir, ec);
    if (ec) {
        util::Logger::warn("YtDlpFetcher: Cannot create " + options_.cache_dir.string() + ": " + ec.message());
    }

    util::Logger::info("YtDlpFetcher: Using " + downloader_path_ + " and " + decoder_path_ +
                       ", cache " + options_.cache_dir.string());
    pool_ = std::make_unique<util::WorkerPool>("YtDlpFetcher", std::max<size_t>(1, options_.max_concurrent));
}

YtDlpFetcher::~YtDlpFetcher() {
    // Queued jobs resolve Cancelled, running ones are terminated
    {
        std::lock_guard<std::mutex> lock(controls_mutex_);
        for (auto& weak : controls_) {
            if (auto control = weak.lock()) control->request_cancel();
        }
    }
    pool_.reset();
}

std::filesystem::path YtDlpFetcher::cache_path(const std::string& remote_id) const {
    return options_.cache_dir / (remote_id + ".mp3");
}

std::optional<double> YtDlpFetcher::parse_progress(const std::string& line) {
    if (line.rfind("[download]", 0) != 0) return std::nullopt;

    auto percent = line.find('%');
    if (percent == std::string::npos) return std::nullopt;

    size_t start = percent;
    while (start > 0 && (std::isdigit(static_cast<unsigned char>(line[start - 1])) || line[start - 1] == '.')) {
        --start;
    }
    if (start == percent) return std::nullopt;

    double value = 0.0;
    auto [ptr, ec] = std::from_chars(line.data() + start, line.data() + percent, value);
    if (ec != std::errc() || ptr != line.data() + percent) return std::nullopt;
    return std::clamp(value / 100.0, 0.0, 1.0);
}

FetchHandle YtDlpFetcher::fetch(const model::TrackDescriptor& track, model::FetchToken token,
                                ProgressCallback on_progress, CompletionCallback on_complete) {
    auto control = std::make_shared<FetchControl>();
    {
        std::lock_guard<std::mutex> lock(controls_mutex_);
        std::erase_if(controls_, [](const auto& weak) { return weak.expired(); });
        controls_.push_back(control);
    }

    const auto job = ++next_job_;
    bool queued = pool_->submit([this, job, control, track, token, on_progress, on_complete]() {
        run_job(job, control, track, token, on_progress, on_complete);
    });
    if (!queued) {
        FetchResult result{FetchOutcome::Cancelled, {}, "fetcher is shutting down", token};
        if (control->complete(result) && on_complete) on_complete(result);
    }
    return FetchHandle(control);
}

void YtDlpFetcher::run_job(std::uint64_t job, const std::shared_ptr<FetchControl>& control,
                           const model::TrackDescriptor& track, model::FetchToken token,
                           const ProgressCallback& on_progress, const CompletionCallback& on_complete) {
    auto finish = [&](FetchOutcome outcome, std::filesystem::path path, std::string reason) {
        FetchResult result{outcome, std::move(path), std::move(reason), token};
        if (outcome == FetchOutcome::Failed) {
            util::Logger::warn("YtDlpFetcher: " + track.remote_id + " failed: " + result.reason);
        }
        if (control->complete(result) && on_complete) on_complete(result);
    };

    if (control->cancel_requested()) {
        finish(FetchOutcome::Cancelled, {}, "cancelled before start");
        return;
    }

    auto target = cache_path(track.remote_id);
    std::error_code ec;
    if (std::filesystem::exists(target, ec)) {
        util::Logger::debug("YtDlpFetcher: Cache hit for " + track.remote_id);
        if (on_progress) on_progress(1.0);
        finish(FetchOutcome::Resolved, target, {});
        return;
    }

    std::filesystem::create_directories(options_.cache_dir, ec);
    // Per-job temporaries; other tracks may be fetching the same video
    const auto stem = track.remote_id + "." + std::to_string(job);
    auto download_path = options_.cache_dir / (stem + ".download");
    auto part_path = options_.cache_dir / (stem + ".mp3.part");

    util::Logger::info("YtDlpFetcher: Downloading " + track.remote_id + " (" + track.title + ")");

    double reported = 0.0;
    auto report = [&](double fraction) {
        if (fraction <= reported) return;
        reported = fraction;
        if (on_progress) on_progress(fraction);
    };

    // Stage 1: fetch the best audio stream
    auto download = run_stage(
        {downloader_path_, "-f", "bestaudio", "--newline", "-o", download_path.string(),
         "https://www.youtube.com/watch?v=" + track.remote_id},
        *control,
        [&](const std::string& line) {
            if (auto pct = parse_progress(line)) report(*pct * kDownloadShare);
        });

    if (download.cancelled) {
        remove_quietly(download_path);
        finish(FetchOutcome::Cancelled, {}, "download cancelled");
        return;
    }
    if (download.status != 0 || !std::filesystem::exists(download_path, ec)) {
        remove_quietly(download_path);
        finish(FetchOutcome::Failed, {}, describe_failure(options_.downloader, download.status, download.last_line));
        return;
    }
    report(kDownloadShare);

    // Stage 2: transcode to a file the decoders can play
    auto convert = run_stage(
        {decoder_path_, "-y", "-loglevel", "error", "-i", download_path.string(), "-vn",
         "-c:a", "libmp3lame", "-q:a", "2", "-f", "mp3", part_path.string()},
        *control, nullptr);
    remove_quietly(download_path);

    if (convert.cancelled) {
        remove_quietly(part_path);
        finish(FetchOutcome::Cancelled, {}, "download cancelled");
        return;
    }
    if (convert.status != 0) {
        remove_quietly(part_path);
        finish(FetchOutcome::Failed, {}, describe_failure(options_.decoder, convert.status, convert.last_line));
        return;
    }

    if (std::filesystem::exists(target, ec)) {
        // Another job for the same video got there first
        remove_quietly(part_path);
        report(1.0);
        finish(FetchOutcome::Resolved, target, {});
        return;
    }

    std::filesystem::rename(part_path, target, ec);
    if (ec) {
        remove_quietly(part_path);
        finish(FetchOutcome::Failed, {}, "cannot move into cache: " + ec.message());
        return;
    }

    report(1.0);
    util::Logger::info("YtDlpFetcher: Cached " + target.string());
    finish(FetchOutcome::Resolved, target, {});
}

YtDlpFetcher::StageResult YtDlpFetcher::run_stage(const std::vector<std::string>& argv, FetchControl& control,
                                                  const std::function<void(const std::string&)>& on_line) {
    StageResult result;

    auto child = util::ChildProcess::spawn(argv);
    if (!child) {
        result.last_line = "could not start " + argv.front();
        return result;
    }

    std::optional<std::chrono::steady_clock::time_point> kill_deadline;
    std::string line;

    while (true) {
        if (control.cancel_requested()) {
            result.cancelled = true;
            if (!kill_deadline) {
                child->terminate();
                kill_deadline = std::chrono::steady_clock::now() + options_.grace;
            } else if (std::chrono::steady_clock::now() >= *kill_deadline) {
                child->kill();
            }
        }

        auto status = child->read_line(line, kReadInterval);
        if (status == util::ChildProcess::ReadStatus::Eof) break;
        if (status == util::ChildProcess::ReadStatus::Line) {
            if (!line.empty()) result.last_line = line;
            if (on_line) on_line(line);
        }
    }

    result.status = child->wait();
    util::Logger::debug("YtDlpFetcher: " + argv.front() + " exited with " + std::to_string(result.status));
    return result;
}

}  // namespace listui::fetch
