#include "../framework/SimpleTest.hpp"
#include "fetch/YtDlpFetcher.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <thread>
#include <unistd.h>
#include <vector>

using namespace listui;
using namespace std::chrono_literals;

namespace {

struct Sandbox {
    std::filesystem::path root;
    std::filesystem::path cache;
    std::filesystem::path state;
    std::filesystem::path downloader;
    std::filesystem::path decoder;
};

void write_script(const std::filesystem::path& path, const std::string& body) {
    {
        std::ofstream out(path);
        out << "#!/bin/sh\n" << body;
    }
    std::filesystem::permissions(path, std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
                                           std::filesystem::perms::group_exec);
}

// Stand-ins for yt-dlp and ffmpeg. The video id picks the downloader's behaviour.
const Sandbox& sandbox() {
    static const Sandbox box = [] {
        Sandbox b;
        b.root = std::filesystem::temp_directory_path() / ("listui_fetch_" + std::to_string(getpid()));
        b.cache = b.root / "cache";
        b.state = b.root / "state";
        std::filesystem::create_directories(b.root / "bin");
        std::filesystem::create_directories(b.state);
        b.downloader = b.root / "bin" / "yt-dlp";
        b.decoder = b.root / "bin" / "ffmpeg";

        write_script(b.downloader,
            "while [ $# -gt 0 ]; do\n"
            "  case \"$1\" in\n"
            "    -o) out=\"$2\"; shift ;;\n"
            "    https*) url=\"$1\" ;;\n"
            "  esac\n"
            "  shift\n"
            "done\n"
            "id=\"${url##*v=}\"\n"
            "case \"$id\" in\n"
            "  ok*)\n"
            "    for p in 10.0 35.5 70.0 100; do\n"
            "      echo \"[download]  $p% of 1.00MiB at 1.00MiB/s ETA 00:01\"\n"
            "      sleep 0.05\n"
            "    done\n"
            "    echo audio > \"$out\" ;;\n"
            "  fail*)\n"
            "    echo \"ERROR: [youtube] $id: Video unavailable\"\n"
            "    exit 1 ;;\n"
            "  slow*)\n"
            "    echo \"[download]  50.0% of 1.00MiB\"\n"
            "    echo audio > \"$out\"\n"
            "    sleep 1 ;;\n"
            "  hang*)\n"
            "    while :; do echo \"[download]   1.0% of 1.00MiB\"; sleep 0.1; done ;;\n"
            "  busy*)\n"
            "    touch \"" + b.state.string() + "/running.$$\"\n"
            "    sleep 0.4\n"
            "    rm -f \"" + b.state.string() + "/running.$$\"\n"
            "    echo audio > \"$out\" ;;\n"
            "esac\n");

        write_script(b.decoder,
            "while [ $# -gt 0 ]; do\n"
            "  case \"$1\" in\n"
            "    -i) in=\"$2\"; shift ;;\n"
            "  esac\n"
            "  last=\"$1\"\n"
            "  shift\n"
            "done\n"
            "cp \"$in\" \"$last\"\n");
        return b;
    }();
    return box;
}

fetch::YtDlpFetcher::Options options(size_t max_concurrent = 3) {
    fetch::YtDlpFetcher::Options opts;
    opts.downloader = sandbox().downloader.string();
    opts.decoder = sandbox().decoder.string();
    opts.cache_dir = sandbox().cache;
    opts.max_concurrent = max_concurrent;
    opts.grace = 500ms;
    return opts;
}

// Temporaries a job left behind for `id`.
size_t leftovers(const std::string& id) {
    size_t count = 0;
    std::error_code ec;
    for (auto it = std::filesystem::directory_iterator(sandbox().cache, ec);
         !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        auto name = it->path().filename().string();
        if (name.rfind(id + ".", 0) == 0 && name != id + ".mp3") ++count;
    }
    return count;
}

bool settled_within(const fetch::FetchHandle& handle, std::chrono::seconds limit) {
    return handle.future().wait_for(limit) == std::future_status::ready;
}

struct Recorder {
    std::mutex mutex;
    std::vector<double> progress;
    int completions = 0;

    fetch::Fetcher::ProgressCallback on_progress() {
        return [this](double f) {
            std::lock_guard<std::mutex> lock(mutex);
            progress.push_back(f);
        };
    }
    fetch::Fetcher::CompletionCallback on_complete() {
        return [this](const fetch::FetchResult&) {
            std::lock_guard<std::mutex> lock(mutex);
            ++completions;
        };
    }
};

}  // namespace

TEST_CASE(test_download_converts_and_caches) {
    fetch::YtDlpFetcher fetcher(options());
    Recorder rec;
    model::FetchToken token{3, 7};

    auto handle = fetcher.fetch({"Song", "ok1"}, token, rec.on_progress(), rec.on_complete());
    ASSERT_TRUE(settled_within(handle, 10s));

    auto result = handle.future().get();
    ASSERT_TRUE(result.outcome == fetch::FetchOutcome::Resolved);
    ASSERT_TRUE(result.path == fetcher.cache_path("ok1"));
    ASSERT_TRUE(result.token == token);
    ASSERT_TRUE(std::filesystem::exists(result.path));
    ASSERT_EQ(leftovers("ok1"), 0u);

    std::lock_guard<std::mutex> lock(rec.mutex);
    ASSERT_EQ(rec.completions, 1);
    ASSERT_TRUE(rec.progress.size() >= 2);
    ASSERT_TRUE(std::is_sorted(rec.progress.begin(), rec.progress.end()));
    ASSERT_TRUE(rec.progress.front() < 1.0);
    ASSERT_NEAR(rec.progress.back(), 1.0, 1e-9);
}

TEST_CASE(test_cached_file_skips_download) {
    fetch::YtDlpFetcher fetcher(options());
    {
        std::ofstream out(fetcher.cache_path("ok2"));
        out << "audio";
    }

    Recorder rec;
    auto handle = fetcher.fetch({"Song", "ok2"}, {}, rec.on_progress(), rec.on_complete());
    ASSERT_TRUE(settled_within(handle, 5s));
    ASSERT_TRUE(handle.future().get().outcome == fetch::FetchOutcome::Resolved);

    std::lock_guard<std::mutex> lock(rec.mutex);
    ASSERT_EQ(rec.progress.size(), 1u);
    ASSERT_NEAR(rec.progress[0], 1.0, 1e-9);
}

TEST_CASE(test_downloader_failure_is_reported) {
    fetch::YtDlpFetcher fetcher(options());
    Recorder rec;
    auto handle = fetcher.fetch({"Gone", "fail1"}, {}, rec.on_progress(), rec.on_complete());
    ASSERT_TRUE(settled_within(handle, 10s));

    auto result = handle.future().get();
    ASSERT_TRUE(result.outcome == fetch::FetchOutcome::Failed);
    ASSERT_TRUE(result.reason.find("Video unavailable") != std::string::npos);
    ASSERT_TRUE(result.reason.find("status 1") != std::string::npos);
    ASSERT_FALSE(std::filesystem::exists(fetcher.cache_path("fail1")));
}

TEST_CASE(test_cancel_terminates_running_download) {
    fetch::YtDlpFetcher fetcher(options());
    Recorder rec;
    auto handle = fetcher.fetch({"Forever", "hang1"}, {}, rec.on_progress(), rec.on_complete());

    // Wait for the process to start talking
    for (int i = 0; i < 100; ++i) {
        {
            std::lock_guard<std::mutex> lock(rec.mutex);
            if (!rec.progress.empty()) break;
        }
        std::this_thread::sleep_for(50ms);
    }

    handle.cancel();
    ASSERT_TRUE(settled_within(handle, 5s));
    ASSERT_TRUE(handle.finished());
    ASSERT_TRUE(handle.future().get().outcome == fetch::FetchOutcome::Cancelled);
    ASSERT_EQ(leftovers("hang1"), 0u);

    std::lock_guard<std::mutex> lock(rec.mutex);
    ASSERT_EQ(rec.completions, 1);
}

TEST_CASE(test_cancelling_one_job_spares_another_for_same_video) {
    fetch::YtDlpFetcher fetcher(options());
    auto first = fetcher.fetch({"Song", "slow1"}, {}, nullptr, nullptr);
    std::this_thread::sleep_for(200ms);
    auto second = fetcher.fetch({"Song (again)", "slow1"}, {}, nullptr, nullptr);
    std::this_thread::sleep_for(200ms);

    first.cancel();
    ASSERT_TRUE(settled_within(first, 5s));
    ASSERT_TRUE(first.future().get().outcome == fetch::FetchOutcome::Cancelled);

    ASSERT_TRUE(settled_within(second, 10s));
    auto result = second.future().get();
    ASSERT_TRUE(result.outcome == fetch::FetchOutcome::Resolved);
    ASSERT_TRUE(result.path == fetcher.cache_path("slow1"));
    ASSERT_TRUE(std::filesystem::exists(result.path));
    ASSERT_EQ(leftovers("slow1"), 0u);
}

TEST_CASE(test_parallel_jobs_for_same_video_both_resolve) {
    fetch::YtDlpFetcher fetcher(options());
    auto first = fetcher.fetch({"Song", "slow2"}, {}, nullptr, nullptr);
    auto second = fetcher.fetch({"Song (again)", "slow2"}, {}, nullptr, nullptr);

    ASSERT_TRUE(settled_within(first, 10s));
    ASSERT_TRUE(settled_within(second, 10s));
    ASSERT_TRUE(first.future().get().outcome == fetch::FetchOutcome::Resolved);
    ASSERT_TRUE(second.future().get().outcome == fetch::FetchOutcome::Resolved);
    ASSERT_TRUE(first.future().get().path == second.future().get().path);
    ASSERT_TRUE(std::filesystem::exists(fetcher.cache_path("slow2")));
    ASSERT_EQ(leftovers("slow2"), 0u);
}

TEST_CASE(test_concurrent_downloads_are_capped) {
    fetch::YtDlpFetcher fetcher(options(2));

    std::atomic<bool> done{false};
    std::atomic<size_t> peak{0};
    std::thread watcher([&] {
        while (!done.load()) {
            size_t running = 0;
            std::error_code ec;
            for (auto it = std::filesystem::directory_iterator(sandbox().state, ec);
                 !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
                ++running;
            }
            peak.store(std::max(peak.load(), running));
            std::this_thread::sleep_for(20ms);
        }
    });

    std::vector<fetch::FetchHandle> handles;
    for (int i = 0; i < 5; ++i) {
        handles.push_back(fetcher.fetch({"Busy", "busy" + std::to_string(i)}, {}, nullptr, nullptr));
    }

    bool all_settled = true;
    for (const auto& handle : handles) {
        if (!settled_within(handle, 20s)) all_settled = false;
    }
    done.store(true);
    watcher.join();

    ASSERT_TRUE(all_settled);
    for (const auto& handle : handles) {
        ASSERT_TRUE(handle.future().get().outcome == fetch::FetchOutcome::Resolved);
    }
    ASSERT_TRUE(peak.load() >= 1);
    ASSERT_TRUE(peak.load() <= 2);
}

TEST_CASE(test_missing_tool_is_reported) {
    auto opts = options();
    opts.decoder = (sandbox().root / "bin" / "no-such-ffmpeg").string();

    bool thrown = false;
    try {
        fetch::YtDlpFetcher fetcher(opts);
    } catch (const fetch::MissingExternalTool& e) {
        thrown = true;
        ASSERT_EQ(e.tool(), opts.decoder);
    }
    ASSERT_TRUE(thrown);
}

int main(int argc, char** argv) {
    sandbox();
    int rc = listui::test::TestRunner::instance().run_main(argc, argv);
    std::error_code ec;
    std::filesystem::remove_all(sandbox().root, ec);
    return rc;
}
