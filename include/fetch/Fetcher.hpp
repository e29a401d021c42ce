#pragma once

#include "model/Library.hpp"
#include "model/Session.hpp"
#include <atomic>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>

namespace listui::fetch {

// The downloader or decoder executable is not installed.
class MissingExternalTool : public std::runtime_error {
public:
    explicit MissingExternalTool(const std::string& tool)
        : std::runtime_error("required program not found: " + tool), tool_(tool) {}

    const std::string& tool() const { return tool_; }

private:
    std::string tool_;
};

enum class FetchOutcome { Resolved, Failed, Cancelled };

struct FetchResult {
    FetchOutcome outcome = FetchOutcome::Failed;
    std::filesystem::path path;  // Resolved only
    std::string reason;          // Failed only
    model::FetchToken token;     // Token captured at dispatch
};

// State shared by a FetchHandle and the job running it.
class FetchControl {
public:
    FetchControl() : future_(promise_.get_future().share()) {}

    void request_cancel() { cancel_requested_.store(true); }
    [[nodiscard]] bool cancel_requested() const { return cancel_requested_.load(); }

    // First call wins; returns false for every later call.
    bool complete(const FetchResult& result);

    [[nodiscard]] std::shared_future<FetchResult> future() const { return future_; }

private:
    std::atomic<bool> cancel_requested_{false};
    std::atomic<bool> completed_{false};
    std::promise<FetchResult> promise_;
    std::shared_future<FetchResult> future_;
};

class FetchHandle {
public:
    FetchHandle() = default;
    explicit FetchHandle(std::shared_ptr<FetchControl> control) : control_(std::move(control)) {}

    // Best effort: a queued job resolves Cancelled, a running one has its process terminated.
    // The future resolves either way.
    void cancel();

    [[nodiscard]] bool valid() const { return control_ != nullptr; }
    [[nodiscard]] bool finished() const;
    [[nodiscard]] std::shared_future<FetchResult> future() const;

private:
    std::shared_ptr<FetchControl> control_;
};

class Fetcher {
public:
    using ProgressCallback = std::function<void(double)>;
    using CompletionCallback = std::function<void(const FetchResult&)>;

    virtual ~Fetcher() = default;

    // Ensures a playable file exists for `track`. Both callbacks run on a background
    // thread; progress fractions never decrease and the completion runs exactly once.
    virtual FetchHandle fetch(const model::TrackDescriptor& track, model::FetchToken token,
                              ProgressCallback on_progress, CompletionCallback on_complete) = 0;
};

}  // namespace listui::fetch
