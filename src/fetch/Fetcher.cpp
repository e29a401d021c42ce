#include "fetch/Fetcher.hpp"
#include <chrono>

namespace listui::fetch {

bool FetchControl::complete(const FetchResult& result) {
    if (completed_.exchange(true)) return false;
    promise_.set_value(result);
    return true;
}

void FetchHandle::cancel() {
    if (control_) control_->request_cancel();
}

bool FetchHandle::finished() const {
    if (!control_) return true;
    return control_->future().wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

std::shared_future<FetchResult> FetchHandle::future() const {
    if (!control_) return {};
    return control_->future();
}

}  // namespace listui::fetch
