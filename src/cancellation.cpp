#include "cancellation.hpp"

namespace pdfmask {

std::shared_ptr<CancellationToken> CancellationRegistry::create(const std::string &run_id) {
    std::lock_guard<std::mutex> lk(mu_);
    auto &slot = tokens_[run_id];
    if (!slot) slot = std::make_shared<CancellationToken>();
    return slot;
}

std::shared_ptr<CancellationToken> CancellationRegistry::find(const std::string &run_id) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = tokens_.find(run_id);
    return it == tokens_.end() ? nullptr : it->second;
}

bool CancellationRegistry::cancel(const std::string &run_id) {
    auto token = find(run_id);
    if (!token) return false;
    token->cancel();
    return true;
}

void CancellationRegistry::cancel_all() {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto &kv : tokens_) kv.second->cancel();
}

void CancellationRegistry::remove(const std::string &run_id) {
    std::lock_guard<std::mutex> lk(mu_);
    tokens_.erase(run_id);
}

std::size_t CancellationRegistry::size() const {
    std::lock_guard<std::mutex> lk(mu_);
    return tokens_.size();
}

CancellationRegistry &CancellationRegistry::instance() {
    static CancellationRegistry registry;
    return registry;
}

} // namespace pdfmask
