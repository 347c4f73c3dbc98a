#ifndef PDFMASK_CANCELLATION_HPP
#define PDFMASK_CANCELLATION_HPP

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace pdfmask {

// Set from any thread, polled by the pipeline. Once set it stays set.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// Process wide map from run id to the token guarding that run.
class CancellationRegistry {
public:
    // Returns the token for `run_id`, creating it if needed.
    std::shared_ptr<CancellationToken> create(const std::string &run_id);
    std::shared_ptr<CancellationToken> find(const std::string &run_id) const;
    // False when no such run is registered.
    bool cancel(const std::string &run_id);
    void cancel_all();
    void remove(const std::string &run_id);
    std::size_t size() const;

    static CancellationRegistry &instance();

private:
    mutable std::mutex mu_;
    std::map<std::string, std::shared_ptr<CancellationToken>> tokens_;
};

// Registers a run on construction and removes it on destruction.
class ScopedRun {
public:
    ScopedRun(CancellationRegistry &registry, std::string run_id)
        : registry_(registry), run_id_(std::move(run_id)), token_(registry_.create(run_id_)) {}
    ~ScopedRun() { registry_.remove(run_id_); }
    ScopedRun(const ScopedRun &) = delete;
    ScopedRun &operator=(const ScopedRun &) = delete;

    CancellationToken &token() { return *token_; }
    const std::string &id() const { return run_id_; }

private:
    CancellationRegistry &registry_;
    std::string run_id_;
    std::shared_ptr<CancellationToken> token_;
};

} // namespace pdfmask

#endif // PDFMASK_CANCELLATION_HPP
