#ifndef PDFMASK_PROGRESS_HPP
#define PDFMASK_PROGRESS_HPP

#include <algorithm>
#include <functional>
#include <string>
#include <utility>

namespace pdfmask {

struct ProgressEvent {
    int percentage = 0;
    std::string message;
};

// Called on the worker thread; must not block.
using ProgressSink = std::function<void(const ProgressEvent &)>;

// Clamps to [0,100] and never lets the percentage go backwards within a run.
class ProgressReporter {
public:
    explicit ProgressReporter(ProgressSink sink) : sink_(std::move(sink)) {}

    void report(int pct, const std::string &message) {
        last_ = std::max(last_, std::min(100, std::max(0, pct)));
        if (sink_) sink_({last_, message});
    }

private:
    ProgressSink sink_;
    int last_ = 0;
};

} // namespace pdfmask

#endif // PDFMASK_PROGRESS_HPP
