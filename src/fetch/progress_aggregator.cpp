#include <shardfetch/fetch/progress_aggregator.hpp>

namespace shardfetch::fetch {

void ProgressAggregator::onTaskProgress(Task& task, const TransferProgress& progress) {
    // The transport's own total is kept per task as-is; it is not reconciled with total_.
    registry_.updateProgress(task, progress.loadedBytes, progress.totalBytes.value_or(0));
    if (!callback_)
        return;

    // Summing under the lock means a later emission never reports less than an earlier one.
    std::lock_guard<std::mutex> lk(emitMutex_);
    callback_(static_cast<std::int64_t>(registry_.loadedSum()), total_);
}

} // namespace shardfetch::fetch
