#include "batch_writer.hpp"
#include "../utils/logger.hpp"

namespace credingest {

BatchWriter::BatchWriter(CredentialStore& store, std::string ingested_on,
                         size_t capacity, CancellationToken token)
    : store_(store), ingested_on_(std::move(ingested_on)),
      capacity_(capacity == 0 ? kDefaultBatchSize : capacity), token_(std::move(token)) {
    buffer_.reserve(capacity_);
}

bool BatchWriter::add(ParsedTriple triple) {
    if (failed()) return false;
    buffer_.push_back(std::move(triple));
    if (buffer_.size() >= capacity_) return flush();
    return true;
}

bool BatchWriter::finish() {
    if (failed()) return false;
    if (buffer_.empty()) return true;
    return flush();
}

bool BatchWriter::flush() {
    if (token_.stop_requested()) {
        error_kind_ = ErrorKind::TIMEOUT;
        error_ = token_.is_cancelled() ? "ingestion cancelled" : "ingestion timed out";
        LOG_WRN("[batch] Stopping at batch boundary: %s (%lld entries committed)",
            error_.c_str(), static_cast<long long>(committed_));
        buffer_.clear();
        return false;
    }

    if (!store_.insert_batch(buffer_, ingested_on_)) {
        error_kind_ = ErrorKind::STORE;
        error_ = "batch execution failed after " + std::to_string(committed_) + " committed entries";
        LOG_ERR("[batch] Flush of %zu entries failed on %s",
            buffer_.size(), store_.backend_name());
        buffer_.clear();
        return false;
    }

    int64_t before = committed_;
    committed_ += static_cast<int64_t>(buffer_.size());
    ++batches_;
    buffer_.clear();

    if (committed_ / 10000 != before / 10000) {
        LOG_INF("[batch] Processed %lld entries so far", static_cast<long long>(committed_));
    }
    return true;
}

} // namespace credingest
