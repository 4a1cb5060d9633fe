#pragma once
// Commits one file's parsed triples as bounded, atomic batches.
//
// add() buffers; a full buffer is flushed as one multi-row insert. The first
// failed flush stops the run: committed() then counts only the rows of
// earlier, successful batches -- the failed batch is not assumed persisted.
// finish() flushes the final partial batch. The cancellation token is checked
// at every batch boundary. All rows of one run share one ingested_on date.
#include <cstdint>
#include <string>
#include <vector>

#include "ingest_result.hpp"
#include "../store/credential_store.hpp"
#include "../utils/cancellation.hpp"

namespace credingest {

class BatchWriter {
public:
    static constexpr size_t kDefaultBatchSize = 1000;

    BatchWriter(CredentialStore& store, std::string ingested_on,
                size_t capacity = kDefaultBatchSize,
                CancellationToken token = CancellationToken());

    BatchWriter(const BatchWriter&) = delete;
    BatchWriter& operator=(const BatchWriter&) = delete;

    // False once the run has stopped (failed flush, cancellation, timeout)
    bool add(ParsedTriple triple);

    // Flush whatever is buffered. Safe to call more than once.
    bool finish();

    [[nodiscard]] int64_t committed() const { return committed_; }
    [[nodiscard]] int64_t batches_flushed() const { return batches_; }
    [[nodiscard]] size_t buffered() const { return buffer_.size(); }
    [[nodiscard]] const std::string& ingested_on() const { return ingested_on_; }

    [[nodiscard]] bool failed() const { return error_kind_ != ErrorKind::NONE; }
    [[nodiscard]] ErrorKind error_kind() const { return error_kind_; }
    [[nodiscard]] const std::string& error() const { return error_; }

private:
    bool flush();

    CredentialStore& store_;
    std::string ingested_on_;
    size_t capacity_;
    CancellationToken token_;

    std::vector<ParsedTriple> buffer_;
    int64_t committed_ = 0;
    int64_t batches_ = 0;
    ErrorKind error_kind_ = ErrorKind::NONE;
    std::string error_;
};

} // namespace credingest
