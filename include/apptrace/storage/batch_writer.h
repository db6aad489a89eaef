#ifndef APPTRACE_STORAGE_BATCH_WRITER_H_
#define APPTRACE_STORAGE_BATCH_WRITER_H_

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "apptrace/common/logger.h"
#include "apptrace/core/result.h"

namespace apptrace {
namespace storage {

/**
 * @brief One strategy for persisting a non-empty batch of records
 */
template<typename Record>
class BatchWriter {
public:
    virtual ~BatchWriter() = default;

    virtual core::Result<void> write(const std::vector<Record>& records) = 0;

    /**
     * @brief Short strategy name used in log lines and error messages
     */
    virtual std::string name() const = 0;
};

/**
 * @brief Two-stage writer: attempt the primary strategy, then the secondary.
 *
 * A primary failure is logged and never returned to the caller. When the
 * secondary fails as well its error is returned with the primary cause
 * appended.
 */
template<typename Record>
class FallbackWriter : public BatchWriter<Record> {
public:
    FallbackWriter(std::shared_ptr<BatchWriter<Record>> primary,
                   std::shared_ptr<BatchWriter<Record>> secondary)
        : primary_(std::move(primary)), secondary_(std::move(secondary)) {}

    core::Result<void> write(const std::vector<Record>& records) override {
        auto primary_result = primary_->write(records);
        if (primary_result.ok()) {
            primary_batches_.fetch_add(1, std::memory_order_relaxed);
            return primary_result;
        }

        fallback_batches_.fetch_add(1, std::memory_order_relaxed);
        APPTRACE_WARN("{} write of {} records failed, falling back to {}: {}",
                      primary_->name(), records.size(), secondary_->name(),
                      primary_result.error());

        auto secondary_result = secondary_->write(records);
        if (secondary_result.ok()) {
            return secondary_result;
        }

        failed_batches_.fetch_add(1, std::memory_order_relaxed);
        return core::Result<void>::error(
            secondary_result.error() + " (after " + primary_->name() +
            " failure: " + primary_result.error() + ")");
    }

    std::string name() const override {
        return primary_->name() + "+" + secondary_->name();
    }

    uint64_t primary_batches() const { return primary_batches_.load(std::memory_order_relaxed); }
    uint64_t fallback_batches() const { return fallback_batches_.load(std::memory_order_relaxed); }
    uint64_t failed_batches() const { return failed_batches_.load(std::memory_order_relaxed); }

private:
    std::shared_ptr<BatchWriter<Record>> primary_;
    std::shared_ptr<BatchWriter<Record>> secondary_;
    std::atomic<uint64_t> primary_batches_{0};
    std::atomic<uint64_t> fallback_batches_{0};
    std::atomic<uint64_t> failed_batches_{0};
};

} // namespace storage
} // namespace apptrace

#endif // APPTRACE_STORAGE_BATCH_WRITER_H_
