/**
 * @file batch_source.hpp
 * @brief Raw layer access: the batch of one process date
 */

#pragma once

#include <core/errors.hpp>
#include <core/event.hpp>
#include <map>
#include <string>
#include <vector>

namespace Sessionizer {

struct RawBatch {
    std::vector<Event> events;          // rows that passed validation, input order
    std::vector<RejectedRow> rejected;  // rows dropped under SchemaPolicy::RejectRows
    size_t raw_rows = 0;                // data rows read, valid or not
};

class BatchSource {
public:
    virtual ~BatchSource() = default;

    /**
     * @throws SessionizerError when the batch cannot be read
     * @throws SchemaViolationError when the batch does not match the event schema
     */
    virtual RawBatch read(Date process_date) = 0;
};

/**
 * @brief Batches held in memory, one per date. A date without a batch reads as empty.
 */
class MemoryBatchSource : public BatchSource {
public:
    void put(Date process_date, std::vector<Event> events) {
        batches_[process_date] = std::move(events);
    }

    RawBatch read(Date process_date) override {
        RawBatch batch;
        auto it = batches_.find(process_date);
        if (it != batches_.end()) batch.events = it->second;
        batch.raw_rows = batch.events.size();
        return batch;
    }

private:
    std::map<Date, std::vector<Event>> batches_;
};

} // namespace Sessionizer
