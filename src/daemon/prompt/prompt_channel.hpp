#pragma once

#include "model/records.hpp"
#include "model/session_id.hpp"
#include "store/record_store.hpp"

#include <cstddef>
#include <expected>
#include <string>
#include <vector>

// Prompt records in the shared store. Every call blocks on the store and runs
// on a worker.
//
//   Created   source writes the record, responded = 0
//   Answered  a remote device sets the response fields and responded = 1
//   Delivered the source routed the text locally and deleted the record
class PromptChannel {
public:
    enum class Published { Created, AlreadyPresent };

    struct Batch {
        std::vector<PromptRecord> prompts;
        size_t malformed = 0;
    };

    static constexpr size_t PAGE_SIZE = 100;

    explicit PromptChannel(RecordStore& store);

    // Create only: an existing record for the same prompt id is left untouched.
    std::expected<Published, StoreError> publish(const PromptRecord& prompt);

    // Sets the response on an existing prompt. A missing prompt is an error;
    // only sources create prompts.
    std::expected<PromptRecord, StoreError> submit_response(const std::string& prompt_id,
                                                            const std::string& text,
                                                            const std::string& device,
                                                            Timestamp at);

    // Answered prompts for one session, oldest answer first.
    std::expected<Batch, StoreError> fetch_responses(const SessionId& session);

    // Unanswered prompts of every source, newest first.
    std::expected<Batch, StoreError> fetch_pending();

    std::expected<PromptRecord, StoreError> fetch(const std::string& prompt_id);

    // NotFound counts as success.
    std::expected<void, StoreError> remove(const std::string& prompt_id);

private:
    std::expected<Batch, StoreError> run_query(const Query& query);

    RecordStore& store_;
};

// "<session>-<epoch ms>": the same prompt file always maps to the same id.
std::string make_prompt_id(const SessionId& session, Timestamp at);
