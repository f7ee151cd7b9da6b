#include "prompt/prompt_channel.hpp"

#include <format>

PromptChannel::PromptChannel(RecordStore& store) : store_(store) {}

std::expected<PromptChannel::Published, StoreError> PromptChannel::publish(
    const PromptRecord& prompt) {
    auto fields = to_fields(prompt);
    fields[field::RESPONDED] = 0;

    auto res = store_.save(Record{
        .type = record_type::PROMPT,
        .id = prompt.id,
        .fields = std::move(fields),
        .change_tag = std::nullopt,
    });
    if (res) return Published::Created;
    if (res.error().kind == StoreErrorKind::Conflict) return Published::AlreadyPresent;
    return std::unexpected(res.error());
}

std::expected<PromptRecord, StoreError> PromptChannel::submit_response(
    const std::string& prompt_id, const std::string& text, const std::string& device,
    Timestamp at) {
    auto rec = store_.fetch(record_type::PROMPT, prompt_id);
    if (!rec) {
        if (rec.error().kind == StoreErrorKind::UnknownType) {
            return std::unexpected(StoreError{StoreErrorKind::NotFound, "prompt " + prompt_id});
        }
        return std::unexpected(rec.error());
    }
    if (!prompt_from_fields(rec->fields)) {
        return std::unexpected(
            StoreError{StoreErrorKind::Malformed, "prompt " + prompt_id + " does not decode"});
    }

    apply_response(rec->fields, text, at, device);

    auto saved = store_.save(*rec);
    if (!saved) return std::unexpected(saved.error());

    auto prompt = prompt_from_fields(saved->fields);
    if (!prompt) return std::unexpected(StoreError{StoreErrorKind::Malformed, prompt.error()});
    return *prompt;
}

std::expected<PromptChannel::Batch, StoreError> PromptChannel::fetch_responses(
    const SessionId& session) {
    return run_query(Query{
        .type = record_type::PROMPT,
        .predicates =
            {
                {field::SESSION_ID, PredicateOp::Equal, session.str()},
                {field::RESPONDED, PredicateOp::Equal, 1},
            },
        .sort_field = field::RESPONDED_AT,
        .descending = false,
        .limit = PAGE_SIZE,
    });
}

std::expected<PromptChannel::Batch, StoreError> PromptChannel::fetch_pending() {
    return run_query(Query{
        .type = record_type::PROMPT,
        .predicates = {{field::RESPONDED, PredicateOp::Equal, 0}},
        .sort_field = field::TIMESTAMP,
        .descending = true,
        .limit = PAGE_SIZE,
    });
}

std::expected<PromptChannel::Batch, StoreError> PromptChannel::run_query(const Query& query) {
    Batch batch;
    std::optional<std::string> cursor;
    do {
        auto page = store_.query(query, cursor);
        if (!page) {
            // No prompt has ever been written: nothing to answer yet.
            if (page.error().kind == StoreErrorKind::UnknownType) return batch;
            return std::unexpected(page.error());
        }
        for (const auto& rec : page->records) {
            auto prompt = prompt_from_fields(rec.fields);
            if (!prompt) {
                ++batch.malformed;
                continue;
            }
            batch.prompts.push_back(std::move(*prompt));
        }
        cursor = page->cursor;
    } while (cursor);
    return batch;
}

std::expected<PromptRecord, StoreError> PromptChannel::fetch(const std::string& prompt_id) {
    auto rec = store_.fetch(record_type::PROMPT, prompt_id);
    if (!rec) return std::unexpected(rec.error());
    auto prompt = prompt_from_fields(rec->fields);
    if (!prompt) {
        return std::unexpected(StoreError{StoreErrorKind::Malformed, prompt_id + ": " + prompt.error()});
    }
    return *prompt;
}

std::expected<void, StoreError> PromptChannel::remove(const std::string& prompt_id) {
    auto res = store_.remove(record_type::PROMPT, prompt_id);
    if (!res && !res.error().is_absent()) return std::unexpected(res.error());
    return {};
}

std::string make_prompt_id(const SessionId& session, Timestamp at) {
    return std::format("{}-{}", session.str(), to_epoch_ms(at));
}
