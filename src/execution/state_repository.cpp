#include <corridor/execution/state_repository.hpp>
#include <corridor/schema/key/engine_keys.hpp>
#include <spdlog/spdlog.h>

#include <iterator>
#include <utility>

using namespace corridor::schema;

namespace corridor::execution {

namespace {

bytes_view_t view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

change_set::change_set(encoder_t& encoder) : encoder_{encoder} {}

void change_set::put_intent(const intent_state_t& intent) {
  entries_.emplace_back(key::make_intent_key(encoder_, intent.intent_id),
                        encoder_.encode(intent));
}

void change_set::put_intent_sequence(const intent_id_t last_id) {
  entries_.emplace_back(key::make_intent_seq_key(encoder_),
                        encoder_.encode(last_id));
}

void change_set::put_owner_index(const account_id_t& owner,
                                 const intent_id_t intent_id) {
  entries_.emplace_back(key::make_owner_intent_key(encoder_, owner, intent_id),
                        encoder_.encode(intent_id));
}

void change_set::put_fee_params(const fee_params_t& params) {
  entries_.emplace_back(key::make_fee_params_key(encoder_, params.corridor_id),
                        encoder_.encode(params));
}

void change_set::put_flow(const flow_state_t& flow) {
  entries_.emplace_back(key::make_flow_key(encoder_, flow.corridor_id),
                        encoder_.encode(flow));
}

void change_set::put_corridor(const corridor_state_t& corridor) {
  entries_.emplace_back(key::make_corridor_key(encoder_, corridor.corridor_id),
                        encoder_.encode(corridor));
}

void change_set::emit(transaction_event_t event) {
  events_.push_back(std::move(event));
}

state_repository::state_repository(encoder_t& encoder, storage_t& storage)
    : encoder_{encoder}, storage_{storage} {}

std::optional<intent_state_t> state_repository::load_intent(
    const intent_id_t intent_id) const {
  if (intent_id == 0) {
    return std::nullopt;
  }
  auto key = key::make_intent_key(encoder_, intent_id);
  return storage_.get<intent_state_t>(encoder_, view(key));
}

intent_id_t state_repository::last_intent_id() const {
  auto key = key::make_intent_seq_key(encoder_);
  return storage_.get<intent_id_t>(encoder_, view(key)).value_or(0);
}

std::vector<intent_id_t> state_repository::load_owner_intents(
    const account_id_t& owner,
    const std::size_t max_results) const {
  auto prefix = key::make_owner_intent_prefix(encoder_, owner);
  auto rows = storage_.list_by_prefix(view(prefix), max_results);

  auto ids = std::vector<intent_id_t>{};
  ids.reserve(rows.size());
  for (const auto& [row_key, row_value] : rows) {
    ids.push_back(encoder_.decode<intent_id_t>(view(row_value)));
  }
  return ids;
}

std::optional<fee_params_t> state_repository::load_fee_params(
    const corridor_id_t& corridor_id) const {
  auto key = key::make_fee_params_key(encoder_, corridor_id);
  return storage_.get<fee_params_t>(encoder_, view(key));
}

flow_state_t state_repository::load_flow(
    const corridor_id_t& corridor_id) const {
  auto key = key::make_flow_key(encoder_, corridor_id);
  auto flow = storage_.get<flow_state_t>(encoder_, view(key));
  if (!flow) {
    return flow_state_t{.corridor_id = corridor_id};
  }
  return *flow;
}

std::optional<corridor_state_t> state_repository::load_corridor(
    const corridor_id_t& corridor_id) const {
  auto key = key::make_corridor_key(encoder_, corridor_id);
  return storage_.get<corridor_state_t>(encoder_, view(key));
}

uint64_t state_repository::last_event_id() const {
  auto key = key::make_event_seq_key(encoder_);
  return storage_.get<uint64_t>(encoder_, view(key)).value_or(0);
}

std::vector<event_record_t> state_repository::load_events(
    const uint64_t from_id,
    const uint64_t to_id) const {
  auto records = std::vector<event_record_t>{};
  if (from_id > to_id) {
    return records;
  }
  auto first = key::make_event_key(encoder_, from_id);
  auto last = key::make_event_key(encoder_, to_id);
  auto rows = storage_.list_range(view(first), view(last));
  records.reserve(rows.size());
  for (const auto& [row_key, row_value] : rows) {
    records.push_back(encoder_.decode<event_record_t>(view(row_value)));
  }
  return records;
}

change_set state_repository::begin() const {
  return change_set{encoder_};
}

std::vector<event_record_t> state_repository::commit(
    const change_set& changes,
    const timestamp_milliseconds_t recorded_at) {
  auto records = std::vector<event_record_t>{};
  if (changes.empty()) {
    return records;
  }

  auto entries = changes.entries();
  auto next_event_id = last_event_id();
  records.reserve(changes.events().size());
  for (const auto& event : changes.events()) {
    ++next_event_id;
    auto record = event_record_t{
        .event_id = next_event_id, .recorded_at = recorded_at, .event = event};
    entries.emplace_back(key::make_event_key(encoder_, next_event_id),
                         encoder_.encode(record));
    records.push_back(std::move(record));
  }
  if (!records.empty()) {
    entries.emplace_back(key::make_event_seq_key(encoder_),
                         encoder_.encode(next_event_id));
  }

  storage_.write_batch(entries);
  spdlog::debug("Committed {} state entries and {} event(s)",
                changes.entries().size(), records.size());
  return records;
}

}  // namespace corridor::execution
