#include <timelock/common/critical.hpp>
#include <timelock/state/overlay.hpp>
#include <iterator>
#include <utility>

namespace timelock::state {

overlay::overlay(read_through_t read_through)
    : read_through_{std::move(read_through)} {}

std::optional<timelock::schema::bytes_t> overlay::get(
    const timelock::schema::bytes_view_t& key) const {
  auto it = writes_.find(timelock::schema::make_bytes(key));
  if (it != std::end(writes_)) {
    return it->second;
  }
  if (!read_through_) {
    return std::nullopt;
  }
  return read_through_(key);
}

bool overlay::contains(const timelock::schema::bytes_view_t& key) const {
  return get(key).has_value();
}

void overlay::put(const timelock::schema::bytes_view_t& key,
                  timelock::schema::bytes_t value) {
  auto owned_key = timelock::schema::make_bytes(key);
  if (!checkpoints_.empty()) {
    auto it = writes_.find(owned_key);
    if (it != std::end(writes_)) {
      journal_.push_back(journal_entry{owned_key, it->second});
    } else {
      journal_.push_back(journal_entry{owned_key, std::nullopt});
    }
  }
  writes_.insert_or_assign(std::move(owned_key), std::move(value));
}

void overlay::checkpoint() {
  checkpoints_.push_back(journal_.size());
}

void overlay::commit() {
  if (checkpoints_.empty()) {
    timelock::common::critical("overlay commit without checkpoint");
  }
  checkpoints_.pop_back();
  if (checkpoints_.empty()) {
    journal_.clear();
  }
}

void overlay::revert() {
  if (checkpoints_.empty()) {
    timelock::common::critical("overlay revert without checkpoint");
  }
  auto last_point = checkpoints_.back();
  checkpoints_.pop_back();

  while (journal_.size() > last_point) {
    auto& entry = journal_.back();
    if (entry.previous.has_value()) {
      writes_.insert_or_assign(entry.key, std::move(*entry.previous));
    } else {
      writes_.erase(entry.key);
    }
    journal_.pop_back();
  }
}

std::size_t overlay::depth() const {
  return checkpoints_.size();
}

std::vector<timelock::storage::key_value_entry_t> overlay::pending_writes()
    const {
  auto entries = std::vector<timelock::storage::key_value_entry_t>{};
  entries.reserve(writes_.size());
  for (const auto& [key, value] : writes_) {
    entries.emplace_back(key, value);
  }
  return entries;
}

void overlay::clear() {
  writes_.clear();
  journal_.clear();
  checkpoints_.clear();
}

transaction_scope::transaction_scope(overlay& state) : state_{state} {
  state_.checkpoint();
}

transaction_scope::~transaction_scope() {
  if (!committed_) {
    state_.revert();
  }
}

void transaction_scope::commit() {
  if (committed_) {
    return;
  }
  state_.commit();
  committed_ = true;
}

}  // namespace timelock::state
