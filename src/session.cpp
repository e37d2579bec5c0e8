// SPDX-License-Identifier: MIT

// src/session.cpp
#include "src/session.hpp"

#include <algorithm>

#include "src/random.hpp"

namespace stage_pipe {

std::optional<SessionId> SessionId::Generate() {
    auto hex = SecureRandomHex<kLength / 2>();
    if (!hex) return std::nullopt;
    return SessionId(std::move(*hex));
}

std::optional<SessionId> SessionId::Parse(std::string_view text) {
    if (text.size() != kLength) return std::nullopt;
    bool valid = std::all_of(text.begin(), text.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
    if (!valid) return std::nullopt;
    return SessionId(std::string(text));
}

Session::Session() : state_(std::make_shared<State>()) {}

Session::Session(SessionRecord record) : state_(std::make_shared<State>()) {
    state_->record = std::move(record);
}

std::optional<SessionId> Session::Id() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->record.id;
}

std::optional<std::string> Session::Get(std::string_view key) const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto it = state_->record.data.find(key);
    if (it == state_->record.data.end()) return std::nullopt;
    return it->second;
}

void Session::Insert(std::string key, std::string value) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto& data = state_->record.data;
    auto it = data.find(key);
    if (it != data.end()) {
        if (it->second == value) return;
        it->second = std::move(value);
    } else {
        data.emplace(std::move(key), std::move(value));
    }
    state_->modified = true;
}

std::optional<std::string> Session::Remove(std::string_view key) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    auto& data = state_->record.data;
    auto it = data.find(key);
    if (it == data.end()) return std::nullopt;
    std::optional<std::string> previous(std::move(it->second));
    data.erase(it);
    state_->modified = true;
    return previous;
}

void Session::Clear() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    if (state_->record.data.empty()) return;
    state_->record.data.clear();
    state_->modified = true;
}

void Session::Flush() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->record.data.clear();
    Detach(*state_);
    state_->modified = true;
}

void Session::CycleId() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    Detach(*state_);
    state_->modified = true;
}

bool Session::IsEmpty() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->record.data.empty();
}

bool Session::IsModified() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->modified;
}

std::size_t Session::Size() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->record.data.size();
}

Session::Changes Session::TakeChanges() {
    std::lock_guard<std::mutex> lock(state_->mutex);
    Changes changes{state_->modified, state_->record, std::move(state_->stale_id)};
    state_->stale_id.reset();
    state_->modified = false;
    return changes;
}

void Session::Bind(SessionId id) {
    std::lock_guard<std::mutex> lock(state_->mutex);
    state_->record.id = std::move(id);
}

// Forget the stored id. The loaded record stays scheduled for deletion.
void Session::Detach(State& state) {
    if (!state.record.id) return;
    if (!state.stale_id) state.stale_id = std::move(state.record.id);
    state.record.id.reset();
}

}  // namespace stage_pipe
