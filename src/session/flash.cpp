#include "sessionseal/session/flash.hpp"

namespace sessionseal::session {

namespace {
    template<typename Map>
    std::string Lookup(Map& messages, std::string_view key) {
        const auto it = messages.find(key);
        if (it == messages.end()) {
            return {};
        }
        return it->second;
    }

    template<typename Map>
    void Erase(Map& messages, std::string_view key) {
        const auto it = messages.find(key);
        if (it != messages.end()) {
            messages.erase(it);
        }
    }
}

Flash Flash::FromState(const proto::session::FlashState& state) {
    Flash flash;
    for (const auto& [key, message] : state.flashes()) {
        flash.Now(key, message);
    }
    for (const auto& [key, message] : state.keep()) {
        flash.Keep(key, message);
    }
    return flash;
}

proto::session::FlashState Flash::ExportState() const {
    proto::session::FlashState state;
    for (const auto& [key, message] : flashes_) {
        (*state.mutable_flashes())[key] = message;
    }
    for (const auto& [key, message] : keep_) {
        (*state.mutable_keep())[key] = message;
    }
    return state;
}

void Flash::Now(std::string key, std::string message) {
    if (message.empty()) {
        return;
    }
    now_.insert_or_assign(std::move(key), std::move(message));
}

void Flash::Add(std::string key, std::string message) {
    if (message.empty()) {
        return;
    }
    flashes_.insert_or_assign(std::move(key), std::move(message));
}

void Flash::Keep(std::string key, std::string message) {
    if (message.empty()) {
        return;
    }
    keep_.insert_or_assign(std::move(key), std::move(message));
}

std::string Flash::Get(std::string_view key) {
    std::string message = Lookup(now_, key);
    if (message.empty()) {
        message = Lookup(flashes_, key);
    }
    if (message.empty()) {
        message = Lookup(keep_, key);
    }
    if (!message.empty()) {
        Remove(key);
    }
    return message;
}

void Flash::Remove(std::string_view key) {
    Erase(now_, key);
    Erase(flashes_, key);
    Erase(keep_, key);
}

void Flash::Clear() noexcept {
    now_.clear();
    flashes_.clear();
    keep_.clear();
}

bool Flash::Empty() const noexcept {
    return now_.empty() && flashes_.empty() && keep_.empty();
}

} // namespace sessionseal::session
