#pragma once

#include "session/flash_state.pb.h"

#include <map>
#include <string>
#include <string_view>

namespace sessionseal::session {

/**
 * @brief Short-lived messages carried between requests in a session value
 *
 * Three lifetimes:
 * - Now: this request only, never persisted
 * - Add: the next request
 * - Keep: until read or removed
 *
 * Embed a FlashState field in the session message, load it with FromState
 * at the start of a request and store ExportState before saving. Messages
 * added for the next request come back as this request's Now messages.
 */
class Flash {
public:
    static Flash FromState(const proto::session::FlashState& state);

    [[nodiscard]] proto::session::FlashState ExportState() const;

    void Now(std::string key, std::string message);
    void Add(std::string key, std::string message);
    void Keep(std::string key, std::string message);

    /**
     * @brief Read a message and remove the key from all three lifetimes
     *
     * Lookup order is now, next request, kept. Empty if absent.
     */
    [[nodiscard]] std::string Get(std::string_view key);

    void Remove(std::string_view key);
    void Clear() noexcept;

    [[nodiscard]] bool Empty() const noexcept;

private:
    using Messages = std::map<std::string, std::string, std::less<>>;

    Messages now_;
    Messages flashes_;
    Messages keep_;
};

} // namespace sessionseal::session
