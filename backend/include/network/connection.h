#pragma once

#include <cstdint>
#include <memory>
#include <string>

/**
 * Handle to one live client session, independent of the transport behind it.
 *
 * The relay holds these in account connection sets and writes outbound
 * frames through them. Implementations must tolerate `send` and `is_open`
 * from any thread.
 */
class Connection {
public:
    virtual ~Connection() = default;

    /// Hand one frame to the transport. Returns false once the session is closed.
    virtual bool send(const std::string& frame) = 0;

    /// False as soon as the session starts closing, even before it is reaped.
    [[nodiscard]] virtual bool is_open() const = 0;

    virtual void close() = 0;

    /// Process-unique identifier, stable for the life of the session.
    [[nodiscard]] virtual std::uint64_t id() const = 0;

    [[nodiscard]] virtual std::string remote_endpoint() const = 0;

protected:
    static std::uint64_t next_id();
};

using ConnectionPtr = std::shared_ptr<Connection>;
