#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <sys/types.h>
#include <util/error.hpp>
#include <util/unique_fd.hpp>
#include <vector>

namespace kiln::session {

struct SessionEvent {
    bool active = false;
};

class Session;

/// @brief A device node opened through the seat. Closed through the seat on destruction.
class SeatDevice {
public:
    SeatDevice(Session& session, int device_id, util::UniqueFd fd, std::filesystem::path path,
               dev_t devnum);
    ~SeatDevice();

    SeatDevice(const SeatDevice&) = delete;
    SeatDevice& operator=(const SeatDevice&) = delete;
    SeatDevice(SeatDevice&&) = delete;
    SeatDevice& operator=(SeatDevice&&) = delete;

    [[nodiscard]] auto fd() const -> int { return m_fd.get(); }
    [[nodiscard]] auto path() const -> const std::filesystem::path& { return m_path; }
    [[nodiscard]] auto devnum() const -> dev_t { return m_devnum; }

private:
    Session& m_session;
    int m_device_id;
    util::UniqueFd m_fd;
    std::filesystem::path m_path;
    dev_t m_devnum;
};

/// @brief libseat session: device access and VT ownership for the seat we run on.
///
/// `create` blocks until the seat is enabled. Afterwards the seat is driven from the reactor
/// through `dispatch`, which reports pause and activate transitions in order.
class Session {
public:
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;

    [[nodiscard]] static auto create() -> ResultPtr<Session>;

    [[nodiscard]] auto fd() const -> int;
    [[nodiscard]] auto dispatch(std::vector<SessionEvent>& out) -> Result<void>;

    [[nodiscard]] auto active() const -> bool;
    [[nodiscard]] auto seat_name() const -> std::string;

    [[nodiscard]] auto open_device(const std::filesystem::path& path)
        -> ResultPtr<SeatDevice>;
    [[nodiscard]] auto switch_vt(uint32_t vt) -> Result<void>;

private:
    friend class SeatDevice;

    struct Impl;
    Session();

    void close_device(int device_id);

    std::unique_ptr<Impl> m_impl;
};

/// @brief Reactor source for a session owned elsewhere.
class SessionNotifier {
public:
    using Event = SessionEvent;

    explicit SessionNotifier(Session& session) : m_session(&session) {}

    [[nodiscard]] auto fd() const -> int { return m_session->fd(); }
    [[nodiscard]] auto dispatch(std::vector<Event>& out) -> Result<void> {
        return m_session->dispatch(out);
    }

private:
    Session* m_session;
};

} // namespace kiln::session
