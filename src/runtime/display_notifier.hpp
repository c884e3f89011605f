#pragma once

#include <output/display_device.hpp>
#include <util/error.hpp>
#include <vector>

namespace kiln::runtime {

/// @brief Presentation completions of a display device. The device must outlive the source.
class DisplayNotifier {
public:
    using Event = output::CompletionEvent;

    explicit DisplayNotifier(output::DisplayDevice& device) : m_device(&device) {}

    [[nodiscard]] auto fd() const -> int { return m_device->event_fd(); }

    [[nodiscard]] auto dispatch(std::vector<Event>& out) -> Result<void> {
        return m_device->read_completions(out);
    }

private:
    output::DisplayDevice* m_device;
};

} // namespace kiln::runtime
