#pragma once

#include <deque>
#include <fcntl.h>
#include <output/display_device.hpp>
#include <string>
#include <sys/sysmacros.h>
#include <unistd.h>
#include <vector>

namespace kiln::test {

/// In-memory display device. Commits are recorded; completions are produced on demand.
class FakeDisplayDevice final : public output::DisplayDevice {
public:
    explicit FakeDisplayDevice(uint32_t slots = 3) {
        m_descriptor.name = "FAKE-1";
        m_descriptor.mode = {.width = 64, .height = 32, .refresh_mhz = 60000};
        m_descriptor.device = makedev(226, 0);
        m_buffers.resize(slots);
        for (auto& buffer : m_buffers) {
            buffer.width = 64;
            buffer.height = 32;
            buffer.stride = 64 * 4;
            buffer.drm_format = 0x34325258; // XR24
            buffer.handle = util::UniqueFd{::open("/dev/null", O_RDONLY | O_CLOEXEC)};
        }
    }

    [[nodiscard]] auto descriptor() const -> const output::OutputDescriptor& override {
        return m_descriptor;
    }
    [[nodiscard]] auto slot_count() const -> uint32_t override {
        return static_cast<uint32_t>(m_buffers.size());
    }
    [[nodiscard]] auto buffer(output::SlotId slot) const -> const util::ExternalImage& override {
        return m_buffers.at(slot);
    }

    [[nodiscard]] auto commit(output::SlotId slot, const output::DamageRegion& damage)
        -> Result<output::CommitId> override {
        if (reject_commits > 0) {
            --reject_commits;
            return make_error<output::CommitId>(ErrorCode::commit_rejected,
                                                "atomic commit: Invalid argument");
        }
        commits.push_back(slot);
        commit_ids.push_back(m_next_commit);
        last_damage = damage;
        return m_next_commit++;
    }

    void request_modeset() override { ++modesets; }

    [[nodiscard]] auto event_fd() const -> int override { return -1; }

    [[nodiscard]] auto read_completions(std::vector<output::CompletionEvent>& out)
        -> Result<void> override {
        out.insert(out.end(), pending_completions.begin(), pending_completions.end());
        pending_completions.clear();
        return {};
    }

    /// Completion for the @p index-th successful commit, as the kernel would deliver it.
    [[nodiscard]] auto completion_for(size_t index) const -> output::CompletionEvent {
        return output::CompletionEvent{.slot = commits.at(index),
                                       .commit = commit_ids.at(index),
                                       .sequence = static_cast<uint32_t>(index + 1)};
    }

    /// Completion for the most recent commit.
    [[nodiscard]] auto complete_last() const -> output::CompletionEvent {
        return completion_for(commits.size() - 1);
    }

    std::vector<output::SlotId> commits;
    std::vector<output::CommitId> commit_ids;
    output::DamageRegion last_damage;
    int reject_commits = 0;
    int modesets = 0;
    std::deque<output::CompletionEvent> pending_completions;

private:
    output::OutputDescriptor m_descriptor;
    std::vector<util::ExternalImage> m_buffers;
    output::CommitId m_next_commit = 1;
};

} // namespace kiln::test
