#pragma once

#include "analysis.hpp"
#include "process_state.hpp"
#include "span_log_tree.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>

namespace dumpscope {

// Where an analysis task stands. Terminal once it leaves running.
struct analysis_outcome {
    struct running {
        std::chrono::milliseconds elapsed{0};
    };
    struct succeeded {
        std::shared_ptr<const process_state> result;
    };
    struct failed {
        std::string error;
    };
    struct cancelled {};

    std::variant<running, succeeded, failed, cancelled> value{running{}};

    bool terminal() const { return !std::holds_alternative<running>(value); }
    bool is_running() const { return std::holds_alternative<running>(value); }
    bool is_succeeded() const { return std::holds_alternative<succeeded>(value); }
    bool is_failed() const { return std::holds_alternative<failed>(value); }
    bool is_cancelled() const { return std::holds_alternative<cancelled>(value); }

    // Empty unless failed.
    std::string error() const {
        if (auto* f = std::get_if<failed>(&value)) return f->error;
        return {};
    }

    const char* name() const {
        switch (value.index()) {
            case 0:  return "running";
            case 1:  return "succeeded";
            case 2:  return "failed";
            default: return "cancelled";
        }
    }
};

// Immutable view of the best known state of one analysis. Shared with the
// presentation layer via shared_ptr<const result_snapshot>; never modified
// after publication.
struct result_snapshot {
    uint64_t generation = 0;
    uint64_t sequence = 0;

    analysis_outcome outcome;
    analysis_phase phase = analysis_phase::reading_dump;

    // Frozen log tree root. Never null.
    std::shared_ptr<const span_node> logs;
    std::size_t event_count = 0;

    // Partial result while running, the final one once succeeded.
    std::shared_ptr<const process_state> result;
};

} // namespace dumpscope
