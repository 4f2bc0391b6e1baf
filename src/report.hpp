#pragma once

#include "process_state.hpp"
#include "result_snapshot.hpp"
#include "span_log_tree.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>

namespace dumpscope {

// 0x%08x for 32-bit and unknown widths, 0x%016x for 64-bit.
std::string format_address(uint64_t addr, pointer_width width);

// Function name when resolved, else "module + 0xoffset", else the address.
std::string frame_signature(const stack_frame& frame, pointer_width width);

// "name (id)" or "(id)"
std::string thread_name(const call_stack& stack);

// Crash summary, modules and per-thread stacks as plain text.
std::string render_stacks(const process_state& state);

// Outcome, phase, result and the log events passing filter.
nlohmann::json to_json(const result_snapshot& snap, const filter_query& filter = {});

} // namespace dumpscope
