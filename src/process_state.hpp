#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dumpscope {

enum class pointer_width {
    unknown,
    bits32,
    bits64
};

// How a frame's instruction address was recovered.
enum class frame_trust {
    none,
    scan,
    frame_pointer,
    cfi,
    context
};

const char* trust_name(frame_trust t);

struct module_info {
    uint64_t base = 0;
    uint64_t size = 0;
    std::string code_file;

    bool contains(uint64_t addr) const {
        return addr >= base && addr - base < size;
    }
};

struct stack_frame {
    uint64_t instruction = 0;
    frame_trust trust = frame_trust::none;
    std::optional<module_info> module;

    // Unset when the resolver had nothing for this address.
    std::optional<std::string> function_name;
};

struct call_stack {
    uint32_t thread_id = 0;
    std::optional<std::string> thread_name;
    std::vector<stack_frame> frames;
};

struct system_info {
    std::string cpu;
    std::string os;
    pointer_width width = pointer_width::unknown;
    uint32_t cpu_count = 0;
};

struct crash_info {
    std::string reason;
    uint64_t address = 0;
    uint32_t thread_id = 0;
};

// Result of one analysis pass, partial or complete.
struct process_state {
    system_info system;
    std::optional<crash_info> crash;
    std::optional<std::size_t> requesting_thread;
    std::vector<module_info> modules;
    std::vector<call_stack> threads;

    // Module whose range contains addr, or nullptr.
    const module_info* module_at(uint64_t addr) const {
        for (const auto& m : modules) {
            if (m.contains(addr)) return &m;
        }
        return nullptr;
    }
};

} // namespace dumpscope
