#include "report.hpp"
#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/chrono.h>

namespace dumpscope {

namespace {

nlohmann::json module_json(const module_info& m, pointer_width width) {
    return {
        {"base", format_address(m.base, width)},
        {"end", format_address(m.base + m.size, width)},
        {"code_file", m.code_file}
    };
}

nlohmann::json result_json(const process_state& state) {
    auto width = state.system.width;

    nlohmann::json out;
    out["system"] = {
        {"cpu", state.system.cpu},
        {"os", state.system.os},
        {"cpu_count", state.system.cpu_count}
    };

    if (state.crash) {
        out["crash"] = {
            {"reason", state.crash->reason},
            {"address", format_address(state.crash->address, width)},
            {"thread_id", state.crash->thread_id}
        };
    } else {
        out["crash"] = nullptr;
    }

    if (state.requesting_thread) {
        out["requesting_thread"] = *state.requesting_thread;
    } else {
        out["requesting_thread"] = nullptr;
    }

    out["modules"] = nlohmann::json::array();
    for (const auto& m : state.modules) {
        out["modules"].push_back(module_json(m, width));
    }

    out["threads"] = nlohmann::json::array();
    for (const auto& t : state.threads) {
        nlohmann::json frames = nlohmann::json::array();
        for (const auto& f : t.frames) {
            nlohmann::json jf = {
                {"instruction", format_address(f.instruction, width)},
                {"trust", trust_name(f.trust)},
                {"signature", frame_signature(f, width)}
            };
            jf["module"] = f.module ? nlohmann::json(f.module->code_file) : nlohmann::json(nullptr);
            jf["function"] = f.function_name ? nlohmann::json(*f.function_name) : nlohmann::json(nullptr);
            frames.push_back(std::move(jf));
        }
        out["threads"].push_back({
            {"thread_id", t.thread_id},
            {"name", thread_name(t)},
            {"frames", std::move(frames)}
        });
    }
    return out;
}

} // anonymous namespace

std::string format_address(uint64_t addr, pointer_width width) {
    if (width == pointer_width::bits64) return fmt::format("0x{:016x}", addr);
    return fmt::format("0x{:08x}", addr);
}

std::string frame_signature(const stack_frame& frame, pointer_width width) {
    if (frame.function_name) return *frame.function_name;
    if (frame.module) {
        auto name = frame.module->code_file;
        auto slash = name.find_last_of("/\\");
        if (slash != std::string::npos) name = name.substr(slash + 1);
        return fmt::format("{} + {:#x}", name, frame.instruction - frame.module->base);
    }
    return format_address(frame.instruction, width);
}

std::string thread_name(const call_stack& stack) {
    if (stack.thread_name) return fmt::format("{} ({})", *stack.thread_name, stack.thread_id);
    return fmt::format("({})", stack.thread_id);
}

std::string render_stacks(const process_state& state) {
    auto width = state.system.width;
    std::string out;

    out += fmt::format("cpu: {} ({} processors)\nos: {}\n",
                       state.system.cpu.empty() ? "unknown" : state.system.cpu,
                       state.system.cpu_count,
                       state.system.os.empty() ? "unknown" : state.system.os);
    if (state.crash) {
        out += fmt::format("crash: {} at {}\n", state.crash->reason,
                           format_address(state.crash->address, width));
    }

    out += fmt::format("\nmodules ({}):\n", state.modules.size());
    for (const auto& m : state.modules) {
        out += fmt::format("    {} - {}  {}\n", format_address(m.base, width),
                           format_address(m.base + m.size, width), m.code_file);
    }

    for (std::size_t i = 0; i < state.threads.size(); ++i) {
        const auto& t = state.threads[i];
        bool crashed = state.requesting_thread && *state.requesting_thread == i;
        out += fmt::format("\nthread {} {}{}\n", i, thread_name(t), crashed ? " (crashed)" : "");
        if (t.frames.empty()) {
            out += "    <no frames>\n";
            continue;
        }
        for (std::size_t n = 0; n < t.frames.size(); ++n) {
            const auto& f = t.frames[n];
            out += fmt::format("    {:>2}  {}  {}  [{}]\n", n, format_address(f.instruction, width),
                               frame_signature(f, width), trust_name(f.trust));
        }
    }
    return out;
}

nlohmann::json to_json(const result_snapshot& snap, const filter_query& filter) {
    nlohmann::json out = {
        {"generation", snap.generation},
        {"sequence", snap.sequence},
        {"outcome", snap.outcome.name()},
        {"phase", phase_name(snap.phase)},
        {"event_count", snap.event_count}
    };

    if (snap.outcome.is_failed()) out["error"] = snap.outcome.error();

    out["result"] = snap.result ? result_json(*snap.result) : nlohmann::json(nullptr);

    nlohmann::json logs = nlohmann::json::array();
    if (snap.logs) {
        for (auto m : query(snap.logs, filter)) {
            auto level = spdlog::level::to_string_view(m.event.level);
            logs.push_back({
                {"level", std::string(level.data(), level.size())},
                {"path", m.path},
                {"message", m.event.message},
                {"time", fmt::format("{:%Y-%m-%dT%H:%M:%S}", m.event.time)}
            });
        }
    }
    out["logs"] = std::move(logs);
    return out;
}

} // namespace dumpscope
