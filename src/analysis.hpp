#pragma once

#include "config.hpp"
#include "process_state.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace dumpscope {

// Coarse progress reported by an analyzer. Informational only.
enum class analysis_phase {
    reading_dump,
    raw_processing,
    symbolicating,
    done
};

const char* phase_name(analysis_phase p);

// Read-only, random-access bytes of a dump.
class dump_source {
public:
    virtual ~dump_source() = default;

    virtual uint64_t size() const = 0;

    // Copy up to len bytes at offset into out. Returns the number of bytes
    // copied, short only at end of data.
    virtual std::size_t read(uint64_t offset, void* out, std::size_t len) = 0;

    virtual const std::string& name() const = 0;
};

class file_dump_source : public dump_source {
public:
    // Throws dump_open_error when the file cannot be opened for reading.
    explicit file_dump_source(const std::filesystem::path& path);

    uint64_t size() const override { return m_size; }
    std::size_t read(uint64_t offset, void* out, std::size_t len) override;
    const std::string& name() const override { return m_name; }

private:
    std::string m_name;
    std::ifstream m_file;
    uint64_t m_size = 0;
};

// Given a module and an address inside it, find the function name.
class symbol_resolver {
public:
    virtual ~symbol_resolver() = default;
    virtual std::optional<std::string> lookup(const module_info& module, uint64_t address) = 0;
};

class null_symbol_resolver : public symbol_resolver {
public:
    std::optional<std::string> lookup(const module_info&, uint64_t) override {
        return std::nullopt;
    }
};

// Builds the resolver a task hands to its analyzer.
using resolver_factory =
    std::function<std::unique_ptr<symbol_resolver>(const symbol_config&)>;

// What an analyzer sees of the task running it.
class analysis_context {
public:
    virtual ~analysis_context() = default;

    // Task-local logger; wrap work in span_guard to tag its records.
    virtual const std::shared_ptr<spdlog::logger>& log() const = 0;

    // Cooperative cancellation flag. Analyzers check it between units of
    // work and throw cancelled_error to honour it.
    virtual bool cancelled() const = 0;

    virtual void set_phase(analysis_phase phase) = 0;

    // Best-known partial result, e.g. stacks before symbolication.
    virtual void report_partial(const process_state& partial) = 0;
};

// The stackwalk/symbolication collaborator.
class analyzer {
public:
    virtual ~analyzer() = default;

    // Throws analysis_error on malformed input, cancelled_error when it
    // stops early on request.
    virtual process_state analyze(dump_source& dump, symbol_resolver& symbols,
                                  analysis_context& ctx) = 0;
};

// Ask the resolver for frame's function. A resolver failure is logged and
// leaves the frame unresolved; it never aborts the analysis.
void symbolize_frame(stack_frame& frame, symbol_resolver& symbols,
                     const std::shared_ptr<spdlog::logger>& log);

} // namespace dumpscope
