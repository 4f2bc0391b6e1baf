#include "analysis.hpp"
#include "errors.hpp"
#include <system_error>

namespace dumpscope {

const char* phase_name(analysis_phase p) {
    switch (p) {
        case analysis_phase::reading_dump:   return "reading dump";
        case analysis_phase::raw_processing: return "processing";
        case analysis_phase::symbolicating:  return "symbolicating";
        case analysis_phase::done:           return "done";
    }
    return "unknown";
}

const char* trust_name(frame_trust t) {
    switch (t) {
        case frame_trust::none:          return "none";
        case frame_trust::scan:          return "scan";
        case frame_trust::frame_pointer: return "frame_pointer";
        case frame_trust::cfi:           return "cfi";
        case frame_trust::context:       return "context";
    }
    return "unknown";
}

file_dump_source::file_dump_source(const std::filesystem::path& path)
    : m_name(path.string())
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        throw dump_open_error("not a readable file: " + m_name);
    }

    m_file.open(path, std::ios::binary);
    if (!m_file) {
        throw dump_open_error("cannot open dump: " + m_name);
    }

    m_size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw dump_open_error("cannot stat dump '" + m_name + "': " + ec.message());
    }
}

std::size_t file_dump_source::read(uint64_t offset, void* out, std::size_t len) {
    if (offset >= m_size) return 0;
    if (len > m_size - offset) len = static_cast<std::size_t>(m_size - offset);

    m_file.clear();
    m_file.seekg(static_cast<std::streamoff>(offset));
    m_file.read(static_cast<char*>(out), static_cast<std::streamsize>(len));
    return static_cast<std::size_t>(m_file.gcount());
}

void symbolize_frame(stack_frame& frame, symbol_resolver& symbols,
                     const std::shared_ptr<spdlog::logger>& log) {
    if (!frame.module) {
        log->debug("no module for address {:#x}", frame.instruction);
        return;
    }

    try {
        auto name = symbols.lookup(*frame.module, frame.instruction);
        if (name) {
            frame.function_name = std::move(*name);
            log->trace("resolved {:#x} to {}", frame.instruction, *frame.function_name);
        } else {
            log->debug("no symbol for {:#x} in {}", frame.instruction, frame.module->code_file);
        }
    } catch (const std::exception& e) {
        log->warn("symbol lookup failed for {:#x} in {}: {}",
                  frame.instruction, frame.module->code_file, e.what());
    }
}

} // namespace dumpscope
