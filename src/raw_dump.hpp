#pragma once

#include "analysis.hpp"
#include <cstdint>

namespace dumpscope {

// Well-known stream types (MINIDUMP_STREAM_TYPE)
enum : uint32_t {
    md_thread_list_stream   = 3,
    md_module_list_stream   = 4,
    md_exception_stream     = 6,
    md_system_info_stream   = 7,
    md_thread_names_stream  = 24,
    md_last_reserved_stream = 0xffff
};

// Fixed record sizes as laid out on disk
inline constexpr uint32_t md_signature            = 0x504d444d; // "MDMP"
inline constexpr uint32_t md_header_size          = 32;
inline constexpr uint32_t md_directory_entry_size = 12;
inline constexpr uint32_t md_thread_size          = 48;
inline constexpr uint32_t md_module_size          = 108;
inline constexpr uint32_t md_thread_name_size     = 12;

// Processor architectures (MINIDUMP_SYSTEM_INFO)
enum : uint16_t {
    md_cpu_x86       = 0,
    md_cpu_arm       = 5,
    md_cpu_amd64     = 9,
    md_cpu_arm64     = 12,
    md_cpu_arm64_old = 0x8003
};

const char* stream_type_name(uint32_t stream_type);

// "Official", "Google", "Mozilla" or "Unknown"
const char* stream_vendor(uint32_t stream_type);

// Built-in analyzer: walks the header, the stream directory and the
// system info, exception, module list, thread list and thread names
// streams. Each thread gets its context frame, resolved through the
// symbol resolver.
// No unwinding beyond the context frame.
class raw_dump_analyzer : public analyzer {
public:
    process_state analyze(dump_source& dump, symbol_resolver& symbols,
                          analysis_context& ctx) override;
};

} // namespace dumpscope
