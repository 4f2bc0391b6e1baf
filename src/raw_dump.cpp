#include "raw_dump.hpp"
#include "errors.hpp"
#include "span_scope.hpp"
#include <spdlog/fmt/fmt.h>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dumpscope {

namespace {

struct stream_entry {
    uint32_t index = 0;
    uint32_t type = 0;
    uint32_t size = 0;
    uint32_t rva = 0;
};

// Instruction pointer offsets within the raw CONTEXT records
constexpr uint32_t amd64_rip_offset = 0xf8;
constexpr uint32_t x86_eip_offset   = 0xb8;

// MINIDUMP_STRING lengths beyond this are treated as garbage
constexpr uint32_t max_string_bytes = 64 * 1024;

// Little-endian record reads that turn short reads into analysis errors.
class record_reader {
public:
    explicit record_reader(dump_source& src) : m_src(src) {}

    uint64_t size() const { return m_src.size(); }

    uint16_t u16(uint64_t off, const char* what) { return static_cast<uint16_t>(read(off, 2, what)); }
    uint32_t u32(uint64_t off, const char* what) { return static_cast<uint32_t>(read(off, 4, what)); }
    uint64_t u64(uint64_t off, const char* what) { return read(off, 8, what); }
    uint8_t  u8(uint64_t off, const char* what)  { return static_cast<uint8_t>(read(off, 1, what)); }

    bool in_bounds(uint64_t off, uint64_t len) const {
        return off <= m_src.size() && len <= m_src.size() - off;
    }

    void require(uint64_t off, uint64_t len, const std::string& what) const {
        if (!in_bounds(off, len)) {
            throw analysis_error(fmt::format(
                "truncated dump: {} at {:#x} ({} bytes) extends past end of file ({} bytes)",
                what, off, len, m_src.size()));
        }
    }

    // UTF-16LE MINIDUMP_STRING at rva, converted to UTF-8.
    std::optional<std::string> string_at(uint64_t rva) {
        if (!in_bounds(rva, 4)) return std::nullopt;
        uint32_t bytes = u32(rva, "string length");
        if (bytes > max_string_bytes || bytes % 2 != 0 || !in_bounds(rva + 4, bytes)) {
            return std::nullopt;
        }

        std::vector<unsigned char> raw(bytes);
        if (m_src.read(rva + 4, raw.data(), raw.size()) != raw.size()) return std::nullopt;

        std::string out;
        out.reserve(bytes / 2);
        for (std::size_t i = 0; i + 1 < raw.size(); i += 2) {
            uint32_t cp = raw[i] | (uint32_t(raw[i + 1]) << 8);
            if (cp >= 0xd800 && cp < 0xdc00 && i + 3 < raw.size()) {
                uint32_t lo = raw[i + 2] | (uint32_t(raw[i + 3]) << 8);
                if (lo >= 0xdc00 && lo < 0xe000) {
                    cp = 0x10000 + ((cp - 0xd800) << 10) + (lo - 0xdc00);
                    i += 2;
                }
            }
            append_utf8(out, cp);
        }
        return out;
    }

private:
    uint64_t read(uint64_t off, std::size_t width, const char* what) {
        unsigned char buf[8] = {};
        if (m_src.read(off, buf, width) != width) {
            throw analysis_error(fmt::format(
                "truncated dump: cannot read {} at offset {:#x}", what, off));
        }
        uint64_t v = 0;
        for (std::size_t i = 0; i < width; ++i) {
            v |= uint64_t(buf[i]) << (8 * i);
        }
        return v;
    }

    static void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xc0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3f));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xe0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
            out += static_cast<char>(0x80 | (cp & 0x3f));
        } else {
            out += static_cast<char>(0xf0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
            out += static_cast<char>(0x80 | (cp & 0x3f));
        }
    }

    dump_source& m_src;
};

const char* cpu_name(uint16_t arch) {
    switch (arch) {
        case md_cpu_x86:       return "x86";
        case md_cpu_arm:       return "arm";
        case md_cpu_amd64:     return "amd64";
        case md_cpu_arm64:
        case md_cpu_arm64_old: return "arm64";
    }
    return "unknown";
}

pointer_width cpu_width(uint16_t arch) {
    switch (arch) {
        case md_cpu_x86:
        case md_cpu_arm:       return pointer_width::bits32;
        case md_cpu_amd64:
        case md_cpu_arm64:
        case md_cpu_arm64_old: return pointer_width::bits64;
    }
    return pointer_width::unknown;
}

const char* os_name(uint32_t platform_id) {
    switch (platform_id) {
        case 0:      return "Windows 3.1";
        case 1:      return "Windows 9x";
        case 2:      return "Windows NT";
        case 0x8000: return "Unix";
        case 0x8101: return "Mac OS X";
        case 0x8102: return "iOS";
        case 0x8201: return "Linux";
        case 0x8202: return "Solaris";
        case 0x8203: return "Android";
        case 0x8205: return "NaCl";
        case 0x8206: return "Fuchsia";
    }
    return "unknown";
}

std::string crash_reason(uint32_t code, const std::string& os) {
    if (os.rfind("Windows", 0) == 0) {
        switch (code) {
            case 0xc0000005: return "EXCEPTION_ACCESS_VIOLATION";
            case 0xc000001d: return "EXCEPTION_ILLEGAL_INSTRUCTION";
            case 0xc0000094: return "EXCEPTION_INT_DIVIDE_BY_ZERO";
            case 0xc00000fd: return "EXCEPTION_STACK_OVERFLOW";
            case 0x80000003: return "EXCEPTION_BREAKPOINT";
        }
    } else {
        switch (code) {
            case 4:  return "SIGILL";
            case 5:  return "SIGTRAP";
            case 6:  return "SIGABRT";
            case 7:  return "SIGBUS";
            case 8:  return "SIGFPE";
            case 11: return "SIGSEGV";
        }
    }
    return fmt::format("{:#010x}", code);
}

std::optional<stream_entry> find_stream(const std::vector<stream_entry>& streams, uint32_t type) {
    for (const auto& s : streams) {
        if (s.type == type) return s;
    }
    return std::nullopt;
}

void read_system_info(record_reader& rd, const stream_entry& s, process_state& state,
                      const std::shared_ptr<spdlog::logger>& log) {
    span_guard span("system info");
    rd.require(s.rva, 24, "system info stream");

    uint16_t arch = rd.u16(s.rva, "processor architecture");
    state.system.cpu = cpu_name(arch);
    state.system.width = cpu_width(arch);
    state.system.cpu_count = rd.u8(uint64_t(s.rva) + 6, "processor count");
    state.system.os = os_name(rd.u32(uint64_t(s.rva) + 20, "platform id"));

    log->info("cpu {} ({} processors), os {}", state.system.cpu,
              state.system.cpu_count, state.system.os);
}

void read_exception(record_reader& rd, const stream_entry& s, process_state& state,
                    const std::shared_ptr<spdlog::logger>& log) {
    span_guard span("exception");
    rd.require(s.rva, 32, "exception stream");

    crash_info crash;
    crash.thread_id = rd.u32(s.rva, "exception thread id");
    uint32_t code = rd.u32(uint64_t(s.rva) + 8, "exception code");
    crash.address = rd.u64(uint64_t(s.rva) + 24, "exception address");
    crash.reason = crash_reason(code, state.system.os);

    log->info("crash {} at {:#x} on thread {}", crash.reason, crash.address, crash.thread_id);
    state.crash = std::move(crash);
}

void read_modules(record_reader& rd, const stream_entry& s, process_state& state,
                  const std::shared_ptr<spdlog::logger>& log) {
    span_guard span("modules");
    uint32_t count = rd.u32(s.rva, "module count");
    rd.require(uint64_t(s.rva) + 4, uint64_t(count) * md_module_size, "module list");

    state.modules.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        uint64_t off = uint64_t(s.rva) + 4 + uint64_t(i) * md_module_size;

        module_info m;
        m.base = rd.u64(off, "module base");
        m.size = rd.u32(off + 8, "module size");
        uint32_t name_rva = rd.u32(off + 20, "module name rva");

        if (auto name = rd.string_at(name_rva)) {
            m.code_file = std::move(*name);
        } else {
            log->warn("module {}: unreadable name at {:#x}", i, name_rva);
            m.code_file = "<unknown>";
        }

        log->debug("module {}: {} {:#x}-{:#x}", i, m.code_file, m.base, m.base + m.size);
        state.modules.push_back(std::move(m));
    }
    log->info("{} modules", state.modules.size());
}

struct raw_thread {
    uint32_t thread_id = 0;
    uint32_t context_size = 0;
    uint32_t context_rva = 0;
};

std::vector<raw_thread> read_threads(record_reader& rd, const stream_entry& s,
                                     const std::shared_ptr<spdlog::logger>& log) {
    span_guard span("threads");
    uint32_t count = rd.u32(s.rva, "thread count");
    rd.require(uint64_t(s.rva) + 4, uint64_t(count) * md_thread_size, "thread list");

    std::vector<raw_thread> threads;
    threads.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        uint64_t off = uint64_t(s.rva) + 4 + uint64_t(i) * md_thread_size;
        raw_thread t;
        t.thread_id = rd.u32(off, "thread id");
        t.context_size = rd.u32(off + 40, "thread context size");
        t.context_rva = rd.u32(off + 44, "thread context rva");
        threads.push_back(t);
    }
    log->info("{} threads", threads.size());
    return threads;
}

// MINIDUMP_THREAD_NAME_LIST: thread id and a 64-bit rva of its name.
// Damage here costs the names only, never the analysis.
std::unordered_map<uint32_t, std::string> read_thread_names(record_reader& rd, const stream_entry& s,
                                                            const std::shared_ptr<spdlog::logger>& log) {
    span_guard span("thread names");
    std::unordered_map<uint32_t, std::string> names;

    if (s.size < 4) {
        log->warn("thread names stream too short ({} bytes)", s.size);
        return names;
    }
    uint32_t count = rd.u32(s.rva, "thread name count");
    if (uint64_t(count) * md_thread_name_size > s.size - 4) {
        log->warn("thread names stream claims {} entries in {} bytes; ignoring it", count, s.size);
        return names;
    }

    for (uint32_t i = 0; i < count; ++i) {
        uint64_t off = uint64_t(s.rva) + 4 + uint64_t(i) * md_thread_name_size;
        uint32_t thread_id = rd.u32(off, "thread name id");
        uint64_t name_rva = rd.u64(off + 4, "thread name rva");

        auto name = rd.string_at(name_rva);
        if (!name) {
            log->warn("thread {}: unreadable name at {:#x}", thread_id, name_rva);
            continue;
        }
        log->debug("thread {} is '{}'", thread_id, *name);
        names[thread_id] = std::move(*name);
    }
    log->info("{} thread names", names.size());
    return names;
}

std::optional<uint64_t> context_ip(record_reader& rd, const raw_thread& t, const system_info& sys,
                                   const std::shared_ptr<spdlog::logger>& log) {
    if (!rd.in_bounds(t.context_rva, t.context_size)) {
        log->warn("thread context at {:#x} ({} bytes) is out of bounds", t.context_rva, t.context_size);
        return std::nullopt;
    }

    if (sys.cpu == "amd64" && t.context_size >= amd64_rip_offset + 8) {
        return rd.u64(uint64_t(t.context_rva) + amd64_rip_offset, "rip");
    }
    if (sys.cpu == "x86" && t.context_size >= x86_eip_offset + 4) {
        return rd.u32(uint64_t(t.context_rva) + x86_eip_offset, "eip");
    }

    log->info("no context reader for cpu '{}' ({} byte context)", sys.cpu, t.context_size);
    return std::nullopt;
}

} // anonymous namespace

const char* stream_type_name(uint32_t stream_type) {
    switch (stream_type) {
        case 0:          return "UnusedStream";
        case 3:          return "ThreadListStream";
        case 4:          return "ModuleListStream";
        case 5:          return "MemoryListStream";
        case 6:          return "ExceptionStream";
        case 7:          return "SystemInfoStream";
        case 8:          return "ThreadExListStream";
        case 9:          return "Memory64ListStream";
        case 10:         return "CommentStreamA";
        case 11:         return "CommentStreamW";
        case 12:         return "HandleDataStream";
        case 13:         return "FunctionTableStream";
        case 14:         return "UnloadedModuleListStream";
        case 15:         return "MiscInfoStream";
        case 16:         return "MemoryInfoListStream";
        case 17:         return "ThreadInfoListStream";
        case 18:         return "HandleOperationListStream";
        case 19:         return "TokenStream";
        case 24:         return "ThreadNamesStream";
        case 0x47670001: return "BreakpadInfoStream";
        case 0x47670002: return "AssertionInfoStream";
        case 0x47670003: return "LinuxCpuInfo";
        case 0x47670004: return "LinuxProcStatus";
        case 0x47670005: return "LinuxLsbRelease";
        case 0x47670006: return "LinuxCmdLine";
        case 0x47670007: return "LinuxEnviron";
        case 0x47670008: return "LinuxAuxv";
        case 0x47670009: return "LinuxMaps";
        case 0x4767000a: return "LinuxDsoDebug";
    }
    return "Unknown";
}

const char* stream_vendor(uint32_t stream_type) {
    if (stream_type <= md_last_reserved_stream) return "Official";
    switch (stream_type & 0xffff0000) {
        case 0x47670000: return "Google";
        case 0x4d7a0000: return "Mozilla";
    }
    return "Unknown";
}

process_state raw_dump_analyzer::analyze(dump_source& dump, symbol_resolver& symbols,
                                         analysis_context& ctx) {
    const auto& log = ctx.log();
    record_reader rd(dump);
    process_state state;

    ctx.set_phase(analysis_phase::reading_dump);

    uint32_t stream_count = 0;
    uint32_t directory_rva = 0;
    {
        span_guard span("header");
        if (rd.u32(0, "header signature") != md_signature) {
            throw analysis_error("not a minidump: bad signature");
        }
        rd.require(0, md_header_size, "header");

        uint32_t version = rd.u32(4, "header version");
        stream_count = rd.u32(8, "stream count");
        directory_rva = rd.u32(12, "stream directory rva");
        log->info("minidump version {:#x}, {} streams, directory at {:#x}",
                  version & 0xffff, stream_count, directory_rva);
    }

    rd.require(directory_rva, uint64_t(stream_count) * md_directory_entry_size, "stream directory");

    ctx.set_phase(analysis_phase::raw_processing);

    std::vector<stream_entry> streams;
    streams.reserve(stream_count);
    for (uint32_t i = 0; i < stream_count; ++i) {
        if (ctx.cancelled()) throw cancelled_error();

        span_guard span(fmt::format("stream {}", i));
        uint64_t off = uint64_t(directory_rva) + uint64_t(i) * md_directory_entry_size;

        stream_entry s;
        s.index = i;
        s.type = rd.u32(off, "stream type");
        s.size = rd.u32(off + 4, "stream size");
        s.rva = rd.u32(off + 8, "stream rva");

        log->debug("{} ({:#x}, {}): {} bytes at {:#x}", stream_type_name(s.type), s.type,
                   stream_vendor(s.type), s.size, s.rva);

        if (!rd.in_bounds(s.rva, s.size)) {
            log->warn("{} extends past end of file; ignoring it", stream_type_name(s.type));
            continue;
        }
        streams.push_back(s);
    }

    if (auto s = find_stream(streams, md_system_info_stream)) {
        read_system_info(rd, *s, state, log);
    } else {
        log->warn("no system info stream");
    }

    if (auto s = find_stream(streams, md_exception_stream)) {
        read_exception(rd, *s, state, log);
    }

    if (auto s = find_stream(streams, md_module_list_stream)) {
        read_modules(rd, *s, state, log);
    } else {
        log->warn("no module list stream; frames will not be symbolized");
    }

    auto thread_stream = find_stream(streams, md_thread_list_stream);
    if (!thread_stream) {
        throw analysis_error("missing thread list stream");
    }
    auto threads = read_threads(rd, *thread_stream, log);

    std::unordered_map<uint32_t, std::string> names;
    if (auto s = find_stream(streams, md_thread_names_stream)) {
        names = read_thread_names(rd, *s, log);
    }

    state.threads.resize(threads.size());
    for (std::size_t i = 0; i < threads.size(); ++i) {
        state.threads[i].thread_id = threads[i].thread_id;
        if (auto it = names.find(threads[i].thread_id); it != names.end()) {
            state.threads[i].thread_name = it->second;
        }
        if (state.crash && state.crash->thread_id == threads[i].thread_id) {
            state.requesting_thread = i;
        }
    }
    ctx.report_partial(state);

    ctx.set_phase(analysis_phase::symbolicating);

    for (std::size_t i = 0; i < threads.size(); ++i) {
        if (ctx.cancelled()) throw cancelled_error();

        span_guard thread_span(fmt::format("thread {}", i));
        log->info("walking thread {} (id {})", i, threads[i].thread_id);

        auto ip = context_ip(rd, threads[i], state.system, log);
        if (!ip) continue;

        span_guard frame_span("frame 0");
        stack_frame frame;
        frame.instruction = *ip;
        frame.trust = frame_trust::context;
        if (auto* m = state.module_at(*ip)) frame.module = *m;

        log->debug("context frame at {:#x}", *ip);
        symbolize_frame(frame, symbols, log);
        state.threads[i].frames.push_back(std::move(frame));
    }

    ctx.set_phase(analysis_phase::done);
    log->info("processed {} threads, {} modules", state.threads.size(), state.modules.size());
    return state;
}

} // namespace dumpscope
