/**
 * @file debug_info.cpp
 * @brief Cross-platform stack trace capture for asyncmodules::debug.
 *
 * Macro assumptions:
 * - ASYNCMODULES_PLATFORM_WIN64 : defined when building for Windows x64
 * - ASYNCMODULES_IS_POSIX       : defined for POSIX-like platforms (Linux, macOS, FreeBSD)
 *
 * Only in-process symbolization is performed (dladdr/DbgHelp). The trace is captured
 * into a string because failed task bodies store it alongside their exception and
 * write it to the failure sink later.
 */
#include "amod_base.hpp"

#if defined(ASYNCMODULES_PLATFORM_WIN64)

#include <dbghelp.h>
#include <memory>
#pragma comment(lib, "dbghelp.lib")

#elif defined(ASYNCMODULES_IS_POSIX)

#include <cxxabi.h>   // __cxa_demangle
#include <dlfcn.h>    // dladdr
#include <execinfo.h> // backtrace

#endif

#include <cstring>
#include <iterator>

namespace asyncmodules::debug
{

#if defined(ASYNCMODULES_PLATFORM_WIN64)
namespace
{
class DbgHelpInitializer
{
  public:
    DbgHelpInitializer()
    {
        HANDLE process = GetCurrentProcess();
        SymSetOptions(SYMOPT_LOAD_LINES | SYMOPT_DEFERRED_LOADS | SYMOPT_UNDNAME);
        (void)SymInitialize(process, nullptr, TRUE);
    }

    ~DbgHelpInitializer() { SymCleanup(GetCurrentProcess()); }
};

DbgHelpInitializer g_dbghelp_initializer;

} // namespace
#endif

std::string format_stack_trace(int skip_frames) noexcept
{
    try
    {
        fmt::memory_buffer out;
        // Skip this function's own frame.
        const int first = 1 + (skip_frames > 0 ? skip_frames : 0);

#if defined(ASYNCMODULES_PLATFORM_WIN64)
        constexpr int kMaxFrames = 62;
        void *frames[kMaxFrames] = {nullptr};
        USHORT captured = CaptureStackBackTrace(0, kMaxFrames, frames, nullptr);
        HANDLE process = GetCurrentProcess();

        constexpr size_t kNameBuf = 1024;
        const size_t symbol_size = sizeof(SYMBOL_INFO) + kNameBuf;
        std::unique_ptr<uint8_t[]> area(new (std::nothrow) uint8_t[symbol_size]);
        SYMBOL_INFO *symbol = nullptr;
        if (area)
        {
            symbol = reinterpret_cast<SYMBOL_INFO *>(area.get());
            std::memset(symbol, 0, sizeof(SYMBOL_INFO));
            symbol->SizeOfStruct = sizeof(SYMBOL_INFO);
            symbol->MaxNameLen = static_cast<ULONG>(kNameBuf - 1);
        }

        for (int i = first; i < static_cast<int>(captured); ++i)
        {
            const auto addr = reinterpret_cast<uintptr_t>(frames[i]);
            DWORD64 displacement = 0;
            if (symbol && SymFromAddr(process, static_cast<DWORD64>(addr), &displacement, symbol))
            {
                fmt::format_to(std::back_inserter(out), "  #{:02}  {}+{:#x}\n", i - first,
                               symbol->Name, static_cast<unsigned long long>(displacement));
            }
            else
            {
                fmt::format_to(std::back_inserter(out), "  #{:02}  {:#018x}\n", i - first,
                               static_cast<unsigned long long>(addr));
            }
        }
#elif defined(ASYNCMODULES_IS_POSIX)
        constexpr int kMaxFrames = 128;
        void *callstack[kMaxFrames];
        const int nframes = backtrace(callstack, kMaxFrames);
        if (nframes <= first)
        {
            return "  [No stack frames available]\n";
        }

        for (int i = first; i < nframes; ++i)
        {
            const auto addr = reinterpret_cast<uintptr_t>(callstack[i]);
            std::string name;
            std::string module = "??";
            uintptr_t offset = 0;

            Dl_info dlinfo;
            if (dladdr(callstack[i], &dlinfo))
            {
                if (dlinfo.dli_sname)
                {
                    int status = 0;
                    char *dem = abi::__cxa_demangle(dlinfo.dli_sname, nullptr, nullptr, &status);
                    if (status == 0 && dem)
                    {
                        name = dem;
                    }
                    else
                    {
                        name = dlinfo.dli_sname;
                    }
                    std::free(dem);
                    offset = addr - reinterpret_cast<uintptr_t>(dlinfo.dli_saddr);
                }
                else if (dlinfo.dli_fbase)
                {
                    offset = addr - reinterpret_cast<uintptr_t>(dlinfo.dli_fbase);
                }
                if (dlinfo.dli_fname)
                {
                    module = std::string(format_tools::filename_only(dlinfo.dli_fname));
                }
            }

            if (name.empty())
            {
                fmt::format_to(std::back_inserter(out), "  #{:02}  ?? +{:#x}  ({})\n", i - first,
                               static_cast<unsigned long long>(offset), module);
            }
            else
            {
                fmt::format_to(std::back_inserter(out), "  #{:02}  {}+{:#x}  ({})\n", i - first,
                               name, static_cast<unsigned long long>(offset), module);
            }
        }
#else
        (void)first;
        fmt::format_to(std::back_inserter(out), "  [Stack trace not supported on this platform]\n");
#endif
        return fmt::to_string(out);
    }
    catch (const std::exception &e)
    {
        try
        {
            return fmt::format("  [Stack trace capture failed: {}]\n", e.what());
        }
        catch (const std::exception &)
        {
            return {};
        }
    }
}

void print_stack_trace() noexcept
{
    const std::string trace = format_stack_trace(1);
    std::fputs("Stack Trace (most recent call first):\n", stderr);
    std::fputs(trace.c_str(), stderr);
    std::fflush(stderr);
}

} // namespace asyncmodules::debug
