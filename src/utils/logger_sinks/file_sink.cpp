#include "amod_base.hpp"
#include "utils/logger_sinks/file_sink.hpp"

#include <stdexcept>
#include <system_error>

#if defined(ASYNCMODULES_PLATFORM_WIN64)
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace asyncmodules::utils
{

FileSink::FileSink(const std::string &path) : m_path(path)
{
#if defined(ASYNCMODULES_PLATFORM_WIN64)
    HANDLE h = CreateFileW(m_path.wstring().c_str(), FILE_APPEND_DATA,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                           OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    if (h == INVALID_HANDLE_VALUE)
    {
        throw std::runtime_error(fmt::format("Failed to open log file '{}': error {}", path,
                                             static_cast<unsigned long>(GetLastError())));
    }
    m_file_handle = h;
#else
    m_fd = ::open(m_path.c_str(), O_WRONLY | O_APPEND | O_CREAT, 0644);
    if (m_fd == -1)
    {
        const std::error_code ec(errno, std::generic_category());
        throw std::runtime_error(
            fmt::format("Failed to open log file '{}': {}", path, ec.message()));
    }
#endif
}

FileSink::~FileSink()
{
#if defined(ASYNCMODULES_PLATFORM_WIN64)
    if (m_file_handle != nullptr)
    {
        CloseHandle(static_cast<HANDLE>(m_file_handle));
    }
#else
    if (m_fd != -1)
    {
        ::close(m_fd);
    }
#endif
}

void FileSink::write(const LogMessage &msg)
{
    const std::string content = format_logmsg(msg);
#if defined(ASYNCMODULES_PLATFORM_WIN64)
    DWORD bytes_written = 0;
    if (!WriteFile(static_cast<HANDLE>(m_file_handle), content.c_str(),
                   static_cast<DWORD>(content.length()), &bytes_written, nullptr) ||
        bytes_written != content.length())
    {
        throw std::system_error(static_cast<int>(GetLastError()), std::system_category(),
                                "Failed to write complete log message to file");
    }
#else
    const ssize_t bytes_written = ::write(m_fd, content.c_str(), content.length());
    const int saved_errno = errno;
    if (bytes_written < 0 || static_cast<size_t>(bytes_written) != content.length())
    {
        throw std::system_error(saved_errno, std::generic_category(),
                                "Failed to write complete log message to file");
    }
#endif
}

void FileSink::flush()
{
#if defined(ASYNCMODULES_PLATFORM_WIN64)
    FlushFileBuffers(static_cast<HANDLE>(m_file_handle));
#else
    ::fsync(m_fd);
#endif
}

std::string FileSink::description() const
{
    return "File: " + m_path.string();
}

} // namespace asyncmodules::utils
