#pragma once

#include <filesystem>
#include <string>

#include "amod_platform.hpp"
#include "utils/logger_sinks/sink.hpp"

namespace asyncmodules::utils
{

// Append-only log file. Each record is written with a single write() call.
class FileSink : public Sink
{
  public:
    /**
     * @throws std::runtime_error if the file cannot be opened.
     */
    explicit FileSink(const std::string &path);

    ~FileSink() override;

    FileSink(const FileSink &) = delete;
    FileSink &operator=(const FileSink &) = delete;

    void write(const LogMessage &msg) override;

    void flush() override;

    std::string description() const override;

  private:
    std::filesystem::path m_path;
#if defined(ASYNCMODULES_PLATFORM_WIN64)
    void *m_file_handle{nullptr};
#else
    int m_fd{-1};
#endif
};

} // namespace asyncmodules::utils
