#pragma once
/**
 * @file failure_sink.hpp
 * @brief Append-only report file for failed tasks.
 */
#include "asyncmodules_export.h"

#include <filesystem>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace asyncmodules::core
{

class Task;

/**
 * @class FailureSink
 * @brief Appends one report per failed task to a text file.
 *
 * Report layout:
 * @code
 * 2026-03-01 12:00:00.123456
 * Task [sensor.read] failed: device not found
 * Stack trace where the failure was caught (most recent call first):
 *   #00  ...
 *
 * @endcode
 * The file is opened and closed for every report so external rotation is harmless.
 */
class ASYNCMODULES_EXPORT FailureSink
{
  public:
    explicit FailureSink(std::filesystem::path path);

    /**
     * @brief Appends the report for @p task.
     * @return false (after logging an error) if the file could not be written.
     */
    bool append(const Task &task) const;

    [[nodiscard]] const std::filesystem::path &path() const noexcept { return path_; }

  private:
    std::filesystem::path path_;
};

} // namespace asyncmodules::core

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
