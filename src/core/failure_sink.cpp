#include "amod_core.hpp"

#include <fstream>

namespace asyncmodules::core
{

FailureSink::FailureSink(std::filesystem::path path) : path_(std::move(path)) {}

bool FailureSink::append(const Task &task) const
{
    std::ofstream out(path_, std::ios::out | std::ios::app);
    if (!out)
    {
        LOGGER_ERROR("Could not open exception file '{}' to record failure of task [{}]",
                     path_.string(), task.description());
        return false;
    }
    out << format_tools::formatted_time(std::chrono::system_clock::now()) << '\n';
    out << fmt::format("Task [{}] failed: {}\n", task.description(), task.failure_message());
    out << "Stack trace where the failure was caught (most recent call first):\n";
    out << task.failure_trace();
    if (!task.failure_trace().empty() && task.failure_trace().back() != '\n')
    {
        out << '\n';
    }
    out << '\n';
    out.flush();
    if (!out)
    {
        LOGGER_ERROR("Writing exception file '{}' failed for task [{}]", path_.string(),
                     task.description());
        return false;
    }
    return true;
}

} // namespace asyncmodules::core
