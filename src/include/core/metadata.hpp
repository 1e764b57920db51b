#pragma once
/**
 * @file metadata.hpp
 * @brief Provenance attached to every dispatched call and event.
 */
#include <string>

namespace asyncmodules::core
{

/**
 * @struct Metadata
 * @brief Identifies the originator of a call or event.
 *
 * `source_obj` is an opaque identity (the address of the originating Module or
 * ModuleManager). It is compared, never dereferenced: broadcasts skip the module
 * whose address equals it (split horizon).
 */
struct Metadata
{
    const void *source_obj{nullptr};
    std::string source_name;

    [[nodiscard]] bool is_from(const void *obj) const noexcept
    {
        return source_obj != nullptr && source_obj == obj;
    }
};

} // namespace asyncmodules::core
