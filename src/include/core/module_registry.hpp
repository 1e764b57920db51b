#pragma once
/**
 * @file module_registry.hpp
 * @brief Ordered name -> module map owned by the ModuleManager.
 */
#include "asyncmodules_export.h"
#include "core/module.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#if defined(_MSC_VER)
#pragma warning(push)
#pragma warning(disable : 4251)
#endif

namespace asyncmodules::core
{

using ModuleFactory = std::function<ModulePtr(const std::string &, const FunctionReferences &)>;

/**
 * @class ModuleRegistry
 * @brief Registration-ordered collection of modules, unique by name.
 *
 * Re-registering a name replaces the module in place, keeping the position of the
 * first registration. Modules are held by shared_ptr, so a task still running
 * against a replaced module keeps it alive. Not thread-safe; used on the scheduler
 * thread only.
 */
class ASYNCMODULES_EXPORT ModuleRegistry
{
  public:
    /**
     * @brief Builds a module through @p factory and stores it under @p name.
     * @throws std::invalid_argument if @p name is empty.
     * @throws std::runtime_error if the factory returns null.
     */
    ModulePtr register_module(const std::string &name, const ModuleFactory &factory,
                              const FunctionReferences &refs);

    /** @brief false for unknown names, otherwise the module's own readiness. */
    [[nodiscard]] bool is_ready(const std::string &name) const;

    /** @brief The module registered as @p name, or nullptr. */
    [[nodiscard]] ModulePtr lookup(const std::string &name) const;

    [[nodiscard]] bool contains(const std::string &name) const;
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] std::vector<std::string> names() const;

    /** @brief Modules in registration order; stable if the registry changes meanwhile. */
    [[nodiscard]] std::vector<ModulePtr> snapshot() const;

  private:
    std::vector<std::pair<std::string, ModulePtr>> entries_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace asyncmodules::core

#if defined(_MSC_VER)
#pragma warning(pop)
#endif
