#include "amod_core.hpp"

#include <stdexcept>

namespace asyncmodules::core
{

ModulePtr ModuleRegistry::register_module(const std::string &name, const ModuleFactory &factory,
                                          const FunctionReferences &refs)
{
    if (name.empty())
    {
        throw std::invalid_argument("Module name must not be empty");
    }
    ModulePtr module = factory(name, refs);
    if (!module)
    {
        throw std::runtime_error(fmt::format("Factory for module [{}] returned no module", name));
    }

    auto it = index_.find(name);
    if (it != index_.end())
    {
        LOGGER_DEBUG("Replacing module [{}]", name);
        entries_[it->second].second = module;
    }
    else
    {
        index_.emplace(name, entries_.size());
        entries_.emplace_back(name, module);
        LOGGER_DEBUG("Registered module [{}]", name);
    }
    return module;
}

bool ModuleRegistry::is_ready(const std::string &name) const
{
    auto module = lookup(name);
    return module != nullptr && module->is_ready();
}

ModulePtr ModuleRegistry::lookup(const std::string &name) const
{
    auto it = index_.find(name);
    return it == index_.end() ? nullptr : entries_[it->second].second;
}

bool ModuleRegistry::contains(const std::string &name) const
{
    return index_.count(name) != 0;
}

std::vector<std::string> ModuleRegistry::names() const
{
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto &entry : entries_)
    {
        out.push_back(entry.first);
    }
    return out;
}

std::vector<ModulePtr> ModuleRegistry::snapshot() const
{
    std::vector<ModulePtr> out;
    out.reserve(entries_.size());
    for (const auto &entry : entries_)
    {
        out.push_back(entry.second);
    }
    return out;
}

} // namespace asyncmodules::core
