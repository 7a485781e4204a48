#include "label_table.hpp"
#include "errors.hpp"

void LabelTable::define(const std::string& name, uint16_t address)
{
    auto [it, inserted] = labels.emplace(name, address);
    if (!inserted) {
        throw DuplicateLabel(name);
    }
}

std::optional<uint16_t> LabelTable::tryResolve(const std::string& name) const
{
    auto it = labels.find(qualify(name, scope));
    if (it == labels.end()) {
        return std::nullopt;
    }
    return it->second;
}

uint16_t LabelTable::resolve(const std::string& name) const
{
    auto address = tryResolve(name);
    if (!address) {
        throw UnresolvedLabel(qualify(name, scope));
    }
    return *address;
}
