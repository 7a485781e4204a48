#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Symbol table mapping label names to resolved addresses.
// Labels beginning with '@' are local to the block that defines them and are
// stored as "<block>:@name"; lookups qualify them with the current scope.
class LabelTable {
    std::map<std::string, uint16_t> labels;
    std::optional<std::string> scope;

public:
    // Throws DuplicateLabel if the name is already bound.
    void define(const std::string& name, uint16_t address);

    std::optional<uint16_t> tryResolve(const std::string& name) const;

    // Throws UnresolvedLabel.
    uint16_t resolve(const std::string& name) const;

    bool isDefined(const std::string& name) const { return tryResolve(name).has_value(); }

    void clear() { labels.clear(); scope.reset(); }
    size_t size() const { return labels.size(); }

    void setScope(std::optional<std::string> blockLabel) { scope = std::move(blockLabel); }

    const std::map<std::string, uint16_t>& entries() const { return labels; }

    static std::string qualify(const std::string& name, const std::optional<std::string>& blockLabel) {
        if (!name.empty() && name[0] == '@' && blockLabel) {
            return *blockLabel + ":" + name;
        }
        return name;
    }
};
