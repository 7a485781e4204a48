/**
 * @file subroutines.hpp
 * @brief Catalog of the runtime routines linked into every ROM
 *
 * Each entry builds a fresh Block whose label is the routine name. Entries
 * are kept in canonical layout order: startup code, NMI/IRQ handlers and
 * the library body first, then the user program, then the C runtime
 * helpers, the user data and the destructor table.
 */

#pragma once

#include "block.hpp"
#include <cstdint>
#include <set>
#include <string>
#include <vector>

enum class Section {
    Startup,    // reset path, interrupt handlers, resident library
    Runtime,    // stack helpers and optional routines placed after main
    Trailer     // placed after user data
};

// Values baked into routines that depend on the translated program.
struct RuntimeParams {
    uint8_t localBytes = 0;   // bytes of user locals cleared by zerobss
};

struct Subroutine {
    std::string name;
    Section section;
    bool optional;                          // linked only when called
    std::vector<std::string> dependencies;  // called, jumped to or fallen into
    Block (*build)(const RuntimeParams&);
};

class SubroutineCatalog {
    std::vector<Subroutine> routines;

    SubroutineCatalog();

public:
    static const SubroutineCatalog& standard();

    const Subroutine* find(const std::string& name) const;

    // Throws NotFound.
    const Subroutine& lookup(const std::string& name) const;

    Block build(const std::string& name, const RuntimeParams& params = {}) const;

    /**
     * Every routine the program needs: all non-optional entries plus
     * @p used and everything reachable from them through dependencies.
     * @throws NotFound if a name in @p used is not in the catalog
     */
    std::set<std::string> closure(const std::set<std::string>& used) const;

    // Entries of one section that are in @p included, in canonical order.
    std::vector<const Subroutine*> layout(Section section, const std::set<std::string>& included) const;

    const std::vector<Subroutine>& entries() const { return routines; }
};
