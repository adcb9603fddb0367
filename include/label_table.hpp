/**
 * label_table.hpp
 *
 * Symbol table built during assembler pass 1.
 * Maps label names to instruction indices.
 */

#ifndef LABEL_TABLE_HPP
#define LABEL_TABLE_HPP

#include "common.hpp"

class LabelTable {
public:
    // Throws DuplicateLabelError if name is already defined
    void define(const std::string& name, Address address);

    // Throws UndefinedLabelError if name is not defined
    Address resolve(const std::string& name) const;

    bool contains(const std::string& name) const;
    size_t size() const;
    void clear();

    const std::map<std::string, Address>& get_all() const;

private:
    std::map<std::string, Address> labels;
};

#endif // LABEL_TABLE_HPP
