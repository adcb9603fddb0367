/**
 * label_table.cpp
 */

#include "label_table.hpp"
#include "errors.hpp"

void LabelTable::define(const std::string& name, Address address) {
    if (!labels.emplace(name, address).second) {
        throw DuplicateLabelError("duplicate label '" + name + "'");
    }
}

Address LabelTable::resolve(const std::string& name) const {
    auto it = labels.find(name);
    if (it == labels.end()) {
        throw UndefinedLabelError("undefined label '" + name + "'");
    }
    return it->second;
}

bool LabelTable::contains(const std::string& name) const {
    return labels.count(name) != 0;
}

size_t LabelTable::size() const {
    return labels.size();
}

void LabelTable::clear() {
    labels.clear();
}

const std::map<std::string, Address>& LabelTable::get_all() const {
    return labels;
}
