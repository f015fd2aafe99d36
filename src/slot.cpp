/**
 * @file slot.cpp
 * @brief FieldMap registration and lookup.
 */

#include <nbt/slot.hpp>

namespace nbt {

FieldMap& FieldMap::bind_slot(std::string_view name, const Slot& slot) {
    auto [it, inserted] = slots_.emplace(std::string(name), slot);
    if (!inserted && duplicate_.empty()) {
        duplicate_ = it->first;
    }
    return *this;
}

const Slot* FieldMap::find(std::string_view name) const {
    auto it = slots_.find(name);
    if (it == slots_.end()) {
        return nullptr;
    }
    return &it->second;
}

} // namespace nbt
