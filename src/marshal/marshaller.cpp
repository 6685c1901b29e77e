#include "marshal/marshaller.hpp"

namespace cfgstore::marshal {

MarshallerList known() {
    return {toml(), json(), yaml(), msgpack()};
}

MarshallerPtr by_file_extension(const MarshallerList& list, std::string_view path) {
    for (const auto& m : list) {
        if (!m) {
            continue;
        }
        const auto ext = m->extension();
        if (path.size() > ext.size() &&
            path[path.size() - ext.size() - 1] == '.' &&
            path.substr(path.size() - ext.size()) == ext) {
            return m;
        }
    }
    return nullptr;
}

MarshallerPtr by_name(std::string_view name) {
    for (auto& m : known()) {
        if (m->name() == name) {
            return m;
        }
    }
    return nullptr;
}

std::string known_names() {
    std::string out;
    for (const auto& m : known()) {
        if (!out.empty()) {
            out += ", ";
        }
        out += m->name();
    }
    return out;
}

} // namespace cfgstore::marshal
