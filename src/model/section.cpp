#include "nhdsync/model/section.hpp"

namespace nhdsync {

std::string_view to_string(Section section) {
    switch (section) {
        case Section::Device:
            return "device";
        case Section::DeviceStatus:
            return "device_status";
        case Section::MatrixAssignment:
            return "matrix_assignment";
    }
    return "unknown";
}

std::optional<Section> parse_section(std::string_view name) {
    for (auto section : kAllSections) {
        if (to_string(section) == name) {
            return section;
        }
    }
    return std::nullopt;
}

SectionSet::SectionSet(std::initializer_list<Section> sections) {
    for (auto section : sections) {
        insert(section);
    }
}

SectionSet SectionSet::all() {
    return SectionSet{Section::Device, Section::DeviceStatus, Section::MatrixAssignment};
}

std::size_t SectionSet::size() const {
    std::size_t count = 0;
    for (auto section : kAllSections) {
        if (contains(section)) {
            ++count;
        }
    }
    return count;
}

std::vector<Section> SectionSet::to_vector() const {
    std::vector<Section> out;
    out.reserve(kSectionCount);
    for (auto section : kAllSections) {
        if (contains(section)) {
            out.push_back(section);
        }
    }
    return out;
}

std::string to_string(const SectionSet& sections) {
    std::string out;
    for (auto section : sections.to_vector()) {
        if (!out.empty()) {
            out += ',';
        }
        out += to_string(section);
    }
    return out.empty() ? std::string("none") : out;
}

}  // namespace nhdsync
