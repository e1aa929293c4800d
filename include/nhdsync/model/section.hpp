#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nhdsync {

// Independently refreshable and versioned parts of the snapshot.
enum class Section : std::uint8_t {
    Device = 0,
    DeviceStatus = 1,
    MatrixAssignment = 2,
};

inline constexpr std::size_t kSectionCount = 3;

inline constexpr std::array<Section, kSectionCount> kAllSections{
    Section::Device,
    Section::DeviceStatus,
    Section::MatrixAssignment,
};

constexpr std::size_t section_index(Section section) {
    return static_cast<std::size_t>(section);
}

std::string_view to_string(Section section);
std::optional<Section> parse_section(std::string_view name);

class SectionSet {
public:
    SectionSet() = default;
    SectionSet(std::initializer_list<Section> sections);

    static SectionSet all();

    void insert(Section section) { bits_ |= mask(section); }
    void merge(const SectionSet& other) { bits_ |= other.bits_; }
    void clear() { bits_ = 0; }

    bool contains(Section section) const { return (bits_ & mask(section)) != 0; }
    bool empty() const { return bits_ == 0; }
    std::size_t size() const;

    // Sections in refresh order: descriptors first so that status fetches see
    // the current device list.
    std::vector<Section> to_vector() const;

    bool operator==(const SectionSet& other) const = default;

private:
    static constexpr std::uint8_t mask(Section section) {
        return static_cast<std::uint8_t>(1u << static_cast<unsigned>(section));
    }

    std::uint8_t bits_{0};
};

std::string to_string(const SectionSet& sections);

}  // namespace nhdsync
